#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace sous::platform {

bool is_tty();

std::filesystem::path get_exe_path();

std::optional<std::string> get_env_var(char const *name);

}  // namespace sous::platform
