#pragma once

#include "recipe_spec.h"
#include "step_resolver.h"

#include <cstddef>
#include <filesystem>
#include <memory>

namespace sous {

struct loaded_recipe {
  recipe_spec spec;
  std::shared_ptr<step_resolver const> resolver;
};

// Steps resolve against the builtin module first, then Lua modules in `recipe_dir`.
std::shared_ptr<step_resolver const> make_default_resolver(
    std::filesystem::path const &recipe_dir);

// Loads and validates the recipe at `path`. Validation problems are reported in the
// returned spec; unreadable files throw.
loaded_recipe load_recipe_spec(std::filesystem::path const &path);

// Logs every validation message at its severity; returns the number of errors.
std::size_t report_validation(recipe_spec const &spec);

}  // namespace sous
