#pragma once

#include "value.h"

#include <filesystem>

namespace sous {

// Reads a recipe file into raw recipe data. ".lua" chunks must return a table,
// ".json" files are parsed as JSON. Throws std::runtime_error naming the path.
value recipe_load(std::filesystem::path const &path);

}  // namespace sous
