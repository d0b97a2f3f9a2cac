#include "recipe_loader.h"

#include "lua_sous.h"
#include "sol_util.h"
#include "tui.h"
#include "util.h"

#include "nlohmann/json.hpp"

#include <stdexcept>
#include <string>

namespace sous {

namespace {

value load_lua_recipe(std::filesystem::path const &path, std::string const &source) {
  auto lua{ sol_util_make_lua_state() };
  lua_sous_install(*lua);

  auto result{ lua->safe_script(source, sol::script_pass_on_error, "@" + path.string()) };
  if (!result.valid()) {
    sol::error err = result;
    throw std::runtime_error("recipe_load: " + path.string() + ": " + err.what());
  }

  if (result.return_count() == 0 || result.get_type() != sol::type::table) {
    throw std::runtime_error("recipe_load: " + path.string() + ": chunk must return a table");
  }

  try {
    return value_from_lua(result.get<sol::object>());
  } catch (std::runtime_error const &e) {
    throw std::runtime_error("recipe_load: " + path.string() + ": " + e.what());
  }
}

value load_json_recipe(std::filesystem::path const &path, std::string const &source) {
  try {
    return value_from_json(nlohmann::json::parse(source));
  } catch (nlohmann::json::exception const &e) {
    throw std::runtime_error("recipe_load: " + path.string() + ": " + e.what());
  }
}

}  // namespace

value recipe_load(std::filesystem::path const &path) {
  auto const ext{ path.extension().string() };
  if (ext != ".lua" && ext != ".json") {
    throw std::runtime_error("recipe_load: unsupported recipe format '" + ext + "' for " +
                             path.string() + " (expected .lua or .json)");
  }

  auto const source{ util_load_text_file(path) };
  tui::debug("recipe_load: %s (%zu bytes)", path.string().c_str(), source.size());

  return ext == ".lua" ? load_lua_recipe(path, source) : load_json_recipe(path, source);
}

}  // namespace sous
