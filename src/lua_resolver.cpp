#include "lua_resolver.h"

#include "errors.h"
#include "lua_sous.h"
#include "sol_util.h"
#include "tui.h"
#include "util.h"

#include <memory>
#include <optional>
#include <utility>

namespace sous {

namespace {

struct lua_module {
  std::filesystem::path path;
  std::string source;
};

// Runs the module chunk in `lua` and returns the named function. Throws
// std::runtime_error when loading fails or the name is not a function.
sol::protected_function load_step_function(sol::state &lua,
                                           lua_module const &module,
                                           std::string const &function_ref) {
  auto result{ lua.safe_script(module.source,
                               sol::script_pass_on_error,
                               "@" + module.path.string()) };
  if (!result.valid()) {
    sol::error err = result;
    throw std::runtime_error(err.what());
  }

  std::string const where{ module.path.filename().string() };
  if (result.return_count() > 0) {
    sol::object const exported{ result.get<sol::object>() };
    if (exported.is<sol::table>()) {
      if (auto fn{ sol_util_get_optional<sol::protected_function>(exported.as<sol::table>(),
                                                                   function_ref,
                                                                   where) }) {
        return *fn;
      }
    }
  }

  sol::table globals{ lua.globals() };
  if (auto fn{ sol_util_get_optional<sol::protected_function>(globals,
                                                              function_ref,
                                                              where) }) {
    return *fn;
  }
  throw std::runtime_error(where + ": no function named '" + function_ref + "'");
}

sol::table make_ctx_table(sol::state &lua, step_call &call) {
  auto ctx{ lua.create_table() };
  ctx["step"] = call.step;
  ctx["attempt"] = call.attempt;

  ctx["get"] = [&call](sol::table,
                       std::string const &key,
                       sol::optional<sol::object> fallback,
                       sol::this_state L) -> sol::object {
    auto val{ call.get(key) };
    if (val.is_nil() && fallback) { return *fallback; }
    return value_to_lua(sol::state_view{ L }, val);
  };
  ctx["set"] = [&call](sol::table, std::string const &key, sol::object obj) {
    call.set(key, value_from_lua(obj));
  };
  ctx["cancelled"] = [&call](sol::table) { return call.cancelled(); };
  return ctx;
}

step_outcome run_attempt(lua_module const &module,
                         std::string const &function_ref,
                         step_call &call) {
  auto lua{ sol_util_make_lua_state() };
  lua_sous_install(*lua);

  auto fn{ load_step_function(*lua, module, function_ref) };
  auto ctx{ make_ctx_table(*lua, call) };
  auto args{ value_to_lua(*lua, value{ call.args }) };

  sol::protected_function_result result{ fn(ctx, args) };
  if (!result.valid()) {
    sol::error err = result;
    return step_outcome::failure(err.what());
  }

  if (result.return_count() == 0) { return step_outcome::ok(); }

  sol::object const first{ result.get<sol::object>(0) };
  if (first.get_type() == sol::type::boolean && !first.as<bool>()) {
    std::string message{ "step returned false" };
    if (result.return_count() > 1) {
      sol::object const detail{ result.get<sol::object>(1) };
      if (detail.is<std::string>()) { message = detail.as<std::string>(); }
    }
    return step_outcome::failure(message);
  }

  return step_outcome::ok(value_from_lua(first));
}

}  // namespace

lua_resolver::lua_resolver(std::filesystem::path base_dir) : base_dir_{ std::move(base_dir) } {}

step_fn lua_resolver::resolve(std::string const &module_ref,
                              std::string const &function_ref) const {
  std::filesystem::path const relative{ module_ref };
  if (relative.extension() != ".lua") {
    throw step_resolution_error("not a Lua module: " + module_ref);
  }

  auto module{ std::make_shared<lua_module>() };
  module->path = relative.is_absolute() ? relative : base_dir_ / relative;

  std::error_code ec;
  if (!std::filesystem::is_regular_file(module->path, ec)) {
    throw step_resolution_error("Lua module not found: " + module->path.string());
  }

  try {
    module->source = util_load_text_file(module->path);
    auto probe{ sol_util_make_lua_state() };
    lua_sous_install(*probe);
    (void)load_step_function(*probe, *module, function_ref);
  } catch (std::runtime_error const &e) {
    throw step_resolution_error("cannot resolve " + module_ref + "." + function_ref +
                                ": " + e.what());
  }

  tui::debug("lua_resolver: resolved %s.%s", module_ref.c_str(), function_ref.c_str());

  return [module, function_ref](step_call &call) {
    return run_attempt(*module, function_ref, call);
  };
}

}  // namespace sous
