#include "lua_sous.h"

#include "sol_util.h"
#include "tui.h"
#include "value.h"

extern "C" {
#include "lauxlib.h"
#include "lua.h"
}

#include "nlohmann/json.hpp"

#include <sstream>
#include <string>

namespace sous {
namespace {

constexpr char kSousTemplateLua[] = R"lua(
return function(str, values)
  if type(str) ~= "string" then
    error("sous.template: first argument must be a string", 2)
  end
  if type(values) ~= "table" then
    error("sous.template: second argument must be a table", 2)
  end

  local function normalize_key(raw)
    local trimmed = raw:match("^%s*(.-)%s*$")
    if not trimmed or trimmed == "" then
      error("sous.template: placeholder cannot be empty", 2)
    end
    if not trimmed:match("^[%a_][%w_%.]*$") then
      error("sous.template: placeholder '" .. trimmed .. "' contains invalid characters", 2)
    end
    return trimmed
  end

  local function lookup(key)
    local value = values[key]
    if value ~= nil then return value end
    value = values
    for part in key:gmatch("[^%.]+") do
      if type(value) ~= "table" then return nil end
      value = value[part]
    end
    return value
  end

  local open_count = 0
  local i = 1
  while i <= #str do
    local pair = str:sub(i, i + 1)
    if pair == "{{" then
      open_count = open_count + 1
      i = i + 2
    elseif pair == "}}" then
      open_count = open_count - 1
      if open_count < 0 then
        error("sous.template: unmatched '}}' at position " .. i, 2)
      end
      i = i + 2
    else
      i = i + 1
    end
  end
  if open_count > 0 then
    error("sous.template: unmatched '{{' (missing closing '}}')", 2)
  end

  return (str:gsub("{{(.-)}}", function(token)
    local key = normalize_key(token)
    local value = lookup(key)
    if value == nil then
      error("sous.template: missing value for placeholder '" .. key .. "'", 2)
    end
    return tostring(value)
  end))
end
)lua";

}  // namespace

void lua_sous_install(sol::state &lua) {
  char const *platform{ "unknown" };
  char const *arch{ "unknown" };

#if defined(__APPLE__) && defined(__MACH__)
  platform = "darwin";
#if defined(__arm64__)
  arch = "arm64";
#elif defined(__x86_64__)
  arch = "x86_64";
#endif
#elif defined(__linux__)
  platform = "linux";
#if defined(__aarch64__)
  arch = "aarch64";
#elif defined(__x86_64__)
  arch = "x86_64";
#endif
#elif defined(_WIN32)
  platform = "windows";
#if defined(_M_ARM64)
  arch = "arm64";
#elif defined(_M_X64)
  arch = "x86_64";
#endif
#endif

  lua["SOUS_PLATFORM"] = platform;
  lua["SOUS_ARCH"] = arch;
  lua["SOUS_PLATFORM_ARCH"] = std::string{ platform } + "-" + arch;

  // Override print to route through TUI
  lua["print"] = [](sol::variadic_args va) {
    std::ostringstream oss;
    bool first{ true };
    for (auto arg : va) {
      if (!first) oss << '\t';
      oss << luaL_tolstring(arg.lua_state(), arg.stack_index(), nullptr);
      lua_pop(arg.lua_state(), 1);  // Pop result from luaL_tolstring
      first = false;
    }
    tui::info("%s", oss.str().c_str());
  };

  auto sous_table{ lua.create_table() };
  sous_table["debug"] = [](std::string const &msg) { tui::debug("%s", msg.c_str()); };
  sous_table["info"] = [](std::string const &msg) { tui::info("%s", msg.c_str()); };
  sous_table["warn"] = [](std::string const &msg) { tui::warn("%s", msg.c_str()); };
  sous_table["error"] = [](std::string const &msg) { tui::error("%s", msg.c_str()); };
  sous_table["stdout"] = [](std::string const &msg) {
    tui::print_stdout("%s", msg.c_str());
  };

  sous_table["json_encode"] = [](sol::object obj) {
    return value_to_json_text(value_from_lua(obj));
  };
  sous_table["json_decode"] = [](std::string const &text, sol::this_state L) {
    auto const parsed = nlohmann::json::parse(text);
    return value_to_lua(sol::state_view{ L }, value_from_json(parsed));
  };

  sol::protected_function_result result{ lua.safe_script(kSousTemplateLua,
                                                         sol::script_pass_on_error) };
  if (result.valid()) {
    sous_table["template"] = result;
  } else {
    sol::error err = result;
    tui::error("Failed to load sous.template: %s", err.what());
  }

  lua["sous"] = sous_table;
}

}  // namespace sous
