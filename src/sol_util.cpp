#include "sol_util.h"

#include "util.h"

extern "C" {
#include "lua.h"
}

#include <cstdint>
#include <utility>
#include <vector>

namespace sous {

namespace {

constexpr int kMaxLuaDepth{ 64 };

value convert(sol::object const &obj, int depth);

value convert_table(sol::table const &table, int depth) {
  value_table named;
  std::vector<std::pair<std::int64_t, value>> indexed;

  for (auto const &[k, v] : table) {
    value converted{ convert(v, depth + 1) };
    if (k.get_type() == sol::type::string) {
      named.emplace(k.as<std::string>(), std::move(converted));
      continue;
    }

    auto const key{ convert(k, depth + 1) };
    auto const *i{ key.get<std::int64_t>() };
    if (!i) {
      throw std::runtime_error(std::string{ "value_from_lua: unsupported table key type '" } +
                               key.type_name() + "'");
    }
    indexed.emplace_back(*i, std::move(converted));
  }

  if (!indexed.empty() && !named.empty()) {
    throw std::runtime_error("value_from_lua: table mixes array and string keys");
  }
  if (indexed.empty()) { return named; }

  value_array arr(indexed.size());
  std::vector<bool> seen(indexed.size(), false);
  for (auto &[i, v] : indexed) {
    if (i < 1 || i > static_cast<std::int64_t>(indexed.size()) || seen[i - 1]) {
      throw std::runtime_error("value_from_lua: array table has holes or non-positive keys");
    }
    seen[i - 1] = true;
    arr[i - 1] = std::move(v);
  }
  return arr;
}

value convert(sol::object const &obj, int depth) {
  if (depth > kMaxLuaDepth) {
    throw std::runtime_error("value_from_lua: tables nested too deeply");
  }

  switch (obj.get_type()) {
    case sol::type::none:
    case sol::type::lua_nil: return value{};
    case sol::type::boolean: return value{ obj.as<bool>() };
    case sol::type::number: {
      lua_State *L{ obj.lua_state() };
      obj.push();
      value const result{ lua_isinteger(L, -1)
                              ? value{ static_cast<std::int64_t>(lua_tointeger(L, -1)) }
                              : value{ static_cast<double>(lua_tonumber(L, -1)) } };
      lua_pop(L, 1);
      return result;
    }
    case sol::type::string: return value{ obj.as<std::string>() };
    case sol::type::table: return convert_table(obj.as<sol::table>(), depth);
    default:
      throw std::runtime_error(std::string{ "value_from_lua: unsupported Lua type '" } +
                               sol::type_name(obj.lua_state(), obj.get_type()) + "'");
  }
}

}  // namespace

sol_state_ptr sol_util_make_lua_state() {
  auto lua{ std::make_unique<sol::state>() };
  lua->open_libraries(sol::lib::base,
                      sol::lib::package,
                      sol::lib::coroutine,
                      sol::lib::string,
                      sol::lib::os,
                      sol::lib::math,
                      sol::lib::table,
                      sol::lib::debug,
                      sol::lib::utf8);

  // Override error() and assert() to automatically include stack traces
  lua->script(R"lua(
do
  local orig_error = error
  local orig_assert = assert

  _G.error = function(message, level)
    level = (level or 1) + 1
    return orig_error(debug.traceback(tostring(message), level), 0)
  end

  _G.assert = function(condition, message, ...)
    if not condition then
      message = message or "assertion failed"
      return orig_assert(false, debug.traceback(tostring(message), 2))
    end
    return condition, message, ...
  end
end
)lua");

  return lua;
}

value value_from_lua(sol::object const &obj) { return convert(obj, 0); }

sol::object value_to_lua(sol::state_view lua, value const &val) {
  return std::visit(
      match{
          [&](std::monostate) -> sol::object { return sol::make_object(lua, sol::lua_nil); },
          [&](bool b) -> sol::object { return sol::make_object(lua, b); },
          [&](std::int64_t i) -> sol::object { return sol::make_object(lua, i); },
          [&](double d) -> sol::object { return sol::make_object(lua, d); },
          [&](std::string const &s) -> sol::object { return sol::make_object(lua, s); },
          [&](value_array const &arr) -> sol::object {
            sol::table t{ lua.create_table(static_cast<int>(arr.size()), 0) };
            for (std::size_t i{ 0 }; i < arr.size(); ++i) {
              t[i + 1] = value_to_lua(lua, arr[i]);
            }
            return t;
          },
          [&](value_table const &tbl) -> sol::object {
            sol::table t{ lua.create_table(0, static_cast<int>(tbl.size())) };
            for (auto const &[k, v] : tbl) { t[k] = value_to_lua(lua, v); }
            return t;
          },
      },
      val.v);
}

}  // namespace sous
