#include "value.h"

#include "util.h"

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace sous {

value::value() = default;
value::value(value_variant var) : v{ std::move(var) } {}
value::value(bool b) : v{ b } {}
value::value(int i) : v{ static_cast<std::int64_t>(i) } {}
value::value(std::int64_t i) : v{ i } {}
value::value(double d) : v{ d } {}
value::value(char const *s) : v{ std::string{ s } } {}
value::value(std::string s) : v{ std::move(s) } {}
value::value(value_array a) : v{ std::move(a) } {}
value::value(value_table t) : v{ std::move(t) } {}

bool value::is_nil() const { return std::holds_alternative<std::monostate>(v); }
bool value::is_bool() const { return std::holds_alternative<bool>(v); }
bool value::is_integer() const { return std::holds_alternative<std::int64_t>(v); }
bool value::is_number() const {
  return std::holds_alternative<std::int64_t>(v) || std::holds_alternative<double>(v);
}
bool value::is_string() const { return std::holds_alternative<std::string>(v); }
bool value::is_array() const { return std::holds_alternative<value_array>(v); }
bool value::is_table() const { return std::holds_alternative<value_table>(v); }

std::optional<double> value::as_number() const {
  if (auto const *i{ get<std::int64_t>() }) { return static_cast<double>(*i); }
  if (auto const *d{ get<double>() }) { return *d; }
  return std::nullopt;
}

char const *value::type_name() const {
  return std::visit(match{
                        [](std::monostate) { return "nil"; },
                        [](bool) { return "boolean"; },
                        [](std::int64_t) { return "integer"; },
                        [](double) { return "number"; },
                        [](std::string const &) { return "string"; },
                        [](value_array const &) { return "array"; },
                        [](value_table const &) { return "table"; },
                    },
                    v);
}

bool operator==(value const &lhs, value const &rhs) { return lhs.v == rhs.v; }

nlohmann::json value_to_json(value const &val) {
  return std::visit(match{
                        [](std::monostate) -> nlohmann::json { return nullptr; },
                        [](bool b) -> nlohmann::json { return b; },
                        [](std::int64_t i) -> nlohmann::json { return i; },
                        [](double d) -> nlohmann::json { return d; },
                        [](std::string const &s) -> nlohmann::json { return s; },
                        [](value_array const &a) -> nlohmann::json {
                          auto out = nlohmann::json::array();
                          for (auto const &item : a) { out.push_back(value_to_json(item)); }
                          return out;
                        },
                        [](value_table const &t) -> nlohmann::json {
                          auto out = nlohmann::json::object();
                          for (auto const &[k, item] : t) { out[k] = value_to_json(item); }
                          return out;
                        },
                    },
                    val.v);
}

value value_from_json(nlohmann::json const &json) {
  switch (json.type()) {
    case nlohmann::json::value_t::null:
    case nlohmann::json::value_t::discarded: return value{};
    case nlohmann::json::value_t::boolean: return value{ json.get<bool>() };
    case nlohmann::json::value_t::number_integer:
      return value{ json.get<std::int64_t>() };
    case nlohmann::json::value_t::number_unsigned: {
      auto const u{ json.get<std::uint64_t>() };
      if (u <= static_cast<std::uint64_t>(INT64_MAX)) {
        return value{ static_cast<std::int64_t>(u) };
      }
      return value{ static_cast<double>(u) };
    }
    case nlohmann::json::value_t::number_float: return value{ json.get<double>() };
    case nlohmann::json::value_t::string: return value{ json.get<std::string>() };
    case nlohmann::json::value_t::array: {
      value_array out;
      out.reserve(json.size());
      for (auto const &item : json) { out.push_back(value_from_json(item)); }
      return value{ std::move(out) };
    }
    case nlohmann::json::value_t::object: {
      value_table out;
      for (auto const &[k, item] : json.items()) { out.emplace(k, value_from_json(item)); }
      return value{ std::move(out) };
    }
    case nlohmann::json::value_t::binary:
      throw std::runtime_error("value_from_json: binary JSON values are not supported");
  }
  return value{};
}

std::string value_to_display(value const &val, std::size_t max_length) {
  std::string text{ value_to_json_text(val) };
  if (max_length > 3 && text.size() > max_length) {
    text.resize(max_length - 3);
    text.append("...");
  }
  return text;
}

std::string value_to_json_text(value const &val, int indent) {
  return json_dump(value_to_json(val), indent);
}

std::string value_to_canonical_json(value const &val) {
  // nlohmann::json objects are std::map backed, so keys serialize sorted.
  return value_to_json_text(val);
}

std::string json_dump(nlohmann::json const &json, int indent) {
  return json.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace sous
