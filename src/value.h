#pragma once

#include "nlohmann/json.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sous {

struct value;
using value_array = std::vector<value>;
using value_table = std::map<std::string, value>;

using value_variant = std::variant<std::monostate,
                                   bool,
                                   std::int64_t,
                                   double,
                                   std::string,
                                   value_array,
                                   value_table>;

// Dynamically-typed datum shared by recipes, step args, outputs and the context.
struct value {
  value_variant v;

  value();
  value(value_variant var);
  value(bool b);
  value(int i);
  value(std::int64_t i);
  value(double d);
  value(char const *s);
  value(std::string s);
  value(value_array a);
  value(value_table t);

  bool is_nil() const;
  bool is_bool() const;
  bool is_integer() const;
  bool is_number() const;  // integer or double
  bool is_string() const;
  bool is_array() const;
  bool is_table() const;

  template <typename T>
  T const *get() const {
    return std::get_if<T>(&v);
  }

  template <typename T>
  T *get() {
    return std::get_if<T>(&v);
  }

  // Integer or double widened to double; nullopt otherwise.
  std::optional<double> as_number() const;

  // "nil", "boolean", "integer", "number", "string", "array", "table"
  char const *type_name() const;

  friend bool operator==(value const &lhs, value const &rhs);
};

nlohmann::json value_to_json(value const &val);
value value_from_json(nlohmann::json const &json);

// JSON text; -1 indent is compact. Invalid UTF-8 is replaced, never thrown.
std::string json_dump(nlohmann::json const &json, int indent = -1);
std::string value_to_json_text(value const &val, int indent = -1);

// Compact single-line rendering for logs, strings are quoted.
std::string value_to_display(value const &val, std::size_t max_length = 120);

// Key-sorted JSON text used for hashing.
std::string value_to_canonical_json(value const &val);

}  // namespace sous
