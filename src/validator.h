#pragma once

#include "recipe_spec.h"
#include "value.h"

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace sous {

class step_resolver;

// Turns a raw recipe table into a recipe_spec. Problems become validation messages;
// only structurally unusable input (not a table, steps not an array) throws
// malformed_input_error.
class validator {
 public:
  using check_fn = std::function<std::vector<validation_message>(value_table const &raw)>;

  // With a resolver, unresolvable callables are reported as warnings.
  explicit validator(step_resolver const *resolver = nullptr);

  // Custom checks run after the built-in ones, in registration order. A check that
  // throws produces a VALIDATOR_ERROR message instead of aborting validation.
  void add_check(std::string name, check_fn check);

  recipe_spec validate(value const &raw) const;

 private:
  step_resolver const *resolver_;
  std::vector<std::pair<std::string, check_fn>> checks_;
};

recipe_spec validate_recipe(value const &raw, step_resolver const *resolver = nullptr);

}  // namespace sous
