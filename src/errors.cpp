#include "errors.h"

#include "recipe_spec.h"

#include <cstdio>

namespace sous {

namespace {

std::string describe_invalid(std::string const &recipe_name,
                             std::vector<validation_message> const &messages) {
  std::string text{ "recipe '" + recipe_name + "' failed validation" };
  for (auto const &msg : messages) {
    if (msg.severity == validation_severity::error) { text += "\n  " + msg.to_string(); }
  }
  return text;
}

std::string describe_timeout(std::string const &step_name, double timeout_seconds) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.3f", timeout_seconds);
  return "step '" + step_name + "' timed out after " + buf + "s";
}

}  // namespace

invalid_recipe_error::invalid_recipe_error(std::string const &recipe_name,
                                           std::vector<validation_message> messages)
    : std::runtime_error{ describe_invalid(recipe_name, messages) },
      messages_{ std::move(messages) } {}

step_timeout_error::step_timeout_error(std::string const &step_name,
                                       double timeout_seconds)
    : std::runtime_error{ describe_timeout(step_name, timeout_seconds) },
      timeout_seconds_{ timeout_seconds } {}

step_execution_error::step_execution_error(std::string const &step_name,
                                           std::string const &cause)
    : std::runtime_error{ "step '" + step_name + "' failed: " + cause },
      cause_{ cause } {}

}  // namespace sous
