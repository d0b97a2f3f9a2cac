#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace sous {

struct validation_message;

// Raw recipe data is not shaped like a recipe at all (not a table, steps not an array).
class malformed_input_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// run() was handed a recipe with ERROR-severity validation messages.
class invalid_recipe_error : public std::runtime_error {
 public:
  invalid_recipe_error(std::string const &recipe_name,
                       std::vector<validation_message> messages);

  std::vector<validation_message> const &messages() const { return messages_; }

 private:
  std::vector<validation_message> messages_;
};

class step_resolution_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class step_timeout_error : public std::runtime_error {
 public:
  step_timeout_error(std::string const &step_name, double timeout_seconds);

  double timeout_seconds() const { return timeout_seconds_; }

 private:
  double timeout_seconds_;
};

// Wraps whatever a step callable threw or reported.
class step_execution_error : public std::runtime_error {
 public:
  step_execution_error(std::string const &step_name, std::string const &cause);

  std::string const &cause() const { return cause_; }

 private:
  std::string cause_;
};

}  // namespace sous
