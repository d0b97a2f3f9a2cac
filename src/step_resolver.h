#pragma once

#include "cancel_token.h"
#include "context.h"
#include "value.h"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace sous {

// Everything a step callable sees during one attempt.
struct step_call {
  context &ctx;
  value_table const &args;
  std::string const &step;
  int attempt;  // 1-based
  cancel_token const &token;

  value get(std::string const &key, value default_value = {}) const {
    return ctx.get(key, std::move(default_value));
  }

  // Context write attributed to this step.
  void set(std::string const &key, value val) const { ctx.set(key, std::move(val), step); }

  bool cancelled() const { return token.cancelled(); }
};

struct step_outcome {
  bool success{ true };
  value output;
  std::string error;

  static step_outcome ok(value output = {}) {
    return step_outcome{ .success = true, .output = std::move(output), .error = {} };
  }

  static step_outcome failure(std::string error) {
    return step_outcome{ .success = false, .output = {}, .error = std::move(error) };
  }
};

// Callables report failure by returning a failed outcome or by throwing.
using step_fn = std::function<step_outcome(step_call &)>;

class step_resolver {
 public:
  virtual ~step_resolver() = default;

  // Throws step_resolution_error when the reference names nothing callable.
  virtual step_fn resolve(std::string const &module_ref,
                          std::string const &function_ref) const = 0;
};

class registry_resolver : public step_resolver {
 public:
  void add(std::string module_ref, std::string function_ref, step_fn fn);
  bool contains(std::string const &module_ref, std::string const &function_ref) const;

  step_fn resolve(std::string const &module_ref,
                  std::string const &function_ref) const override;

 private:
  std::map<std::pair<std::string, std::string>, step_fn> steps_;
};

// Tries each resolver in order; the first that resolves wins.
class chain_resolver : public step_resolver {
 public:
  void add(std::shared_ptr<step_resolver const> resolver);

  step_fn resolve(std::string const &module_ref,
                  std::string const &function_ref) const override;

 private:
  std::vector<std::shared_ptr<step_resolver const>> resolvers_;
};

// Registers module "builtin": set, log, sleep, fail.
void builtin_steps_install(registry_resolver &registry);

}  // namespace sous
