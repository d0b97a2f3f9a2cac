#include "step_resolver.h"

#include "errors.h"
#include "tui.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>

namespace sous {

void registry_resolver::add(std::string module_ref, std::string function_ref, step_fn fn) {
  if (!fn) {
    throw std::invalid_argument("registry_resolver::add: empty callable for " + module_ref +
                                "." + function_ref);
  }
  steps_[{ std::move(module_ref), std::move(function_ref) }] = std::move(fn);
}

bool registry_resolver::contains(std::string const &module_ref,
                                 std::string const &function_ref) const {
  return steps_.contains({ module_ref, function_ref });
}

step_fn registry_resolver::resolve(std::string const &module_ref,
                                   std::string const &function_ref) const {
  auto const it{ steps_.find({ module_ref, function_ref }) };
  if (it == steps_.end()) {
    throw step_resolution_error("no step registered as " + module_ref + "." +
                                function_ref);
  }
  return it->second;
}

void chain_resolver::add(std::shared_ptr<step_resolver const> resolver) {
  resolvers_.push_back(std::move(resolver));
}

step_fn chain_resolver::resolve(std::string const &module_ref,
                                std::string const &function_ref) const {
  std::string reasons;
  for (auto const &resolver : resolvers_) {
    try {
      return resolver->resolve(module_ref, function_ref);
    } catch (step_resolution_error const &e) {
      if (!reasons.empty()) { reasons += "; "; }
      reasons += e.what();
    }
  }

  if (reasons.empty()) { reasons = "no resolvers configured"; }
  throw step_resolution_error("cannot resolve " + module_ref + "." + function_ref + ": " +
                              reasons);
}

namespace {

std::string arg_string(value_table const &args, char const *key, std::string fallback) {
  auto const it{ args.find(key) };
  if (it == args.end() || it->second.is_nil()) { return fallback; }
  if (auto const *s{ it->second.get<std::string>() }) { return *s; }
  return value_to_display(it->second);
}

step_outcome builtin_set(step_call &call) {
  for (auto const &[key, val] : call.args) { call.set(key, val); }
  return step_outcome::ok(static_cast<std::int64_t>(call.args.size()));
}

step_outcome builtin_log(step_call &call) {
  auto const message{ arg_string(call.args, "message", "") };
  auto const level{ arg_string(call.args, "level", "info") };

  if (level == "debug") {
    tui::debug("[%s] %s", call.step.c_str(), message.c_str());
  } else if (level == "info") {
    tui::info("[%s] %s", call.step.c_str(), message.c_str());
  } else if (level == "warn" || level == "warning") {
    tui::warn("[%s] %s", call.step.c_str(), message.c_str());
  } else if (level == "error") {
    tui::error("[%s] %s", call.step.c_str(), message.c_str());
  } else {
    return step_outcome::failure("builtin.log: unknown level '" + level + "'");
  }
  return step_outcome::ok(message);
}

step_outcome builtin_sleep(step_call &call) {
  auto const it{ call.args.find("seconds") };
  auto const seconds{ it == call.args.end() ? std::optional<double>{ 0.0 }
                                            : it->second.as_number() };
  if (!seconds || *seconds < 0.0) {
    return step_outcome::failure("builtin.sleep: seconds must be a non-negative number");
  }

  if (!call.token.wait_for(std::chrono::duration<double>(*seconds))) {
    return step_outcome::failure("builtin.sleep: cancelled");
  }
  return step_outcome::ok(*seconds);
}

step_outcome builtin_fail(step_call &call) {
  return step_outcome::failure(arg_string(call.args, "message", "builtin.fail"));
}

}  // namespace

void builtin_steps_install(registry_resolver &registry) {
  registry.add("builtin", "set", builtin_set);
  registry.add("builtin", "log", builtin_log);
  registry.add("builtin", "sleep", builtin_sleep);
  registry.add("builtin", "fail", builtin_fail);
}

}  // namespace sous
