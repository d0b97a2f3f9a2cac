#pragma once

#include "cancel_token.h"
#include "context.h"
#include "recipe_spec.h"
#include "result.h"
#include "step_resolver.h"
#include "util.h"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sous {

enum class execution_mode {
  sequential,           // idx order, one step at a time
  dependency_parallel,  // depends_on edges schedule steps on a TBB flow graph
};

char const *execution_mode_name(execution_mode mode);
execution_mode execution_mode_parse(std::string_view name);

struct execution_options {
  std::vector<std::string> only;  // non-empty: every other step is skipped
  std::vector<std::string> skip;  // wins over `only`
  bool continue_on_error{ false };
  std::optional<double> default_timeout;
  int max_retries{ 0 };
  double retry_delay{ 1.0 };
  execution_mode mode{ execution_mode::sequential };
  int max_parallel{ 0 };  // dependency_parallel only; 0 lets TBB decide
  bool retry_resolution_failures{ false };
};

// Shared between the coordinator and one attempt's worker thread.
struct attempt_slot {
  std::mutex mutex;
  std::condition_variable cv;
  bool done{ false };
  step_outcome outcome;
};

// Attempts that missed their deadline keep running on detached threads until their
// callable returns. The runner keeps their slots so callers can wait them out before
// tearing the process down.
class abandoned_attempts : unmovable {
 public:
  void add(std::shared_ptr<attempt_slot> slot);

  // Waits up to `limit` for every abandoned attempt; returns how many are still running.
  std::size_t wait_for(std::chrono::duration<double> limit);

  std::size_t running() const;

 private:
  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<attempt_slot>> slots_;
};

struct execution_statistics {
  std::size_t total_runs;
  std::size_t total_steps_executed;
  std::size_t history_size;
  std::size_t history_capacity;
  std::size_t active_runs;
  bool cancellation_requested;
  std::optional<double> default_timeout;
  std::size_t abandoned_attempts_running;
};

class runner : unmovable {
 public:
  explicit runner(std::shared_ptr<step_resolver const> resolver,
                  std::optional<double> default_timeout = std::nullopt,
                  std::size_t history_capacity = 100);

  // Executes a validated recipe against `ctx`. Throws invalid_recipe_error (before
  // touching `ctx`) when the recipe carries ERROR messages. Step failures never
  // throw; they are reported in the returned result.
  recipe_execution_result run(recipe_spec const &spec,
                              std::shared_ptr<context> ctx,
                              execution_options const &options = {});

  // Safe from any thread. Gates steps and retries that have not started yet and
  // cancels the tokens handed to in-flight steps.
  void cancel();

  execution_statistics stats() const;

  // Most recent runs, oldest first. `limit` keeps only the newest entries.
  std::vector<recipe_execution_result> history(
      std::optional<std::size_t> limit = std::nullopt) const;
  std::size_t clear_history();

  // Bounded wait for attempts abandoned by timeouts; returns how many still run.
  std::size_t wait_for_abandoned(std::chrono::duration<double> limit);

 private:
  void record(recipe_execution_result const &result);

  std::shared_ptr<step_resolver const> resolver_;
  std::optional<double> default_timeout_;
  std::size_t history_capacity_;

  mutable std::mutex active_mutex_;
  std::vector<std::shared_ptr<cancel_token>> active_;
  bool cancellation_requested_{ false };

  mutable std::mutex history_mutex_;
  std::deque<recipe_execution_result> history_;
  std::size_t total_runs_{ 0 };
  std::size_t total_steps_executed_{ 0 };

  abandoned_attempts abandoned_;
};

}  // namespace sous
