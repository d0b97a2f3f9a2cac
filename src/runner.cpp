#include "runner.h"

#include "errors.h"
#include "trace.h"
#include "tui.h"

#include "tbb/flow_graph.h"
#include "tbb/task_arena.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <set>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <utility>

namespace sous {

namespace {

constexpr char const *kRunnerWho{ "runner" };

using graph_node = tbb::flow::continue_node<tbb::flow::continue_msg>;

struct run_state {
  recipe_spec const &spec;
  std::shared_ptr<context> ctx;
  execution_options const &options;
  step_resolver const &resolver;
  std::optional<double> runner_timeout;
  std::shared_ptr<cancel_token> token;
  abandoned_attempts &abandoned;
  std::set<std::string> initial_keys;

  std::mutex mutex;  // guards everything below
  std::vector<step_execution_result> steps;  // parallel to spec.steps
  std::vector<std::string> global_errors;
  std::vector<std::string> global_warnings;
  std::atomic_bool halted{ false };
};

enum class attempt_kind { succeeded, failed, timed_out };

struct attempt_report {
  attempt_kind kind;
  value output;
  std::string error;
};

char const *attempt_kind_name(attempt_kind kind) {
  switch (kind) {
    case attempt_kind::succeeded: return "succeeded";
    case attempt_kind::failed: return "failed";
    case attempt_kind::timed_out: return "timed_out";
  }
  return "unknown";
}

retry_policy effective_retry(step_spec const &step, execution_options const &options) {
  if (step.retry) { return *step.retry; }
  return retry_policy{ .max_attempts = std::max(options.max_retries, 0) + 1,
                       .delay_seconds = std::max(options.retry_delay, 0.0) };
}

// Non-positive run-wide timeouts mean unbounded, as does anything beyond kUtilMaxWait.
std::optional<double> effective_timeout(step_spec const &step, run_state const &state) {
  auto const bounded{ [](std::optional<double> t) -> std::optional<double> {
    if (t && *t >= std::chrono::duration<double>(kUtilMaxWait).count()) {
      return std::nullopt;
    }
    return t;
  } };

  if (step.timeout_seconds) { return bounded(step.timeout_seconds); }
  if (state.options.default_timeout && *state.options.default_timeout > 0) {
    return bounded(state.options.default_timeout);
  }
  if (state.runner_timeout && *state.runner_timeout > 0) {
    return bounded(state.runner_timeout);
  }
  return std::nullopt;
}

std::optional<std::string> skip_reason(step_spec const &step,
                                       execution_options const &options) {
  auto const listed{ [&](std::vector<std::string> const &names) {
    return std::find(names.begin(), names.end(), step.name) != names.end();
  } };

  if (listed(options.skip)) { return "listed in skip"; }
  if (!options.only.empty() && !listed(options.only)) { return "not listed in only"; }
  if (!step.enabled) { return "disabled"; }
  return std::nullopt;
}

std::int64_t elapsed_ms(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now() - since)
      .count();
}

// Runs one attempt on a worker thread and waits for it or the deadline. A worker
// that misses the deadline is detached with its token cancelled; whatever it
// produces afterwards lands in a slot only abandoned_attempts watches.
attempt_report run_attempt(step_fn const &fn,
                           step_spec const &step,
                           int attempt,
                           run_state &state,
                           std::optional<double> timeout) {
  auto slot{ std::make_shared<attempt_slot>() };
  auto token{ state.token->make_child() };

  std::thread worker{
    [slot, token, fn, attempt, ctx = state.ctx, args = step.args, name = step.name] {
      step_outcome outcome;
      try {
        step_call call{
          .ctx = *ctx, .args = args, .step = name, .attempt = attempt, .token = *token
        };
        outcome = fn(call);
      } catch (std::exception const &e) { outcome = step_outcome::failure(e.what()); }

      {
        std::lock_guard const lock(slot->mutex);
        slot->outcome = std::move(outcome);
        slot->done = true;
      }
      slot->cv.notify_all();
    }
  };

  bool finished{ true };
  {
    std::unique_lock lock(slot->mutex);
    if (timeout) {
      finished = slot->cv.wait_for(lock,
                                   util_seconds_to_duration(*timeout),
                                   [&slot] { return slot->done; });
    } else {
      slot->cv.wait(lock, [&slot] { return slot->done; });
    }
  }

  if (!finished) {
    token->cancel();
    worker.detach();
    state.abandoned.add(slot);
    return attempt_report{ .kind = attempt_kind::timed_out,
                           .output = {},
                           .error = step_timeout_error(step.name, *timeout).what() };
  }

  worker.join();
  if (slot->outcome.success) {
    return attempt_report{ .kind = attempt_kind::succeeded,
                           .output = std::move(slot->outcome.output),
                           .error = {} };
  }

  auto const cause{ slot->outcome.error.empty() ? std::string{ "step reported failure" }
                                                : slot->outcome.error };
  return attempt_report{ .kind = attempt_kind::failed,
                         .output = {},
                         .error = step_execution_error(step.name, cause).what() };
}

// Keys this step wrote since `mark` that did not exist when the run started.
std::vector<std::string> keys_created_by(run_state const &state,
                                         std::string const &step_name,
                                         std::uint64_t mark) {
  std::set<std::string> created;
  for (auto const &record : state.ctx->history_since(mark)) {
    if (record.who == step_name && !state.initial_keys.contains(record.key)) {
      created.insert(record.key);
    }
  }
  return { created.begin(), created.end() };
}

void publish_step(context &ctx, step_execution_result const &r) {
  auto const prefix{ "steps." + r.step_name + "." };
  ctx.set(prefix + "status", step_status_name(r.status), kRunnerWho);
  ctx.set(prefix + "attempts", r.attempts, kRunnerWho);
  ctx.set(prefix + "output", r.output ? *r.output : value{}, kRunnerWho);
  ctx.set(prefix + "error", r.error ? value{ *r.error } : value{}, kRunnerWho);
}

void store_step(run_state &state, std::size_t index, step_execution_result r) {
  publish_step(*state.ctx, r);
  std::lock_guard const lock(state.mutex);
  state.steps[index] = std::move(r);
}

void mark_not_run(run_state &state,
                  std::size_t index,
                  step_status status,
                  std::string const &reason) {
  auto const &step{ state.spec.steps[index] };
  SOUS_TRACE_STEP_SKIPPED(state.spec.metadata.name, step.name, reason);
  tui::debug("[%s] %s: %s", step.name.c_str(), step_status_name(status), reason.c_str());

  store_step(state,
             index,
             step_execution_result{ .step_name = step.name,
                                    .idx = step.idx,
                                    .status = status,
                                    .attempts = 0 });
}

void execute_step(run_state &state, std::size_t index) {
  auto const &step{ state.spec.steps[index] };
  auto const &recipe_name{ state.spec.metadata.name };
  auto const policy{ effective_retry(step, state.options) };
  auto const timeout{ effective_timeout(step, state) };
  auto const mark{ state.ctx->next_sequence() };

  step_execution_result r{ .step_name = step.name,
                           .idx = step.idx,
                           .status = step_status::running,
                           .attempts = 0,
                           .start_time = std::chrono::system_clock::now() };
  step_trace_scope trace{ recipe_name, step.name, step.idx };
  tui::debug("[%s] running %s.%s (max %d attempts)",
             step.name.c_str(),
             step.module_ref.c_str(),
             step.function_ref.c_str(),
             policy.max_attempts);

  step_fn fn;
  bool last_timed_out{ false };

  for (int attempt{ 1 }; attempt <= policy.max_attempts; ++attempt) {
    if (attempt > 1) {
      if (state.token->cancelled()) {
        r.status = step_status::cancelled;
        break;
      }
      SOUS_TRACE_RETRY_SCHEDULED(recipe_name,
                                 step.name,
                                 attempt,
                                 policy.delay_seconds * 1000.0);
      if (policy.delay_seconds > 0 &&
          !state.token->wait_for(std::chrono::duration<double>(policy.delay_seconds))) {
        r.status = step_status::cancelled;
        break;
      }
    }

    r.attempts = attempt;
    SOUS_TRACE_ATTEMPT_START(recipe_name, step.name, attempt, policy.max_attempts);
    auto const attempt_start{ std::chrono::steady_clock::now() };

    if (!fn) {
      try {
        fn = state.resolver.resolve(step.module_ref, step.function_ref);
      } catch (std::exception const &e) {
        r.attempt_errors.push_back("step '" + step.name +
                                   "' could not be resolved: " + e.what());
        last_timed_out = false;
        SOUS_TRACE_ATTEMPT_COMPLETE(recipe_name,
                                    step.name,
                                    attempt,
                                    "failed",
                                    elapsed_ms(attempt_start));
        tui::warn("[%s] %s", step.name.c_str(), r.attempt_errors.back().c_str());
        if (!state.options.retry_resolution_failures) { break; }
        continue;
      }
    }

    attempt_report report;
    try {
      report = run_attempt(fn, step, attempt, state, timeout);
    } catch (std::system_error const &e) {
      report = attempt_report{ .kind = attempt_kind::failed,
                               .output = {},
                               .error = step_execution_error(
                                            step.name,
                                            std::string{ "cannot start worker: " } +
                                                e.what())
                                            .what() };
    }

    SOUS_TRACE_ATTEMPT_COMPLETE(recipe_name,
                                step.name,
                                attempt,
                                attempt_kind_name(report.kind),
                                elapsed_ms(attempt_start));

    if (report.kind == attempt_kind::succeeded) {
      r.status = step_status::succeeded;
      r.output = std::move(report.output);
      break;
    }

    last_timed_out = report.kind == attempt_kind::timed_out;
    r.attempt_errors.push_back(std::move(report.error));
    tui::warn("[%s] attempt %d/%d: %s",
              step.name.c_str(),
              attempt,
              policy.max_attempts,
              r.attempt_errors.back().c_str());
  }

  if (r.status == step_status::running) {
    r.status = last_timed_out ? step_status::timed_out : step_status::failed;
  }
  if (r.status != step_status::succeeded && !r.attempt_errors.empty()) {
    r.error = r.attempt_errors.back();
  }
  r.end_time = std::chrono::system_clock::now();
  r.outputs_created = keys_created_by(state, step.name, mark);

  trace.status = step_status_name(r.status);
  trace.attempts = r.attempts;

  bool const failed{ r.status == step_status::failed || r.status == step_status::timed_out };
  if (failed) {
    tui::error("[%s] %s", step.name.c_str(), r.error ? r.error->c_str() : "failed");
    {
      std::lock_guard const lock(state.mutex);
      state.global_errors.push_back(r.error.value_or("step '" + step.name + "' failed"));
    }
    if (!state.options.continue_on_error) { state.halted = true; }
  } else {
    tui::info("[%s] %s in %s",
              step.name.c_str(),
              step_status_name(r.status),
              util_format_seconds(r.duration_seconds()).c_str());
  }

  store_step(state, index, std::move(r));
}

// Steps whose run did not reach them through a failure or cancellation.
void run_gated_step(run_state &state, std::size_t index) {
  auto const &step{ state.spec.steps[index] };

  if (state.token->cancelled()) {
    mark_not_run(state, index, step_status::cancelled, "cancelled");
    return;
  }
  if (state.halted) {
    mark_not_run(state, index, step_status::skipped, "halted after failure");
    return;
  }
  if (auto const reason{ skip_reason(step, state.options) }) {
    mark_not_run(state, index, step_status::skipped, *reason);
    return;
  }
  execute_step(state, index);
}

void run_sequential(run_state &state) {
  for (std::size_t i{ 0 }; i < state.spec.steps.size(); ++i) { run_gated_step(state, i); }
}

// A dependency counts as satisfied when it succeeded or was filtered out on purpose.
bool dependency_satisfied(run_state &state, std::size_t dep_index) {
  auto const &dep{ state.spec.steps[dep_index] };
  step_status status;
  {
    std::lock_guard const lock(state.mutex);
    status = state.steps[dep_index].status;
  }
  if (status == step_status::succeeded) { return true; }
  return status == step_status::skipped && skip_reason(dep, state.options).has_value();
}

void run_dependency_parallel(run_state &state) {
  auto const &steps{ state.spec.steps };

  std::unordered_map<std::string, std::size_t> index_of;
  for (std::size_t i{ 0 }; i < steps.size(); ++i) { index_of.emplace(steps[i].name, i); }

  tbb::flow::graph graph;
  std::vector<std::shared_ptr<graph_node>> nodes;
  nodes.reserve(steps.size());

  for (std::size_t i{ 0 }; i < steps.size(); ++i) {
    nodes.push_back(std::make_shared<graph_node>(
        graph,
        [&state, &index_of, i](tbb::flow::continue_msg const &) {
          for (auto const &dep : state.spec.steps[i].depends_on) {
            auto const it{ index_of.find(dep) };
            if (it != index_of.end() && !dependency_satisfied(state, it->second) &&
                !state.token->cancelled() && !state.halted) {
              mark_not_run(state,
                           i,
                           step_status::skipped,
                           "dependency '" + dep + "' did not succeed");
              return;
            }
          }
          run_gated_step(state, i);
        }));
  }

  std::vector<bool> has_predecessor(steps.size(), false);
  for (std::size_t i{ 0 }; i < steps.size(); ++i) {
    for (auto const &dep : steps[i].depends_on) {
      auto const it{ index_of.find(dep) };
      if (it == index_of.end()) { continue; }
      tbb::flow::make_edge(*nodes[it->second], *nodes[i]);
      has_predecessor[i] = true;
    }
  }

  tbb::task_arena arena{ state.options.max_parallel > 0 ? state.options.max_parallel
                                                        : tbb::task_arena::automatic };
  arena.execute([&] {
    for (std::size_t i{ 0 }; i < steps.size(); ++i) {
      if (!has_predecessor[i]) { nodes[i]->try_put(tbb::flow::continue_msg{}); }
    }
    graph.wait_for_all();
  });
}

void seed_context(context &ctx, recipe_spec const &spec, time_point start) {
  auto const &meta{ spec.metadata };
  ctx.set("recipe.name", meta.name, kRunnerWho);
  ctx.set("recipe.version", meta.version, kRunnerWho);
  ctx.set("recipe.path", meta.source_path.string(), kRunnerWho);
  ctx.set("recipe.content_hash", meta.content_hash, kRunnerWho);
  ctx.set("recipe.start_time", util_format_timestamp(start), kRunnerWho);
  ctx.set("recipe.total_steps", static_cast<std::int64_t>(spec.steps.size()), kRunnerWho);
  ctx.set("recipe.config", spec.config, kRunnerWho);
}

value_array to_value_array(std::vector<std::string> const &items) {
  return value_array(items.begin(), items.end());
}

void finalize_context(context &ctx, recipe_execution_result const &result) {
  std::set<std::string> outputs;
  for (auto const &step : result.step_results) {
    outputs.insert(step.outputs_created.begin(), step.outputs_created.end());
  }

  auto const count{ [&](step_status s) {
    return static_cast<std::int64_t>(result.count(s));
  } };

  ctx.set("recipe.end_time", util_format_timestamp(result.end_time), kRunnerWho);
  ctx.set("recipe.execution_time_seconds", result.execution_time_seconds(), kRunnerWho);
  ctx.set("recipe.status", run_status_name(result.status), kRunnerWho);
  ctx.set("recipe.success", result.overall_success(), kRunnerWho);
  ctx.set("recipe.completed_steps", count(step_status::succeeded), kRunnerWho);
  ctx.set("recipe.failed_steps",
          count(step_status::failed) + count(step_status::timed_out),
          kRunnerWho);
  ctx.set("recipe.skipped_steps", count(step_status::skipped), kRunnerWho);
  ctx.set("recipe.cancelled_steps", count(step_status::cancelled), kRunnerWho);
  ctx.set("recipe.success_rate", result.success_rate(), kRunnerWho);
  ctx.set("recipe.outputs_created",
          to_value_array(std::vector<std::string>(outputs.begin(), outputs.end())),
          kRunnerWho);
  ctx.set("recipe.global_errors", to_value_array(result.global_errors), kRunnerWho);
  ctx.set("recipe.global_warnings", to_value_array(result.global_warnings), kRunnerWho);
}

run_status decide_status(recipe_execution_result const &result, bool halted) {
  if (result.count(step_status::cancelled) > 0) { return run_status::cancelled; }
  if (halted) { return run_status::failed; }

  auto const failures{ result.count(step_status::failed) +
                       result.count(step_status::timed_out) };
  if (failures == 0) { return run_status::completed; }
  return result.count(step_status::succeeded) > 0 ? run_status::partial
                                                  : run_status::failed;
}

}  // namespace

void abandoned_attempts::add(std::shared_ptr<attempt_slot> slot) {
  std::lock_guard const lock(mutex_);
  std::erase_if(slots_, [](auto const &s) {
    std::lock_guard const slot_lock(s->mutex);
    return s->done;
  });
  slots_.push_back(std::move(slot));
}

std::size_t abandoned_attempts::wait_for(std::chrono::duration<double> limit) {
  std::vector<std::shared_ptr<attempt_slot>> slots;
  {
    std::lock_guard const lock(mutex_);
    slots = slots_;
  }

  auto const deadline{ std::chrono::steady_clock::now() +
                       util_seconds_to_duration(limit.count()) };
  std::size_t still_running{ 0 };
  for (auto const &slot : slots) {
    std::unique_lock lock(slot->mutex);
    if (!slot->cv.wait_until(lock, deadline, [&slot] { return slot->done; })) {
      ++still_running;
    }
  }
  return still_running;
}

std::size_t abandoned_attempts::running() const {
  std::lock_guard const lock(mutex_);
  return static_cast<std::size_t>(std::count_if(slots_.begin(), slots_.end(), [](auto const &s) {
    std::lock_guard const slot_lock(s->mutex);
    return !s->done;
  }));
}

char const *execution_mode_name(execution_mode mode) {
  switch (mode) {
    case execution_mode::sequential: return "sequential";
    case execution_mode::dependency_parallel: return "dependency_parallel";
  }
  return "unknown";
}

execution_mode execution_mode_parse(std::string_view name) {
  if (name == "sequential") { return execution_mode::sequential; }
  if (name == "dependency_parallel") { return execution_mode::dependency_parallel; }
  throw std::runtime_error("unsupported execution mode '" + std::string{ name } +
                           "' (expected sequential or dependency_parallel)");
}

runner::runner(std::shared_ptr<step_resolver const> resolver,
               std::optional<double> default_timeout,
               std::size_t history_capacity)
    : resolver_{ std::move(resolver) },
      default_timeout_{ default_timeout },
      history_capacity_{ history_capacity } {
  if (!resolver_) { throw std::invalid_argument("runner: resolver must not be null"); }
}

recipe_execution_result runner::run(recipe_spec const &spec,
                                    std::shared_ptr<context> ctx,
                                    execution_options const &options) {
  if (!ctx) { throw std::invalid_argument("runner::run: context must not be null"); }
  if (!spec.is_valid()) { throw invalid_recipe_error(spec.metadata.name, spec.errors()); }

  auto token{ std::make_shared<cancel_token>() };
  {
    std::lock_guard const lock(active_mutex_);
    if (active_.empty()) { cancellation_requested_ = false; }
    active_.push_back(token);
  }

  struct active_run_guard {
    runner &self;
    std::shared_ptr<cancel_token> const &token;

    ~active_run_guard() {
      std::lock_guard const lock(self.active_mutex_);
      std::erase(self.active_, token);
    }
  } const guard{ *this, token };

  auto const keys_before{ ctx->keys() };
  run_state state{ .spec = spec,
                   .ctx = ctx,
                   .options = options,
                   .resolver = *resolver_,
                   .runner_timeout = default_timeout_,
                   .token = token,
                   .abandoned = abandoned_,
                   .initial_keys = { keys_before.begin(), keys_before.end() } };
  state.steps.resize(spec.steps.size());
  for (std::size_t i{ 0 }; i < spec.steps.size(); ++i) {
    state.steps[i].step_name = spec.steps[i].name;
    state.steps[i].idx = spec.steps[i].idx;
  }

  recipe_execution_result result{ .recipe_name = spec.metadata.name,
                                  .recipe_path = spec.metadata.source_path.string(),
                                  .start_time = std::chrono::system_clock::now() };
  auto const run_start{ std::chrono::steady_clock::now() };

  for (auto const &w : spec.warnings()) { state.global_warnings.push_back(w.to_string()); }
  seed_context(*ctx, spec, result.start_time);

  SOUS_TRACE_RUN_START(spec.metadata.name, spec.steps.size(), execution_mode_name(options.mode));
  tui::info("Running recipe '%s' (%zu steps, %s)",
            spec.metadata.name.c_str(),
            spec.steps.size(),
            execution_mode_name(options.mode));

  if (options.mode == execution_mode::dependency_parallel) {
    run_dependency_parallel(state);
  } else {
    run_sequential(state);
  }

  result.step_results = std::move(state.steps);
  result.global_errors = std::move(state.global_errors);
  result.global_warnings = std::move(state.global_warnings);
  if (token->cancelled()) {
    result.global_warnings.push_back("execution cancelled by request");
  }
  result.status = decide_status(result, state.halted);
  result.end_time = std::chrono::system_clock::now();

  finalize_context(*ctx, result);
  for (auto const &key : ctx->keys()) {
    if (!state.initial_keys.contains(key)) { result.context_keys_created.push_back(key); }
  }

  SOUS_TRACE_RUN_COMPLETE(spec.metadata.name,
                          run_status_name(result.status),
                          result.count(step_status::succeeded),
                          result.count(step_status::failed) +
                              result.count(step_status::timed_out),
                          result.count(step_status::skipped),
                          elapsed_ms(run_start));
  tui::info("Recipe '%s' %s: %zu succeeded, %zu failed, %zu skipped in %s",
            spec.metadata.name.c_str(),
            run_status_name(result.status),
            result.count(step_status::succeeded),
            result.count(step_status::failed) + result.count(step_status::timed_out),
            result.count(step_status::skipped) + result.count(step_status::cancelled),
            util_format_seconds(result.execution_time_seconds()).c_str());

  record(result);
  return result;
}

void runner::record(recipe_execution_result const &result) {
  std::size_t executed{ 0 };
  for (auto const &step : result.step_results) {
    if (step.attempts > 0) { ++executed; }
  }

  std::lock_guard const lock(history_mutex_);
  ++total_runs_;
  total_steps_executed_ += executed;
  if (history_capacity_ == 0) { return; }
  history_.push_back(result);
  while (history_.size() > history_capacity_) { history_.pop_front(); }
}

void runner::cancel() {
  std::vector<std::shared_ptr<cancel_token>> active;
  {
    std::lock_guard const lock(active_mutex_);
    cancellation_requested_ = true;
    active = active_;
  }

  SOUS_TRACE_CANCEL_REQUESTED(active.size());
  tui::info("Cancellation requested (%zu active runs)", active.size());
  for (auto const &token : active) { token->cancel(); }
}

execution_statistics runner::stats() const {
  std::size_t active_runs{ 0 };
  bool cancellation_requested{ false };
  {
    std::lock_guard const lock(active_mutex_);
    active_runs = active_.size();
    cancellation_requested = cancellation_requested_;
  }

  std::lock_guard const lock(history_mutex_);
  return execution_statistics{ .total_runs = total_runs_,
                               .total_steps_executed = total_steps_executed_,
                               .history_size = history_.size(),
                               .history_capacity = history_capacity_,
                               .active_runs = active_runs,
                               .cancellation_requested = cancellation_requested,
                               .default_timeout = default_timeout_,
                               .abandoned_attempts_running = abandoned_.running() };
}

std::size_t runner::wait_for_abandoned(std::chrono::duration<double> limit) {
  return abandoned_.wait_for(limit);
}

std::vector<recipe_execution_result> runner::history(std::optional<std::size_t> limit) const {
  std::lock_guard const lock(history_mutex_);
  auto const count{ limit ? std::min(*limit, history_.size()) : history_.size() };
  return std::vector<recipe_execution_result>(
      history_.end() - static_cast<std::ptrdiff_t>(count), history_.end());
}

std::size_t runner::clear_history() {
  std::lock_guard const lock(history_mutex_);
  auto const cleared{ history_.size() };
  history_.clear();
  return cleared;
}

}  // namespace sous
