#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace sous {

namespace trace_events {

struct recipe_validated {
  std::string recipe;
  std::int64_t step_count;
  std::int64_t error_count;
  std::int64_t warning_count;
};

struct run_start {
  std::string recipe;
  std::int64_t total_steps;
  std::string mode;
};

struct run_complete {
  std::string recipe;
  std::string status;
  std::int64_t succeeded;
  std::int64_t failed;
  std::int64_t skipped;
  std::int64_t duration_ms;
};

struct step_start {
  std::string recipe;
  std::string step;
  std::int64_t idx;
};

struct step_complete {
  std::string recipe;
  std::string step;
  std::string status;
  std::int64_t attempts;
  std::int64_t duration_ms;
};

struct step_skipped {
  std::string recipe;
  std::string step;
  std::string reason;
};

struct attempt_start {
  std::string recipe;
  std::string step;
  std::int64_t attempt;
  std::int64_t max_attempts;
};

struct attempt_complete {
  std::string recipe;
  std::string step;
  std::int64_t attempt;
  std::string outcome;  // "succeeded", "failed", "timed_out"
  std::int64_t duration_ms;
};

struct retry_scheduled {
  std::string recipe;
  std::string step;
  std::int64_t next_attempt;
  std::int64_t delay_ms;
};

struct cancel_requested {
  std::int64_t active_runs;
};

struct context_flushed {
  std::int64_t keys;
};

}  // namespace trace_events

using trace_event_t = std::variant<trace_events::recipe_validated,
                                   trace_events::run_start,
                                   trace_events::run_complete,
                                   trace_events::step_start,
                                   trace_events::step_complete,
                                   trace_events::step_skipped,
                                   trace_events::attempt_start,
                                   trace_events::attempt_complete,
                                   trace_events::retry_scheduled,
                                   trace_events::cancel_requested,
                                   trace_events::context_flushed>;

std::string_view trace_event_name(trace_event_t const &event);
std::string trace_event_to_string(trace_event_t const &event);
std::string trace_event_to_json(trace_event_t const &event);

namespace tui {
extern bool g_trace_enabled;
void trace(trace_event_t event);

inline bool trace_enabled() { return g_trace_enabled; }
}  // namespace tui

// Emits step_start on construction and step_complete on destruction, with the
// status the owner recorded in `status` by then.
struct step_trace_scope {
  std::string recipe;
  std::string step;
  std::string status{ "unknown" };
  std::int64_t attempts{ 0 };
  std::chrono::steady_clock::time_point start;

  step_trace_scope(std::string recipe_name, std::string step_name, std::int64_t idx);
  ~step_trace_scope();
};

}  // namespace sous

#define SOUS_TRACE_UNLIKELY [[unlikely]]

#define SOUS_TRACE_EMIT(event_expr) \
  do { \
    if (::sous::tui::g_trace_enabled) SOUS_TRACE_UNLIKELY { \
        ::sous::tui::trace event_expr; \
      } \
  } while (0)

#define SOUS_TRACE_RECIPE_VALIDATED(recipe_value, steps_value, errors_value, warnings_value) \
  SOUS_TRACE_EMIT((::sous::trace_events::recipe_validated{ \
      .recipe = (recipe_value), \
      .step_count = static_cast<std::int64_t>(steps_value), \
      .error_count = static_cast<std::int64_t>(errors_value), \
      .warning_count = static_cast<std::int64_t>(warnings_value), \
  }))

#define SOUS_TRACE_RUN_START(recipe_value, total_steps_value, mode_value) \
  SOUS_TRACE_EMIT((::sous::trace_events::run_start{ \
      .recipe = (recipe_value), \
      .total_steps = static_cast<std::int64_t>(total_steps_value), \
      .mode = (mode_value), \
  }))

#define SOUS_TRACE_RUN_COMPLETE(recipe_value, \
                                status_value, \
                                succeeded_value, \
                                failed_value, \
                                skipped_value, \
                                duration_value) \
  SOUS_TRACE_EMIT((::sous::trace_events::run_complete{ \
      .recipe = (recipe_value), \
      .status = (status_value), \
      .succeeded = static_cast<std::int64_t>(succeeded_value), \
      .failed = static_cast<std::int64_t>(failed_value), \
      .skipped = static_cast<std::int64_t>(skipped_value), \
      .duration_ms = static_cast<std::int64_t>(duration_value), \
  }))

#define SOUS_TRACE_STEP_START(recipe_value, step_value, idx_value) \
  SOUS_TRACE_EMIT((::sous::trace_events::step_start{ \
      .recipe = (recipe_value), \
      .step = (step_value), \
      .idx = static_cast<std::int64_t>(idx_value), \
  }))

#define SOUS_TRACE_STEP_COMPLETE(recipe_value, \
                                 step_value, \
                                 status_value, \
                                 attempts_value, \
                                 duration_value) \
  SOUS_TRACE_EMIT((::sous::trace_events::step_complete{ \
      .recipe = (recipe_value), \
      .step = (step_value), \
      .status = (status_value), \
      .attempts = static_cast<std::int64_t>(attempts_value), \
      .duration_ms = static_cast<std::int64_t>(duration_value), \
  }))

#define SOUS_TRACE_STEP_SKIPPED(recipe_value, step_value, reason_value) \
  SOUS_TRACE_EMIT((::sous::trace_events::step_skipped{ \
      .recipe = (recipe_value), \
      .step = (step_value), \
      .reason = (reason_value), \
  }))

#define SOUS_TRACE_ATTEMPT_START(recipe_value, step_value, attempt_value, max_value) \
  SOUS_TRACE_EMIT((::sous::trace_events::attempt_start{ \
      .recipe = (recipe_value), \
      .step = (step_value), \
      .attempt = static_cast<std::int64_t>(attempt_value), \
      .max_attempts = static_cast<std::int64_t>(max_value), \
  }))

#define SOUS_TRACE_ATTEMPT_COMPLETE(recipe_value, \
                                    step_value, \
                                    attempt_value, \
                                    outcome_value, \
                                    duration_value) \
  SOUS_TRACE_EMIT((::sous::trace_events::attempt_complete{ \
      .recipe = (recipe_value), \
      .step = (step_value), \
      .attempt = static_cast<std::int64_t>(attempt_value), \
      .outcome = (outcome_value), \
      .duration_ms = static_cast<std::int64_t>(duration_value), \
  }))

#define SOUS_TRACE_RETRY_SCHEDULED(recipe_value, step_value, next_value, delay_value) \
  SOUS_TRACE_EMIT((::sous::trace_events::retry_scheduled{ \
      .recipe = (recipe_value), \
      .step = (step_value), \
      .next_attempt = static_cast<std::int64_t>(next_value), \
      .delay_ms = static_cast<std::int64_t>(delay_value), \
  }))

#define SOUS_TRACE_CANCEL_REQUESTED(active_value) \
  SOUS_TRACE_EMIT((::sous::trace_events::cancel_requested{ \
      .active_runs = static_cast<std::int64_t>(active_value), \
  }))

#define SOUS_TRACE_CONTEXT_FLUSHED(keys_value) \
  SOUS_TRACE_EMIT((::sous::trace_events::context_flushed{ \
      .keys = static_cast<std::int64_t>(keys_value), \
  }))
