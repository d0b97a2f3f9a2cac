#include "trace.h"

#include "util.h"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <sstream>
#include <string>

namespace sous {

namespace {

void append_json_string(std::string &out, std::string_view value) {
  for (char const ch : value) {
    switch (ch) {
      case '\\': out.append("\\\\"); break;
      case '"': out.append("\\\""); break;
      case '\b': out.append("\\b"); break;
      case '\f': out.append("\\f"); break;
      case '\n': out.append("\\n"); break;
      case '\r': out.append("\\r"); break;
      case '\t': out.append("\\t"); break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char escape[7]{};
          std::snprintf(escape,
                        sizeof escape,
                        "\\u%04x",
                        static_cast<unsigned int>(static_cast<unsigned char>(ch)));
          out.append(escape);
        } else {
          out.push_back(ch);
        }
        break;
    }
  }
}

void append_kv(std::string &out, char const *key, std::string_view value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":\"");
  append_json_string(out, value);
  out.push_back('"');
}

void append_kv(std::string &out, char const *key, std::int64_t value) {
  out.push_back(',');
  out.push_back('"');
  out.append(key);
  out.append("\":");
  out.append(std::to_string(value));
}

}  // namespace

step_trace_scope::step_trace_scope(std::string recipe_name,
                                   std::string step_name,
                                   std::int64_t idx)
    : recipe{ std::move(recipe_name) },
      step{ std::move(step_name) },
      start{ std::chrono::steady_clock::now() } {
  SOUS_TRACE_STEP_START(recipe, step, idx);
}

step_trace_scope::~step_trace_scope() {
  auto const duration_ms{ std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - start)
                              .count() };
  SOUS_TRACE_STEP_COMPLETE(recipe, step, status, attempts, duration_ms);
}

#define TRACE_NAME(type) \
  [](trace_events::type const &) -> std::string_view { return #type; }

std::string_view trace_event_name(trace_event_t const &event) {
  return std::visit(
      match{
          TRACE_NAME(recipe_validated),
          TRACE_NAME(run_start),
          TRACE_NAME(run_complete),
          TRACE_NAME(step_start),
          TRACE_NAME(step_complete),
          TRACE_NAME(step_skipped),
          TRACE_NAME(attempt_start),
          TRACE_NAME(attempt_complete),
          TRACE_NAME(retry_scheduled),
          TRACE_NAME(cancel_requested),
          TRACE_NAME(context_flushed),
      },
      event);
}

#undef TRACE_NAME

std::string trace_event_to_string(trace_event_t const &event) {
  return std::visit(
      match{
          [](trace_events::recipe_validated const &value) {
            std::ostringstream oss;
            oss << "recipe_validated recipe=" << value.recipe
                << " steps=" << value.step_count << " errors=" << value.error_count
                << " warnings=" << value.warning_count;
            return oss.str();
          },
          [](trace_events::run_start const &value) {
            std::ostringstream oss;
            oss << "run_start recipe=" << value.recipe
                << " total_steps=" << value.total_steps << " mode=" << value.mode;
            return oss.str();
          },
          [](trace_events::run_complete const &value) {
            std::ostringstream oss;
            oss << "run_complete recipe=" << value.recipe << " status=" << value.status
                << " succeeded=" << value.succeeded << " failed=" << value.failed
                << " skipped=" << value.skipped << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
          [](trace_events::step_start const &value) {
            std::ostringstream oss;
            oss << "step_start recipe=" << value.recipe << " step=" << value.step
                << " idx=" << value.idx;
            return oss.str();
          },
          [](trace_events::step_complete const &value) {
            std::ostringstream oss;
            oss << "step_complete recipe=" << value.recipe << " step=" << value.step
                << " status=" << value.status << " attempts=" << value.attempts
                << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
          [](trace_events::step_skipped const &value) {
            std::ostringstream oss;
            oss << "step_skipped recipe=" << value.recipe << " step=" << value.step
                << " reason=" << value.reason;
            return oss.str();
          },
          [](trace_events::attempt_start const &value) {
            std::ostringstream oss;
            oss << "attempt_start recipe=" << value.recipe << " step=" << value.step
                << " attempt=" << value.attempt << "/" << value.max_attempts;
            return oss.str();
          },
          [](trace_events::attempt_complete const &value) {
            std::ostringstream oss;
            oss << "attempt_complete recipe=" << value.recipe << " step=" << value.step
                << " attempt=" << value.attempt << " outcome=" << value.outcome
                << " duration_ms=" << value.duration_ms;
            return oss.str();
          },
          [](trace_events::retry_scheduled const &value) {
            std::ostringstream oss;
            oss << "retry_scheduled recipe=" << value.recipe << " step=" << value.step
                << " next_attempt=" << value.next_attempt
                << " delay_ms=" << value.delay_ms;
            return oss.str();
          },
          [](trace_events::cancel_requested const &value) {
            std::ostringstream oss;
            oss << "cancel_requested active_runs=" << value.active_runs;
            return oss.str();
          },
          [](trace_events::context_flushed const &value) {
            std::ostringstream oss;
            oss << "context_flushed keys=" << value.keys;
            return oss.str();
          },
      },
      event);
}

std::string trace_event_to_json(trace_event_t const &event) {
  std::string output;
  output.reserve(256);

  output.append("{\"ts\":\"");
  output.append(util_format_timestamp(std::chrono::system_clock::now()));
  output.append("\",\"event\":\"");
  output.append(trace_event_name(event));
  output.push_back('"');

  auto const append_recipe{ [&](std::string_view value) {
    append_kv(output, "recipe", value);
  } };

  std::visit(
      match{
          [&](trace_events::recipe_validated const &value) {
            append_recipe(value.recipe);
            append_kv(output, "step_count", value.step_count);
            append_kv(output, "error_count", value.error_count);
            append_kv(output, "warning_count", value.warning_count);
          },
          [&](trace_events::run_start const &value) {
            append_recipe(value.recipe);
            append_kv(output, "total_steps", value.total_steps);
            append_kv(output, "mode", value.mode);
          },
          [&](trace_events::run_complete const &value) {
            append_recipe(value.recipe);
            append_kv(output, "status", value.status);
            append_kv(output, "succeeded", value.succeeded);
            append_kv(output, "failed", value.failed);
            append_kv(output, "skipped", value.skipped);
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::step_start const &value) {
            append_recipe(value.recipe);
            append_kv(output, "step", value.step);
            append_kv(output, "idx", value.idx);
          },
          [&](trace_events::step_complete const &value) {
            append_recipe(value.recipe);
            append_kv(output, "step", value.step);
            append_kv(output, "status", value.status);
            append_kv(output, "attempts", value.attempts);
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::step_skipped const &value) {
            append_recipe(value.recipe);
            append_kv(output, "step", value.step);
            append_kv(output, "reason", value.reason);
          },
          [&](trace_events::attempt_start const &value) {
            append_recipe(value.recipe);
            append_kv(output, "step", value.step);
            append_kv(output, "attempt", value.attempt);
            append_kv(output, "max_attempts", value.max_attempts);
          },
          [&](trace_events::attempt_complete const &value) {
            append_recipe(value.recipe);
            append_kv(output, "step", value.step);
            append_kv(output, "attempt", value.attempt);
            append_kv(output, "outcome", value.outcome);
            append_kv(output, "duration_ms", value.duration_ms);
          },
          [&](trace_events::retry_scheduled const &value) {
            append_recipe(value.recipe);
            append_kv(output, "step", value.step);
            append_kv(output, "next_attempt", value.next_attempt);
            append_kv(output, "delay_ms", value.delay_ms);
          },
          [&](trace_events::cancel_requested const &value) {
            append_kv(output, "active_runs", value.active_runs);
          },
          [&](trace_events::context_flushed const &value) {
            append_kv(output, "keys", value.keys);
          },
      },
      event);

  output.push_back('}');
  return output;
}

}  // namespace sous
