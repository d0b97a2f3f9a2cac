#pragma once

#include "value.h"

#include "nlohmann/json.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sous {

using time_point = std::chrono::system_clock::time_point;

enum class step_status { pending, running, succeeded, failed, skipped, timed_out, cancelled };

// Overall outcome of a run. partial: continue-on-error run that saw failures.
enum class run_status { completed, partial, failed, cancelled };

char const *step_status_name(step_status status);  // "timed_out"
step_status step_status_parse(std::string_view name);
bool step_status_is_terminal(step_status status);

char const *run_status_name(run_status status);
run_status run_status_parse(std::string_view name);

struct step_execution_result {
  std::string step_name;
  std::int64_t idx{ 0 };
  step_status status{ step_status::pending };
  int attempts{ 0 };
  std::optional<time_point> start_time;
  std::optional<time_point> end_time;
  std::optional<std::string> error;
  std::optional<value> output;
  std::vector<std::string> attempt_errors;   // one entry per failed attempt
  std::vector<std::string> outputs_created;  // context keys this step introduced

  double duration_seconds() const;  // 0 unless both times are set
};

struct recipe_execution_result {
  std::string recipe_name;
  std::string recipe_path;
  run_status status{ run_status::completed };
  std::vector<step_execution_result> step_results;  // idx order
  std::vector<std::string> global_errors;
  std::vector<std::string> global_warnings;
  time_point start_time;
  time_point end_time;
  std::vector<std::string> context_keys_created;

  double execution_time_seconds() const;
  std::size_t count(step_status status) const;

  // succeeded / (succeeded + failed + timed_out); 1.0 when nothing ran to a verdict.
  double success_rate() const;

  // No FAILED or TIMED_OUT step, no global error, not cancelled.
  bool overall_success() const;

  step_execution_result const *find(std::string_view step_name) const;
};

nlohmann::json result_to_json(recipe_execution_result const &result);

// Inverse of result_to_json. Derived fields are recomputed, not read back.
// Throws std::runtime_error on missing or mistyped fields.
recipe_execution_result result_from_json(nlohmann::json const &json);

// Indented JSON report; parent directories are created.
void result_write_report(recipe_execution_result const &result,
                         std::filesystem::path const &path);

std::vector<std::string> result_summary_lines(recipe_execution_result const &result);

}  // namespace sous
