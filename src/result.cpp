#include "result.h"

#include "util.h"

#include <algorithm>
#include <cstdio>
#include <stdexcept>

namespace sous {

namespace {

constexpr step_status kAllStepStatuses[]{ step_status::pending,   step_status::running,
                                          step_status::succeeded, step_status::failed,
                                          step_status::skipped,   step_status::timed_out,
                                          step_status::cancelled };

constexpr run_status kAllRunStatuses[]{ run_status::completed,
                                        run_status::partial,
                                        run_status::failed,
                                        run_status::cancelled };

double seconds_between(time_point start, time_point end) {
  return std::chrono::duration<double>(end - start).count();
}

nlohmann::json optional_time(std::optional<time_point> const &tp) {
  return tp ? nlohmann::json(util_format_timestamp(*tp)) : nlohmann::json(nullptr);
}

nlohmann::json const &require(nlohmann::json const &json, char const *key) {
  auto const it{ json.find(key) };
  if (it == json.end()) {
    throw std::runtime_error(std::string{ "result_from_json: missing field '" } + key + "'");
  }
  return *it;
}

template <typename T>
T require_as(nlohmann::json const &json, char const *key) {
  try {
    return require(json, key).get<T>();
  } catch (nlohmann::json::type_error const &e) {
    throw std::runtime_error(std::string{ "result_from_json: field '" } + key +
                             "' has the wrong type: " + e.what());
  }
}

std::optional<time_point> read_optional_time(nlohmann::json const &json, char const *key) {
  auto const it{ json.find(key) };
  if (it == json.end() || it->is_null()) { return std::nullopt; }
  return util_parse_timestamp(it->get<std::string>());
}

std::vector<std::string> read_strings(nlohmann::json const &json, char const *key) {
  auto const it{ json.find(key) };
  if (it == json.end()) { return {}; }
  return require_as<std::vector<std::string>>(json, key);
}

nlohmann::json step_to_json(step_execution_result const &step) {
  nlohmann::json json{ { "step_name", step.step_name },
                       { "idx", step.idx },
                       { "status", step_status_name(step.status) },
                       { "attempts", step.attempts },
                       { "start_time", optional_time(step.start_time) },
                       { "end_time", optional_time(step.end_time) },
                       { "duration_seconds", step.duration_seconds() },
                       { "error", step.error ? nlohmann::json(*step.error)
                                             : nlohmann::json(nullptr) },
                       { "attempt_errors", step.attempt_errors },
                       { "outputs_created", step.outputs_created } };
  if (step.output) { json["output"] = value_to_json(*step.output); }
  return json;
}

step_execution_result step_from_json(nlohmann::json const &json) {
  if (!json.is_object()) {
    throw std::runtime_error("result_from_json: step result must be an object");
  }

  step_execution_result step{
    .step_name = require_as<std::string>(json, "step_name"),
    .idx = require_as<std::int64_t>(json, "idx"),
    .status = step_status_parse(require_as<std::string>(json, "status")),
    .attempts = require_as<int>(json, "attempts"),
    .start_time = read_optional_time(json, "start_time"),
    .end_time = read_optional_time(json, "end_time"),
  };

  if (auto const it{ json.find("error") }; it != json.end() && !it->is_null()) {
    step.error = it->get<std::string>();
  }
  if (auto const it{ json.find("output") }; it != json.end()) {
    step.output = value_from_json(*it);
  }
  step.attempt_errors = read_strings(json, "attempt_errors");
  step.outputs_created = read_strings(json, "outputs_created");
  return step;
}

std::string percent(double ratio) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f%%", ratio * 100.0);
  return buf;
}

}  // namespace

char const *step_status_name(step_status status) {
  switch (status) {
    case step_status::pending: return "pending";
    case step_status::running: return "running";
    case step_status::succeeded: return "succeeded";
    case step_status::failed: return "failed";
    case step_status::skipped: return "skipped";
    case step_status::timed_out: return "timed_out";
    case step_status::cancelled: return "cancelled";
  }
  return "unknown";
}

step_status step_status_parse(std::string_view name) {
  for (auto const s : kAllStepStatuses) {
    if (name == step_status_name(s)) { return s; }
  }
  throw std::runtime_error("unknown step status '" + std::string{ name } + "'");
}

bool step_status_is_terminal(step_status status) {
  return status != step_status::pending && status != step_status::running;
}

char const *run_status_name(run_status status) {
  switch (status) {
    case run_status::completed: return "completed";
    case run_status::partial: return "partial";
    case run_status::failed: return "failed";
    case run_status::cancelled: return "cancelled";
  }
  return "unknown";
}

run_status run_status_parse(std::string_view name) {
  for (auto const s : kAllRunStatuses) {
    if (name == run_status_name(s)) { return s; }
  }
  throw std::runtime_error("unknown run status '" + std::string{ name } + "'");
}

double step_execution_result::duration_seconds() const {
  if (!start_time || !end_time) { return 0.0; }
  return seconds_between(*start_time, *end_time);
}

double recipe_execution_result::execution_time_seconds() const {
  return seconds_between(start_time, end_time);
}

std::size_t recipe_execution_result::count(step_status status) const {
  return static_cast<std::size_t>(
      std::count_if(step_results.begin(),
                    step_results.end(),
                    [status](step_execution_result const &s) { return s.status == status; }));
}

double recipe_execution_result::success_rate() const {
  auto const succeeded{ count(step_status::succeeded) };
  auto const decided{ succeeded + count(step_status::failed) +
                      count(step_status::timed_out) };
  if (decided == 0) { return 1.0; }
  return static_cast<double>(succeeded) / static_cast<double>(decided);
}

bool recipe_execution_result::overall_success() const {
  return count(step_status::failed) == 0 && count(step_status::timed_out) == 0 &&
         global_errors.empty() && status != run_status::cancelled;
}

step_execution_result const *recipe_execution_result::find(std::string_view step_name) const {
  auto const it{ std::find_if(step_results.begin(),
                              step_results.end(),
                              [step_name](step_execution_result const &s) {
                                return s.step_name == step_name;
                              }) };
  return it == step_results.end() ? nullptr : &*it;
}

nlohmann::json result_to_json(recipe_execution_result const &result) {
  nlohmann::json counts = nlohmann::json::object();
  for (auto const s : kAllStepStatuses) { counts[step_status_name(s)] = result.count(s); }

  nlohmann::json steps = nlohmann::json::array();
  for (auto const &step : result.step_results) { steps.push_back(step_to_json(step)); }

  return nlohmann::json{ { "recipe_name", result.recipe_name },
                         { "recipe_path", result.recipe_path },
                         { "status", run_status_name(result.status) },
                         { "overall_success", result.overall_success() },
                         { "success_rate", result.success_rate() },
                         { "execution_time_seconds", result.execution_time_seconds() },
                         { "start_time", util_format_timestamp(result.start_time) },
                         { "end_time", util_format_timestamp(result.end_time) },
                         { "counts", counts },
                         { "global_errors", result.global_errors },
                         { "global_warnings", result.global_warnings },
                         { "context_keys_created", result.context_keys_created },
                         { "step_results", steps } };
}

recipe_execution_result result_from_json(nlohmann::json const &json) {
  if (!json.is_object()) {
    throw std::runtime_error("result_from_json: expected a JSON object");
  }

  recipe_execution_result result{
    .recipe_name = require_as<std::string>(json, "recipe_name"),
    .recipe_path = json.value("recipe_path", std::string{}),
    .status = run_status_parse(require_as<std::string>(json, "status")),
  };

  auto const &steps{ require(json, "step_results") };
  if (!steps.is_array()) {
    throw std::runtime_error("result_from_json: field 'step_results' must be an array");
  }
  for (auto const &step : steps) { result.step_results.push_back(step_from_json(step)); }

  result.global_errors = read_strings(json, "global_errors");
  result.global_warnings = read_strings(json, "global_warnings");
  result.context_keys_created = read_strings(json, "context_keys_created");
  result.start_time = util_parse_timestamp(require_as<std::string>(json, "start_time"));
  result.end_time = util_parse_timestamp(require_as<std::string>(json, "end_time"));
  return result;
}

void result_write_report(recipe_execution_result const &result,
                         std::filesystem::path const &path) {
  util_write_text_file(path, json_dump(result_to_json(result), 2) + "\n");
}

std::vector<std::string> result_summary_lines(recipe_execution_result const &result) {
  std::vector<std::string> lines;
  lines.push_back("Recipe: " + result.recipe_name + " (" + run_status_name(result.status) +
                  ")");
  lines.push_back("Duration: " + util_format_seconds(result.execution_time_seconds()));
  lines.push_back("Steps: " + std::to_string(result.count(step_status::succeeded)) +
                  " succeeded, " + std::to_string(result.count(step_status::failed)) +
                  " failed, " + std::to_string(result.count(step_status::timed_out)) +
                  " timed out, " + std::to_string(result.count(step_status::skipped)) +
                  " skipped, " + std::to_string(result.count(step_status::cancelled)) +
                  " cancelled (success rate " + percent(result.success_rate()) + ")");

  for (auto const &step : result.step_results) {
    std::string line{ "  [" + std::string{ step_status_name(step.status) } + "] " +
                      step.step_name };
    if (step.attempts > 0) {
      line += " (" + std::to_string(step.attempts) +
              (step.attempts == 1 ? " attempt, " : " attempts, ") +
              util_format_seconds(step.duration_seconds()) + ")";
    }
    if (step.error) { line += ": " + *step.error; }
    lines.push_back(std::move(line));
  }

  if (!result.global_errors.empty()) {
    lines.push_back("Errors:");
    for (auto const &e : result.global_errors) { lines.push_back("  - " + e); }
  }
  if (!result.global_warnings.empty()) {
    lines.push_back("Warnings:");
    for (auto const &w : result.global_warnings) { lines.push_back("  - " + w); }
  }
  return lines;
}

}  // namespace sous
