#include "validator.h"

#include "blake3_util.h"
#include "errors.h"
#include "planner.h"
#include "step_resolver.h"
#include "trace.h"
#include "tui.h"
#include "util.h"
#include "version.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <iterator>
#include <map>
#include <optional>
#include <set>
#include <unordered_map>

namespace sous {

namespace {

using messages_t = std::vector<validation_message>;

// Lua cannot tell an empty array from an empty table, so both count as empty arrays.
std::optional<value_array> as_array(value const &val) {
  if (auto const *arr{ val.get<value_array>() }) { return *arr; }
  if (auto const *tbl{ val.get<value_table>() }; tbl && tbl->empty()) {
    return value_array{};
  }
  return std::nullopt;
}

bool is_table_like(value const &val) {
  if (val.is_table()) { return true; }
  auto const *arr{ val.get<value_array>() };
  return arr && arr->empty();
}

value const *field(value_table const &table, char const *key) {
  auto const it{ table.find(key) };
  return it == table.end() || it->second.is_nil() ? nullptr : &it->second;
}

std::optional<std::string> string_field(value_table const &table, char const *key) {
  auto const *val{ field(table, key) };
  if (!val) { return std::nullopt; }
  auto const *s{ val->get<std::string>() };
  if (!s) { return std::nullopt; }
  return *s;
}

void add(messages_t &out,
         validation_severity severity,
         validation_code code,
         std::string location,
         std::string message) {
  out.push_back(validation_message{ .severity = severity,
                                    .location = std::move(location),
                                    .message = std::move(message),
                                    .code = code });
}

void error(messages_t &out, validation_code code, std::string loc, std::string msg) {
  add(out, validation_severity::error, code, std::move(loc), std::move(msg));
}

void warning(messages_t &out, validation_code code, std::string loc, std::string msg) {
  add(out, validation_severity::warning, code, std::move(loc), std::move(msg));
}

// Best-effort view of one entry of the raw steps array.
struct raw_step {
  std::size_t position;
  value_table const *table;  // null when the entry is not a table
  std::optional<std::string> name;
  std::optional<std::int64_t> idx;
  std::vector<std::string> depends_on;  // string entries only, duplicates removed
  std::string location;
};

std::vector<raw_step> collect_steps(value_array const &steps) {
  std::vector<raw_step> result;
  for (std::size_t i{ 0 }; i < steps.size(); ++i) {
    raw_step rs{ .position = i,
                 .table = steps[i].get<value_table>(),
                 .name = std::nullopt,
                 .idx = std::nullopt,
                 .depends_on = {},
                 .location = "steps[" + std::to_string(i) + "]" };

    if (rs.table) {
      if (auto name{ string_field(*rs.table, "name") }; name && !name->empty()) {
        rs.name = *name;
        rs.location = *name;
      }
      if (auto const *idx{ field(*rs.table, "idx") }) {
        if (auto const *i64{ idx->get<std::int64_t>() }) { rs.idx = *i64; }
      }
      if (auto const *deps{ field(*rs.table, "depends_on") }) {
        if (auto const arr{ as_array(*deps) }) {
          for (auto const &dep : *arr) {
            auto const *s{ dep.get<std::string>() };
            if (s && std::find(rs.depends_on.begin(), rs.depends_on.end(), *s) ==
                         rs.depends_on.end()) {
              rs.depends_on.push_back(*s);
            }
          }
        }
      }
    }
    result.push_back(std::move(rs));
  }
  return result;
}

struct check_input {
  value_table const &raw;
  std::vector<raw_step> const &steps;
  bool steps_present;
};

void check_recipe_fields(check_input const &in, messages_t &out) {
  if (auto const *name{ field(in.raw, "name") }) {
    auto const *s{ name->get<std::string>() };
    if (!s) {
      error(out,
            validation_code::invalid_type,
            "recipe",
            std::string{ "field 'name' must be a string, got " } + name->type_name());
    } else if (s->empty()) {
      error(out, validation_code::invalid_field_value, "recipe", "field 'name' is empty");
    }
  } else {
    error(out, validation_code::missing_field, "recipe", "missing required field 'name'");
  }

  if (!in.steps_present) {
    error(out, validation_code::missing_field, "recipe", "missing required field 'steps'");
  } else if (in.steps.empty()) {
    warning(out, validation_code::empty_steps, "recipe", "recipe defines no steps");
  }

  for (auto const *key : { "version", "description", "author" }) {
    auto const *val{ field(in.raw, key) };
    if (val && !val->is_string()) {
      warning(out,
              validation_code::invalid_type,
              "recipe",
              std::string{ "field '" } + key + "' should be a string, got " +
                  val->type_name());
    }
  }

  if (auto const version{ string_field(in.raw, "version") };
      version && !version_is_semver(*version)) {
    warning(out,
            validation_code::invalid_field_value,
            "recipe",
            "version '" + *version + "' is not a semantic version");
  }

  if (auto const *tags{ field(in.raw, "tags") }) {
    auto const arr{ as_array(*tags) };
    bool const all_strings{ arr && std::all_of(arr->begin(), arr->end(), [](value const &v) {
                              return v.is_string();
                            }) };
    if (!all_strings) {
      warning(out,
              validation_code::invalid_type,
              "recipe",
              "field 'tags' should be an array of strings");
    }
  }

  if (auto const *config{ field(in.raw, "config") }; config && !is_table_like(*config)) {
    error(out,
          validation_code::invalid_type,
          "recipe",
          std::string{ "field 'config' must be a table, got " } + config->type_name());
  }
}

void check_retry(value const &retry, std::string const &loc, messages_t &out) {
  auto const *tbl{ retry.get<value_table>() };
  if (!tbl) {
    error(out,
          validation_code::invalid_type,
          loc,
          std::string{ "retry must be a table, got " } + retry.type_name());
    return;
  }

  if (auto const *attempts{ field(*tbl, "max_attempts") }) {
    auto const *n{ attempts->get<std::int64_t>() };
    if (!n || *n < 1) {
      error(out,
            validation_code::invalid_field_value,
            loc,
            "retry.max_attempts must be an integer >= 1, got " +
                value_to_display(*attempts));
    }
  }

  if (auto const *delay{ field(*tbl, "delay_seconds") }) {
    auto const d{ delay->as_number() };
    if (!d || !std::isfinite(*d) || *d < 0.0) {
      error(out,
            validation_code::invalid_field_value,
            loc,
            "retry.delay_seconds must be a finite number >= 0, got " + value_to_display(*delay));
    }
  }
}

void check_step_fields(check_input const &in, messages_t &out) {
  for (auto const &rs : in.steps) {
    auto const &loc{ rs.location };
    if (!rs.table) {
      error(out, validation_code::invalid_type, loc, "step entry must be a table");
      continue;
    }
    auto const &step{ *rs.table };

    if (auto const *name{ field(step, "name") }) {
      if (!rs.name) {
        error(out,
              validation_code::invalid_type,
              loc,
              "step name must be a non-empty string, got " + value_to_display(*name));
      }
    } else {
      error(out, validation_code::missing_step_field, loc, "missing required field 'name'");
    }

    if (auto const *idx{ field(step, "idx") }) {
      if (!rs.idx) {
        error(out,
              validation_code::invalid_type,
              loc,
              std::string{ "idx must be an integer, got " } + idx->type_name());
      } else if (*rs.idx < 0) {
        error(out,
              validation_code::negative_index,
              loc,
              "idx must be non-negative, got " + std::to_string(*rs.idx));
      }
    } else {
      error(out, validation_code::missing_step_field, loc, "missing required field 'idx'");
    }

    for (auto const *key : { "module", "function" }) {
      auto const *val{ field(step, key) };
      if (!val) {
        error(out,
              validation_code::missing_step_field,
              loc,
              std::string{ "missing callable reference field '" } + key + "'");
      } else if (!val->is_string() || val->get<std::string>()->empty()) {
        error(out,
              validation_code::invalid_type,
              loc,
              std::string{ "field '" } + key + "' must be a non-empty string");
      }
    }

    if (auto const *args{ field(step, "args") }; args && !is_table_like(*args)) {
      error(out,
            validation_code::invalid_type,
            loc,
            std::string{ "args must be a table, got " } + args->type_name());
    }

    if (auto const *deps{ field(step, "depends_on") }) {
      if (auto const arr{ as_array(*deps) }) {
        std::set<std::string> seen;
        for (auto const &dep : *arr) {
          auto const *s{ dep.get<std::string>() };
          if (!s || s->empty()) {
            error(out,
                  validation_code::invalid_dependencies,
                  loc,
                  "depends_on entries must be step names, got " + value_to_display(dep));
          } else if (!seen.insert(*s).second) {
            warning(out,
                    validation_code::invalid_dependencies,
                    loc,
                    "depends_on lists '" + *s + "' more than once");
          }
        }
      } else {
        error(out,
              validation_code::invalid_dependencies,
              loc,
              std::string{ "depends_on must be an array, got " } + deps->type_name());
      }
    }

    if (auto const *retry{ field(step, "retry") }) { check_retry(*retry, loc, out); }

    if (auto const *timeout{ field(step, "timeout_seconds") }) {
      auto const t{ timeout->as_number() };
      if (!t || !std::isfinite(*t) || *t <= 0.0) {
        error(out,
              validation_code::invalid_field_value,
              loc,
              "timeout_seconds must be a finite number > 0, got " + value_to_display(*timeout));
      }
    }

    if (auto const *enabled{ field(step, "enabled") }; enabled && !enabled->is_bool()) {
      error(out,
            validation_code::invalid_type,
            loc,
            std::string{ "enabled must be a boolean, got " } + enabled->type_name());
    }

    if (auto const *desc{ field(step, "description") }; desc && !desc->is_string()) {
      warning(out,
              validation_code::invalid_type,
              loc,
              std::string{ "description should be a string, got " } + desc->type_name());
    }
  }
}

void check_unique_names(check_input const &in, messages_t &out) {
  std::map<std::string, std::size_t> counts;
  std::vector<std::string> order;
  for (auto const &rs : in.steps) {
    if (!rs.name) { continue; }
    if (counts[*rs.name]++ == 0) { order.push_back(*rs.name); }
  }

  for (auto const &name : order) {
    if (auto const count{ counts[name] }; count > 1) {
      error(out,
            validation_code::duplicate_step_name,
            name,
            "step name '" + name + "' is used by " + std::to_string(count) + " steps");
    }
  }
}

void check_unique_indices(check_input const &in, messages_t &out) {
  std::map<std::int64_t, std::vector<std::string>> by_idx;
  for (auto const &rs : in.steps) {
    if (rs.idx) { by_idx[*rs.idx].push_back(rs.location); }
  }

  for (auto const &[idx, owners] : by_idx) {
    if (owners.size() > 1) {
      error(out,
            validation_code::duplicate_index,
            "recipe",
            "duplicate idx " + std::to_string(idx) + ": " + util_join(owners, ", "));
    }
  }
}

void check_dependencies_exist(check_input const &in, messages_t &out) {
  std::set<std::string> names;
  for (auto const &rs : in.steps) {
    if (rs.name) { names.insert(*rs.name); }
  }

  for (auto const &rs : in.steps) {
    for (auto const &dep : rs.depends_on) {
      if (!names.contains(dep)) {
        error(out,
              validation_code::missing_dependency,
              rs.location,
              "depends on unknown step '" + dep + "'");
      }
    }
  }
}

std::vector<step_spec> dependency_graph(std::vector<raw_step> const &steps) {
  std::vector<step_spec> graph;
  for (auto const &rs : steps) {
    if (!rs.name) { continue; }
    graph.push_back(step_spec{ .name = *rs.name,
                               .idx = rs.idx.value_or(0),
                               .depends_on = rs.depends_on });
  }
  return graph;
}

void check_cycles(check_input const &in, messages_t &out) {
  for (auto const &cycle : plan_find_cycles(dependency_graph(in.steps))) {
    error(out,
          validation_code::circular_dependency,
          cycle.front(),
          "dependency cycle: " + util_join(cycle, " -> "));
  }
}

void check_order_consistency(check_input const &in, messages_t &out) {
  std::unordered_map<std::string, std::int64_t> idx_by_name;
  for (auto const &rs : in.steps) {
    if (rs.name && rs.idx) { idx_by_name.emplace(*rs.name, *rs.idx); }
  }

  for (auto const &rs : in.steps) {
    if (!rs.name || !rs.idx) { continue; }
    for (auto const &dep : rs.depends_on) {
      if (dep == *rs.name) { continue; }
      auto const it{ idx_by_name.find(dep) };
      if (it == idx_by_name.end() || it->second < *rs.idx) { continue; }
      warning(out,
              validation_code::order_conflict,
              rs.location,
              "depends on '" + dep + "' (idx " + std::to_string(it->second) +
                  ") which does not run before it (idx " + std::to_string(*rs.idx) + ")");
    }
  }
}

void check_resolvable(check_input const &in,
                      step_resolver const &resolver,
                      messages_t &out) {
  for (auto const &rs : in.steps) {
    if (!rs.table) { continue; }
    auto const module_ref{ string_field(*rs.table, "module") };
    auto const function_ref{ string_field(*rs.table, "function") };
    if (!module_ref || !function_ref) { continue; }

    try {
      (void)resolver.resolve(*module_ref, *function_ref);
    } catch (std::exception const &e) {
      warning(out, validation_code::unresolved_callable, rs.location, e.what());
    }
  }
}

std::vector<step_spec> build_steps(std::vector<raw_step> const &steps) {
  std::vector<step_spec> result;
  for (auto const &rs : steps) {
    if (!rs.table || !rs.name || !rs.idx) { continue; }
    auto const &tbl{ *rs.table };

    step_spec spec{ .name = *rs.name,
                    .idx = *rs.idx,
                    .module_ref = string_field(tbl, "module").value_or(""),
                    .function_ref = string_field(tbl, "function").value_or(""),
                    .depends_on = rs.depends_on,
                    .description = string_field(tbl, "description").value_or("") };

    if (auto const *args{ field(tbl, "args") }) {
      if (auto const *t{ args->get<value_table>() }) { spec.args = *t; }
    }

    if (auto const *retry{ field(tbl, "retry") }) {
      if (auto const *t{ retry->get<value_table>() }) {
        retry_policy policy;
        if (auto const *n{ field(*t, "max_attempts") }) {
          if (auto const *i{ n->get<std::int64_t>() }; i && *i >= 1) {
            policy.max_attempts = static_cast<int>(*i);
          }
        }
        if (auto const *d{ field(*t, "delay_seconds") }) {
          policy.delay_seconds = std::max(0.0, d->as_number().value_or(0.0));
        }
        spec.retry = policy;
      }
    }

    if (auto const *timeout{ field(tbl, "timeout_seconds") }) {
      if (auto const t{ timeout->as_number() }; t && *t > 0.0) { spec.timeout_seconds = *t; }
    }

    if (auto const *enabled{ field(tbl, "enabled") }) {
      if (auto const *b{ enabled->get<bool>() }) { spec.enabled = *b; }
    }

    result.push_back(std::move(spec));
  }

  std::stable_sort(result.begin(), result.end(), [](step_spec const &a, step_spec const &b) {
    return a.idx < b.idx;
  });
  return result;
}

recipe_metadata build_metadata(value_table const &raw, value const &whole) {
  recipe_metadata meta{ .name = string_field(raw, "name").value_or(""),
                        .version = string_field(raw, "version").value_or(""),
                        .description = string_field(raw, "description").value_or(""),
                        .author = string_field(raw, "author").value_or("") };

  if (auto const *tags{ field(raw, "tags") }) {
    if (auto const arr{ as_array(*tags) }) {
      for (auto const &tag : *arr) {
        if (auto const *s{ tag.get<std::string>() }) { meta.tags.push_back(*s); }
      }
    }
  }

  meta.content_hash = blake3_hex(value_to_canonical_json(whole));
  return meta;
}

}  // namespace

validator::validator(step_resolver const *resolver) : resolver_{ resolver } {}

void validator::add_check(std::string name, check_fn check) {
  checks_.emplace_back(std::move(name), std::move(check));
}

recipe_spec validator::validate(value const &raw) const {
  auto const *raw_table{ raw.get<value_table>() };
  if (!raw_table) {
    throw malformed_input_error(std::string{ "recipe must be a table, got " } +
                                raw.type_name());
  }

  value_array steps_array;
  auto const *steps_val{ field(*raw_table, "steps") };
  if (steps_val) {
    auto arr{ as_array(*steps_val) };
    if (!arr) {
      throw malformed_input_error(std::string{ "recipe field 'steps' must be an array, got " } +
                                  steps_val->type_name());
    }
    steps_array = std::move(*arr);
  }

  auto const steps{ collect_steps(steps_array) };
  check_input const in{ .raw = *raw_table, .steps = steps, .steps_present = steps_val != nullptr };

  messages_t messages;
  check_recipe_fields(in, messages);
  check_step_fields(in, messages);
  check_unique_names(in, messages);
  check_unique_indices(in, messages);
  check_dependencies_exist(in, messages);
  check_cycles(in, messages);
  check_order_consistency(in, messages);
  if (resolver_) { check_resolvable(in, *resolver_, messages); }

  for (auto const &[name, check] : checks_) {
    try {
      auto extra{ check(*raw_table) };
      messages.insert(messages.end(),
                      std::make_move_iterator(extra.begin()),
                      std::make_move_iterator(extra.end()));
    } catch (std::exception const &e) {
      error(messages,
            validation_code::validator_error,
            "recipe",
            "check '" + name + "' failed: " + e.what());
    }
  }

  recipe_spec spec{ .metadata = build_metadata(*raw_table, raw),
                    .steps = build_steps(steps),
                    .validation_messages = {},
                    .config = {} };

  if (auto const *config{ field(*raw_table, "config") }) {
    if (auto const *t{ config->get<value_table>() }) { spec.config = *t; }
  }

  add(messages,
      validation_severity::info,
      validation_code::recipe_info,
      "recipe",
      "recipe defines " + std::to_string(steps.size()) + " step" +
          (steps.size() == 1 ? "" : "s"));
  spec.validation_messages = std::move(messages);

  auto const error_count{ spec.errors().size() };
  auto const warning_count{ spec.warnings().size() };
  SOUS_TRACE_RECIPE_VALIDATED(spec.metadata.name, steps.size(), error_count, warning_count);
  tui::debug("validator: %s", spec.summary().c_str());

  return spec;
}

recipe_spec validate_recipe(value const &raw, step_resolver const *resolver) {
  return validator{ resolver }.validate(raw);
}

}  // namespace sous
