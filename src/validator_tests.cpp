#include "validator.h"

#include "errors.h"
#include "step_resolver.h"

#include "doctest.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

sous::value make_step(std::string name,
                      std::int64_t idx,
                      sous::value_array deps = {},
                      sous::value_table extra = {}) {
  sous::value_table step{ { "name", std::move(name) },
                          { "idx", idx },
                          { "module", "builtin" },
                          { "function", "set" } };
  if (!deps.empty()) { step["depends_on"] = std::move(deps); }
  for (auto &[k, v] : extra) { step[k] = std::move(v); }
  return step;
}

sous::value make_recipe(sous::value_array steps) {
  return sous::value_table{ { "name", "demo" },
                            { "version", "1.0.0" },
                            { "steps", std::move(steps) } };
}

std::vector<sous::validation_message> with_code(sous::recipe_spec const &spec,
                                                sous::validation_code code) {
  std::vector<sous::validation_message> result;
  for (auto const &m : spec.validation_messages) {
    if (m.code == code) { result.push_back(m); }
  }
  return result;
}

}  // namespace

TEST_CASE("validator: well-formed recipe has no errors") {
  auto const spec{ sous::validate_recipe(make_recipe(
      { make_step("a", 1), make_step("b", 2, { "a" }), make_step("c", 3, { "a", "b" }) })) };

  CHECK(spec.is_valid());
  CHECK(spec.errors().empty());
  CHECK(spec.warnings().empty());
  CHECK(spec.metadata.name == "demo");
  CHECK(spec.metadata.version == "1.0.0");
  REQUIRE(spec.steps.size() == 3);
  CHECK(spec.steps[2].depends_on == std::vector<std::string>{ "a", "b" });

  auto const info{ with_code(spec, sous::validation_code::recipe_info) };
  REQUIRE(info.size() == 1);
  CHECK(info[0].severity == sous::validation_severity::info);
  CHECK(info[0].message == "recipe defines 3 steps");
}

TEST_CASE("validator: duplicate idx yields exactly one error naming both steps") {
  auto const spec{ sous::validate_recipe(
      make_recipe({ make_step("A", 1), make_step("B", 2, { "A" }), make_step("C", 1) })) };

  auto const errors{ spec.errors() };
  REQUIRE(errors.size() == 1);
  CHECK(errors[0].code == sous::validation_code::duplicate_index);
  CHECK(errors[0].message == "duplicate idx 1: A, C");
  CHECK_FALSE(spec.is_valid());
}

TEST_CASE("validator: cycles are errors naming the members") {
  auto const spec{ sous::validate_recipe(make_recipe(
      { make_step("a", 1, { "c" }), make_step("b", 2, { "a" }), make_step("c", 3, { "b" }) })) };

  auto const cycles{ with_code(spec, sous::validation_code::circular_dependency) };
  REQUIRE(cycles.size() == 1);
  CHECK(cycles[0].severity == sous::validation_severity::error);
  CHECK(cycles[0].message == "dependency cycle: a -> c -> b -> a");
  CHECK_FALSE(spec.is_valid());
}

TEST_CASE("validator: self dependency is a cycle") {
  auto const spec{ sous::validate_recipe(make_recipe({ make_step("loop", 1, { "loop" }) })) };
  auto const cycles{ with_code(spec, sous::validation_code::circular_dependency) };
  REQUIRE(cycles.size() == 1);
  CHECK(cycles[0].location == "loop");
  CHECK(with_code(spec, sous::validation_code::missing_dependency).empty());
}

TEST_CASE("validator: any cycle makes the recipe invalid") {
  // Every ring size up to six, entered from a different step each time.
  for (int size{ 1 }; size <= 6; ++size) {
    sous::value_array steps;
    for (int i{ 0 }; i < size; ++i) {
      auto const dep{ "s" + std::to_string((i + 1) % size) };
      steps.push_back(make_step("s" + std::to_string(i), i + 1, { dep }));
    }
    auto const spec{ sous::validate_recipe(make_recipe(std::move(steps))) };
    CAPTURE(size);
    CHECK_FALSE(spec.is_valid());
    CHECK_FALSE(with_code(spec, sous::validation_code::circular_dependency).empty());
  }
}

TEST_CASE("validator: missing dependency is an error") {
  auto const spec{ sous::validate_recipe(make_recipe({ make_step("a", 1, { "ghost" }) })) };
  auto const missing{ with_code(spec, sous::validation_code::missing_dependency) };
  REQUIRE(missing.size() == 1);
  CHECK(missing[0].location == "a");
  CHECK(missing[0].message == "depends on unknown step 'ghost'");
}

TEST_CASE("validator: dependency on a later idx is an order warning") {
  auto const spec{ sous::validate_recipe(
      make_recipe({ make_step("first", 1, { "second" }), make_step("second", 2) })) };
  CHECK(spec.is_valid());
  auto const conflicts{ with_code(spec, sous::validation_code::order_conflict) };
  REQUIRE(conflicts.size() == 1);
  CHECK(conflicts[0].severity == sous::validation_severity::warning);
  CHECK(conflicts[0].location == "first");
}

TEST_CASE("validator: depends_on never reorders steps") {
  auto const spec{ sous::validate_recipe(make_recipe(
      { make_step("z", 30), make_step("x", 10, { "z" }), make_step("y", 20) })) };
  REQUIRE(spec.steps.size() == 3);
  CHECK(spec.steps[0].name == "x");
  CHECK(spec.steps[1].name == "y");
  CHECK(spec.steps[2].name == "z");
}

TEST_CASE("validator: missing top-level fields are errors, checks keep running") {
  sous::value const raw{ sous::value_table{
      { "steps", sous::value_array{ make_step("a", 1), make_step("b", 1) } } } };
  auto const spec{ sous::validate_recipe(raw) };

  auto const missing{ with_code(spec, sous::validation_code::missing_field) };
  REQUIRE(missing.size() == 1);
  CHECK(missing[0].message == "missing required field 'name'");
  CHECK(with_code(spec, sous::validation_code::duplicate_index).size() == 1);
}

TEST_CASE("validator: missing steps field is an error") {
  auto const spec{ sous::validate_recipe(sous::value_table{ { "name", "x" } }) };
  auto const missing{ with_code(spec, sous::validation_code::missing_field) };
  REQUIRE(missing.size() == 1);
  CHECK(missing[0].message == "missing required field 'steps'");
}

TEST_CASE("validator: empty steps is a warning") {
  auto const spec{ sous::validate_recipe(make_recipe({})) };
  CHECK(spec.is_valid());
  CHECK(with_code(spec, sous::validation_code::empty_steps).size() == 1);
}

TEST_CASE("validator: per-step field problems are reported with locations") {
  sous::value_array steps{
    sous::value_table{ { "idx", 1 }, { "module", "m" }, { "function", "f" } },
    sous::value_table{ { "name", "noidx" }, { "module", "m" }, { "function", "f" } },
    make_step("badidx", 0, {}, { { "idx", 1.5 } }),
    make_step("negative", -3),
    sous::value_table{ { "name", "nocall" }, { "idx", 9 } },
    "not a table",
  };
  auto const spec{ sous::validate_recipe(make_recipe(std::move(steps))) };

  auto const step_fields{ with_code(spec, sous::validation_code::missing_step_field) };
  REQUIRE(step_fields.size() == 4);
  CHECK(step_fields[0].location == "steps[0]");
  CHECK(step_fields[1].location == "noidx");
  CHECK(step_fields[2].message == "missing callable reference field 'module'");
  CHECK(step_fields[3].message == "missing callable reference field 'function'");

  auto const types{ with_code(spec, sous::validation_code::invalid_type) };
  REQUIRE(types.size() == 2);
  CHECK(types[0].message == "idx must be an integer, got number");
  CHECK(types[1].location == "steps[5]");

  CHECK(with_code(spec, sous::validation_code::negative_index).size() == 1);
}

TEST_CASE("validator: retry and timeout values are range checked") {
  auto const spec{ sous::validate_recipe(make_recipe({
      make_step("a",
                1,
                {},
                { { "retry",
                    sous::value_table{ { "max_attempts", 0 }, { "delay_seconds", -1 } } } }),
      make_step("b", 2, {}, { { "timeout_seconds", 0 } }),
      make_step("c", 3, {}, { { "retry", "often" } }),
  })) };

  CHECK(with_code(spec, sous::validation_code::invalid_field_value).size() == 3);
  CHECK(with_code(spec, sous::validation_code::invalid_type).size() == 1);
}

TEST_CASE("validator: optional step fields populate the step spec") {
  auto const spec{ sous::validate_recipe(make_recipe({ make_step(
      "full",
      4,
      {},
      { { "args", sous::value_table{ { "k", "v" } } },
        { "retry", sous::value_table{ { "max_attempts", 3 }, { "delay_seconds", 0.5 } } },
        { "timeout_seconds", 2 },
        { "enabled", false },
        { "description", "does everything" } }) })) };

  REQUIRE(spec.is_valid());
  auto const *step{ spec.find_step("full") };
  REQUIRE(step != nullptr);
  CHECK(step->module_ref == "builtin");
  CHECK(step->function_ref == "set");
  CHECK(step->args.at("k") == sous::value{ "v" });
  REQUIRE(step->retry.has_value());
  CHECK(step->retry->max_attempts == 3);
  CHECK(step->retry->delay_seconds == doctest::Approx(0.5));
  REQUIRE(step->timeout_seconds.has_value());
  CHECK(*step->timeout_seconds == doctest::Approx(2.0));
  CHECK_FALSE(step->enabled);
  CHECK(step->description == "does everything");
}

TEST_CASE("validator: duplicate names and repeated dependencies") {
  auto const spec{ sous::validate_recipe(make_recipe(
      { make_step("dup", 1), make_step("dup", 2), make_step("c", 3, { "dup", "dup" }) })) };

  auto const names{ with_code(spec, sous::validation_code::duplicate_step_name) };
  REQUIRE(names.size() == 1);
  CHECK(names[0].message == "step name 'dup' is used by 2 steps");

  auto const deps{ with_code(spec, sous::validation_code::invalid_dependencies) };
  REQUIRE(deps.size() == 1);
  CHECK(deps[0].severity == sous::validation_severity::warning);
}

TEST_CASE("validator: non-semver version is a warning") {
  auto raw{ make_recipe({ make_step("a", 1) }) };
  (*raw.get<sous::value_table>())["version"] = "latest";
  auto const spec{ sous::validate_recipe(raw) };
  CHECK(spec.is_valid());
  CHECK(with_code(spec, sous::validation_code::invalid_field_value).size() == 1);
}

TEST_CASE("validator: structurally malformed input throws") {
  CHECK_THROWS_AS(sous::validate_recipe(sous::value{ "just a string" }),
                  sous::malformed_input_error);
  CHECK_THROWS_WITH_AS(
      sous::validate_recipe(sous::value_table{ { "name", "x" }, { "steps", 5 } }),
      "recipe field 'steps' must be an array, got integer",
      sous::malformed_input_error);
}

TEST_CASE("validator: content hash is stable and content sensitive") {
  auto const a{ sous::validate_recipe(make_recipe({ make_step("a", 1) })) };
  auto const b{ sous::validate_recipe(make_recipe({ make_step("a", 1) })) };
  auto const c{ sous::validate_recipe(make_recipe({ make_step("a", 2) })) };

  CHECK(a.metadata.content_hash.size() == 64);
  CHECK(a.metadata.content_hash == b.metadata.content_hash);
  CHECK(a.metadata.content_hash != c.metadata.content_hash);
}

TEST_CASE("validator: unresolvable callables are warnings when a resolver is given") {
  sous::registry_resolver registry;
  sous::builtin_steps_install(registry);

  auto raw{ make_recipe({ make_step("a", 1),
                          make_step("b", 2, {}, { { "function", "nope" } }) }) };
  auto const spec{ sous::validate_recipe(raw, &registry) };

  CHECK(spec.is_valid());
  auto const unresolved{ with_code(spec, sous::validation_code::unresolved_callable) };
  REQUIRE(unresolved.size() == 1);
  CHECK(unresolved[0].location == "b");
  CHECK(unresolved[0].severity == sous::validation_severity::warning);

  CHECK(with_code(sous::validate_recipe(raw), sous::validation_code::unresolved_callable)
            .empty());
}

TEST_CASE("validator: custom checks run and throwing checks become errors") {
  sous::validator v;
  v.add_check("require-author", [](sous::value_table const &raw) {
    std::vector<sous::validation_message> out;
    if (!raw.contains("author")) {
      out.push_back({ .severity = sous::validation_severity::warning,
                      .location = "recipe",
                      .message = "no author",
                      .code = sous::validation_code::missing_field });
    }
    return out;
  });
  v.add_check("explodes", [](sous::value_table const &) -> std::vector<sous::validation_message> {
    throw std::runtime_error("boom");
  });

  auto const spec{ v.validate(make_recipe({ make_step("a", 1) })) };
  CHECK(spec.warnings().size() == 1);
  auto const errors{ with_code(spec, sous::validation_code::validator_error) };
  REQUIRE(errors.size() == 1);
  CHECK(errors[0].message == "check 'explodes' failed: boom");
}

TEST_CASE("validator: config and metadata are carried over") {
  sous::value_table raw{ { "name", "meta" },
                         { "description", "d" },
                         { "author", "ops" },
                         { "tags", sous::value_array{ "x", "y" } },
                         { "config", sous::value_table{ { "region", "eu" } } },
                         { "steps", sous::value_array{ make_step("a", 1) } } };
  auto const spec{ sous::validate_recipe(raw) };

  CHECK(spec.is_valid());
  CHECK(spec.metadata.author == "ops");
  CHECK(spec.metadata.tags == std::vector<std::string>{ "x", "y" });
  CHECK(spec.config.at("region") == sous::value{ "eu" });
}

TEST_CASE("validator: non-finite timeouts and delays are rejected") {
  auto const inf{ std::numeric_limits<double>::infinity() };
  auto const spec{ sous::validate_recipe(make_recipe({
      make_step("a", 1, {}, { { "timeout_seconds", inf } }),
      make_step("b",
                2,
                {},
                { { "retry",
                    sous::value_table{ { "max_attempts", 2 },
                                       { "delay_seconds", std::nan("") } } } }),
      make_step("c", 3, {}, { { "timeout_seconds", 1e12 } }),
  })) };

  auto const bad{ with_code(spec, sous::validation_code::invalid_field_value) };
  REQUIRE(bad.size() == 2);
  CHECK(bad[0].location == "a");
  CHECK(bad[1].location == "b");
}

TEST_CASE("validator: invalid utf-8 in the recipe does not throw") {
  sous::recipe_spec spec;
  CHECK_NOTHROW(spec = sous::validate_recipe(make_recipe(
                    { make_step("a", 1, {}, { { "args",
                                                sous::value_table{
                                                    { "message", "caf\xe9" } } } }) })));
  CHECK(spec.is_valid());
  CHECK(spec.metadata.content_hash.size() == 64);
}
