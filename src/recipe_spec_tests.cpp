#include "recipe_spec.h"

#include "doctest.h"

namespace {

sous::recipe_spec make_spec() {
  sous::recipe_spec spec;
  spec.metadata.name = "deploy";
  spec.metadata.version = "1.0.0";
  spec.steps.push_back(sous::step_spec{ .name = "build", .idx = 1 });
  spec.steps.push_back(sous::step_spec{ .name = "ship", .idx = 2 });
  return spec;
}

}  // namespace

TEST_CASE("validation_message renders severity, code and location") {
  sous::validation_message const msg{ .severity = sous::validation_severity::error,
                                      .location = "recipe",
                                      .message = "duplicate idx 1: A, C",
                                      .code = sous::validation_code::duplicate_index };
  CHECK(msg.to_string() == "ERROR [DUPLICATE_INDEX] at recipe: duplicate idx 1: A, C");
}

TEST_CASE("recipe_spec is valid until an error message appears") {
  auto spec{ make_spec() };
  CHECK(spec.is_valid());

  spec.validation_messages.push_back({ .severity = sous::validation_severity::warning,
                                       .location = "ship",
                                       .message = "w",
                                       .code = sous::validation_code::order_conflict });
  CHECK(spec.is_valid());
  CHECK(spec.warnings().size() == 1);

  spec.validation_messages.push_back(
      { .severity = sous::validation_severity::error,
        .location = "ship",
        .message = "e",
        .code = sous::validation_code::missing_dependency });
  CHECK_FALSE(spec.is_valid());
  REQUIRE(spec.errors().size() == 1);
  CHECK(spec.errors()[0].code == sous::validation_code::missing_dependency);
}

TEST_CASE("recipe_spec find_step looks up by name") {
  auto const spec{ make_spec() };
  REQUIRE(spec.find_step("ship") != nullptr);
  CHECK(spec.find_step("ship")->idx == 2);
  CHECK(spec.find_step("missing") == nullptr);
}

TEST_CASE("recipe_spec summary counts steps and messages") {
  auto spec{ make_spec() };
  spec.validation_messages.push_back({ .severity = sous::validation_severity::warning,
                                       .location = "recipe",
                                       .message = "w",
                                       .code = sous::validation_code::empty_steps });
  CHECK(spec.summary() == "recipe 'deploy' 1.0.0: 2 steps, 0 errors, 1 warning");
}

TEST_CASE("validation names cover every severity") {
  CHECK(std::string{ sous::validation_severity_name(sous::validation_severity::info) } ==
        "INFO");
  CHECK(std::string{ sous::validation_severity_name(
            sous::validation_severity::warning) } == "WARNING");
  CHECK(std::string{ sous::validation_code_name(
            sous::validation_code::circular_dependency) } == "CIRCULAR_DEPENDENCY");
}
