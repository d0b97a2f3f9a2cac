#include "runner.h"

#include "errors.h"
#include "validator.h"

#include "doctest.h"

#include <algorithm>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

sous::value make_step(std::string name,
                      std::int64_t idx,
                      std::string function,
                      sous::value_table extra = {}) {
  sous::value_table step{ { "name", std::move(name) },
                          { "idx", idx },
                          { "module", "test" },
                          { "function", std::move(function) } };
  for (auto &[k, v] : extra) { step[k] = std::move(v); }
  return step;
}

sous::recipe_spec make_spec(sous::value_array steps) {
  auto spec{ sous::validate_recipe(sous::value_table{ { "name", "demo" },
                                                      { "version", "1.0.0" },
                                                      { "steps", std::move(steps) } }) };
  REQUIRE(spec.is_valid());
  return spec;
}

sous::value_table retry(std::int64_t attempts, double delay = 0.0) {
  return { { "retry",
             sous::value_table{ { "max_attempts", attempts }, { "delay_seconds", delay } } } };
}

struct runner_fixture {
  std::shared_ptr<sous::registry_resolver> registry{
    std::make_shared<sous::registry_resolver>()
  };
  std::shared_ptr<sous::context> ctx{ std::make_shared<sous::context>() };

  std::mutex mutex;
  std::vector<std::string> started;
  std::map<std::string, int> calls;

  runner_fixture() {
    sous::builtin_steps_install(*registry);

    registry->add("test", "ok", [this](sous::step_call &call) {
      note(call.step);
      return sous::step_outcome::ok(call.step);
    });
    registry->add("test", "fail", [this](sous::step_call &call) {
      note(call.step);
      return sous::step_outcome::failure("boom");
    });
    registry->add("test", "throw", [this](sous::step_call &call) -> sous::step_outcome {
      note(call.step);
      throw std::runtime_error("thrown from step");
    });
    registry->add("test", "flaky", [this](sous::step_call &call) {
      note(call.step);
      if (call.attempt < 3) { return sous::step_outcome::failure("not yet"); }
      return sous::step_outcome::ok(call.attempt);
    });
    // Waits on its token only, so an abandoned worker never touches the fixture.
    registry->add("test", "block", [](sous::step_call &call) {
      if (call.token.wait_for(std::chrono::seconds(5))) {
        return sous::step_outcome::ok("finished");
      }
      return sous::step_outcome::failure("stopped");
    });
  }

  void note(std::string const &step) {
    std::lock_guard const lock(mutex);
    started.push_back(step);
    ++calls[step];
  }

  int count(std::string const &step) {
    std::lock_guard const lock(mutex);
    auto const it{ calls.find(step) };
    return it == calls.end() ? 0 : it->second;
  }
};

sous::step_status status_of(sous::recipe_execution_result const &result,
                            std::string const &step) {
  auto const *r{ result.find(step) };
  REQUIRE(r != nullptr);
  return r->status;
}

}  // namespace

TEST_CASE_FIXTURE(runner_fixture, "runner: steps start in ascending idx order") {
  auto const spec{ make_spec({
      make_step("late", 30, "ok"),
      make_step("early", 10, "ok", { { "depends_on", sous::value_array{ "late" } } }),
      make_step("middle", 20, "ok"),
  }) };

  sous::runner r{ registry };
  for (int i{ 0 }; i < 3; ++i) {
    started.clear();
    auto const result{ r.run(spec, std::make_shared<sous::context>()) };
    CHECK(started == std::vector<std::string>{ "early", "middle", "late" });
    CHECK(result.status == sous::run_status::completed);
    CHECK(result.overall_success());
  }
}

TEST_CASE_FIXTURE(runner_fixture, "runner: always-failing step is attempted max_attempts times") {
  auto const spec{ make_spec({ make_step("a", 1, "fail", retry(3)) }) };

  sous::runner r{ registry };
  auto const result{ r.run(spec, ctx) };

  auto const *a{ result.find("a") };
  REQUIRE(a != nullptr);
  CHECK(a->status == sous::step_status::failed);
  CHECK(a->attempts == 3);
  CHECK(a->attempt_errors.size() == 3);
  CHECK(count("a") == 3);
  REQUIRE(a->error.has_value());
  CHECK(*a->error == "step 'a' failed: boom");
  CHECK_FALSE(result.overall_success());
}

TEST_CASE_FIXTURE(runner_fixture, "runner: run-wide retry options apply without a retry block") {
  auto const spec{ make_spec({ make_step("a", 1, "throw") }) };

  sous::execution_options options;
  options.max_retries = 2;
  options.retry_delay = 0.0;

  sous::runner r{ registry };
  auto const result{ r.run(spec, ctx, options) };
  CHECK(result.find("a")->attempts == 3);
  CHECK(*result.find("a")->error == "step 'a' failed: thrown from step");
}

TEST_CASE_FIXTURE(runner_fixture, "runner: a step failing twice then succeeding lets the run finish") {
  auto const spec{ make_spec({ make_step("A", 1, "ok"),
                               make_step("B", 2, "flaky", retry(3, 0.01)),
                               make_step("C", 3, "ok") }) };

  sous::runner r{ registry };
  auto const result{ r.run(spec, ctx) };

  auto const *b{ result.find("B") };
  REQUIRE(b != nullptr);
  CHECK(b->status == sous::step_status::succeeded);
  CHECK(b->attempts == 3);
  CHECK(b->attempt_errors.size() == 2);
  CHECK_FALSE(b->error.has_value());
  CHECK(b->output == sous::value{ 3 });

  CHECK(status_of(result, "C") == sous::step_status::succeeded);
  CHECK(result.overall_success());
  CHECK(result.global_errors.empty());
}

TEST_CASE_FIXTURE(runner_fixture, "runner: a failure halts the run and skips later steps") {
  auto const spec{ make_spec({ make_step("a", 1, "ok"),
                               make_step("b", 2, "fail"),
                               make_step("c", 3, "ok"),
                               make_step("d", 4, "ok") }) };

  sous::runner r{ registry };
  auto const result{ r.run(spec, ctx) };

  CHECK(status_of(result, "a") == sous::step_status::succeeded);
  CHECK(status_of(result, "b") == sous::step_status::failed);
  CHECK(status_of(result, "c") == sous::step_status::skipped);
  CHECK(status_of(result, "d") == sous::step_status::skipped);
  CHECK(count("c") == 0);
  CHECK(result.status == sous::run_status::failed);
  REQUIRE(result.global_errors.size() == 1);
  CHECK(result.global_errors[0] == "step 'b' failed: boom");
  CHECK_FALSE(result.overall_success());
}

TEST_CASE_FIXTURE(runner_fixture, "runner: continue_on_error keeps running after a failure") {
  auto const spec{ make_spec({ make_step("a", 1, "fail"), make_step("b", 2, "ok") }) };

  sous::execution_options options;
  options.continue_on_error = true;

  sous::runner r{ registry };
  auto const result{ r.run(spec, ctx, options) };

  CHECK(status_of(result, "a") == sous::step_status::failed);
  CHECK(status_of(result, "b") == sous::step_status::succeeded);
  CHECK(count("b") == 1);
  CHECK(result.status == sous::run_status::partial);
  CHECK(result.global_errors.size() == 1);
  CHECK(result.success_rate() == doctest::Approx(0.5));
  CHECK_FALSE(result.overall_success());
}

TEST_CASE_FIXTURE(runner_fixture, "runner: cancel stops steps that have not started") {
  sous::runner r{ registry };
  registry->add("test", "cancel_run", [&r](sous::step_call &) {
    r.cancel();
    return sous::step_outcome::ok();
  });

  auto const spec{ make_spec({ make_step("a", 1, "ok"),
                               make_step("b", 2, "cancel_run"),
                               make_step("c", 3, "ok"),
                               make_step("d", 4, "ok") }) };
  auto const result{ r.run(spec, ctx) };

  CHECK(status_of(result, "a") == sous::step_status::succeeded);
  CHECK(status_of(result, "b") == sous::step_status::succeeded);
  CHECK(status_of(result, "c") == sous::step_status::cancelled);
  CHECK(status_of(result, "d") == sous::step_status::cancelled);
  CHECK(count("c") == 0);
  CHECK(result.status == sous::run_status::cancelled);
  CHECK_FALSE(result.overall_success());
  CHECK(std::find(result.global_warnings.begin(),
                  result.global_warnings.end(),
                  "execution cancelled by request") != result.global_warnings.end());
  CHECK(r.stats().cancellation_requested);
  CHECK(r.stats().active_runs == 0);
}

TEST_CASE_FIXTURE(runner_fixture, "runner: cancel interrupts the retry delay") {
  auto const spec{ make_spec({ make_step("a", 1, "fail", retry(5, 30.0)) }) };

  sous::runner r{ registry };
  std::thread canceller{ [&r] {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    r.cancel();
  } };

  auto const start{ std::chrono::steady_clock::now() };
  auto const result{ r.run(spec, ctx) };
  canceller.join();

  CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(10));
  CHECK(status_of(result, "a") == sous::step_status::cancelled);
  CHECK(result.find("a")->attempts == 1);
  CHECK(result.status == sous::run_status::cancelled);
}

TEST_CASE_FIXTURE(runner_fixture, "runner: attempts past their timeout are abandoned") {
  auto const spec{ make_spec({ make_step("slow",
                                         1,
                                         "block",
                                         { { "timeout_seconds", 0.05 },
                                           { "retry",
                                             sous::value_table{ { "max_attempts", 2 } } } }) }) };

  sous::runner r{ registry };
  auto const result{ r.run(spec, ctx) };

  auto const *slow{ result.find("slow") };
  REQUIRE(slow != nullptr);
  CHECK(slow->status == sous::step_status::timed_out);
  CHECK(slow->attempts == 2);
  REQUIRE(slow->error.has_value());
  CHECK(*slow->error == "step 'slow' timed out after 0.050s");
  CHECK_FALSE(result.overall_success());
}

TEST_CASE_FIXTURE(runner_fixture, "runner: the runner default timeout bounds steps without one") {
  auto const spec{ make_spec({ make_step("slow", 1, "block") }) };

  sous::runner r{ registry, 0.05 };
  auto const result{ r.run(spec, ctx) };
  CHECK(status_of(result, "slow") == sous::step_status::timed_out);
  CHECK(r.stats().default_timeout == 0.05);
}

TEST_CASE_FIXTURE(runner_fixture, "runner: invalid recipes are rejected before touching the context") {
  auto const spec{ sous::validate_recipe(sous::value_table{
      { "name", "broken" },
      { "steps", sous::value_array{ make_step("a", 1, "ok"), make_step("b", 1, "ok") } } }) };
  REQUIRE_FALSE(spec.is_valid());

  sous::runner r{ registry };
  try {
    r.run(spec, ctx);
    FAIL("expected invalid_recipe_error");
  } catch (sous::invalid_recipe_error const &e) {
    CHECK_FALSE(e.messages().empty());
    CHECK(std::string{ e.what() }.find("broken") != std::string::npos);
  }
  CHECK(ctx->size() == 0);
  CHECK(r.stats().total_runs == 0);
}

TEST_CASE_FIXTURE(runner_fixture, "runner: resolution failures are retried only on request") {
  auto const spec{ make_spec({ make_step("ghost", 1, "missing", retry(3)) }) };

  sous::runner r{ registry };

  SUBCASE("not retried by default") {
    auto const result{ r.run(spec, ctx) };
    auto const *ghost{ result.find("ghost") };
    CHECK(ghost->status == sous::step_status::failed);
    CHECK(ghost->attempts == 1);
    REQUIRE(ghost->error.has_value());
    CHECK(ghost->error->find("could not be resolved") != std::string::npos);
  }

  SUBCASE("retried when configured") {
    sous::execution_options options;
    options.retry_resolution_failures = true;
    auto const result{ r.run(spec, ctx, options) };
    CHECK(result.find("ghost")->attempts == 3);
  }
}

TEST_CASE_FIXTURE(runner_fixture, "runner: only, skip and enabled filter steps") {
  auto const spec{ make_spec({ make_step("a", 1, "ok"),
                               make_step("b", 2, "ok"),
                               make_step("c", 3, "ok"),
                               make_step("d", 4, "ok", { { "enabled", false } }) }) };

  sous::execution_options options;
  options.only = { "a", "b", "d" };
  options.skip = { "b" };

  sous::runner r{ registry };
  auto const result{ r.run(spec, ctx, options) };

  CHECK(started == std::vector<std::string>{ "a" });
  CHECK(status_of(result, "b") == sous::step_status::skipped);
  CHECK(status_of(result, "c") == sous::step_status::skipped);
  CHECK(status_of(result, "d") == sous::step_status::skipped);
  CHECK(result.status == sous::run_status::completed);
  CHECK(result.overall_success());
  CHECK(result.success_rate() == doctest::Approx(1.0));
}

TEST_CASE_FIXTURE(runner_fixture, "runner: context is seeded, updated per step and finalized") {
  ctx->set("preexisting", 1, "test");

  auto spec{ make_spec({ sous::value_table{
      { "name", "greet" },
      { "idx", 1 },
      { "module", "builtin" },
      { "function", "set" },
      { "args", sous::value_table{ { "greeting", "hello" } } } } }) };
  spec.config = sous::value_table{ { "region", "eu" } };

  sous::runner r{ registry };
  auto const result{ r.run(spec, ctx) };

  CHECK(ctx->get("recipe.name") == sous::value{ "demo" });
  CHECK(ctx->get("recipe.version") == sous::value{ "1.0.0" });
  CHECK(ctx->get("recipe.total_steps") == sous::value{ 1 });
  CHECK(ctx->get("recipe.config") ==
        sous::value{ sous::value_table{ { "region", "eu" } } });
  CHECK(ctx->get("recipe.content_hash") == sous::value{ spec.metadata.content_hash });
  CHECK(ctx->get("recipe.start_time").is_string());

  CHECK(ctx->get("greeting") == sous::value{ "hello" });
  CHECK(ctx->get("steps.greet.status") == sous::value{ "succeeded" });
  CHECK(ctx->get("steps.greet.attempts") == sous::value{ 1 });
  CHECK(ctx->get("steps.greet.output") == sous::value{ 1 });
  CHECK(ctx->contains("steps.greet.error"));
  CHECK(ctx->get("steps.greet.error").is_nil());

  CHECK(ctx->get("recipe.status") == sous::value{ "completed" });
  CHECK(ctx->get("recipe.success") == sous::value{ true });
  CHECK(ctx->get("recipe.completed_steps") == sous::value{ 1 });
  CHECK(ctx->get("recipe.failed_steps") == sous::value{ 0 });
  CHECK(ctx->get("recipe.outputs_created") == sous::value{ sous::value_array{ "greeting" } });
  CHECK(ctx->get("recipe.end_time").is_string());

  auto const *greet{ result.find("greet") };
  REQUIRE(greet != nullptr);
  CHECK(greet->outputs_created == std::vector<std::string>{ "greeting" });

  auto const &created{ result.context_keys_created };
  CHECK(std::find(created.begin(), created.end(), "greeting") != created.end());
  CHECK(std::find(created.begin(), created.end(), "recipe.status") != created.end());
  CHECK(std::find(created.begin(), created.end(), "preexisting") == created.end());

  bool step_attributed{ false };
  bool runner_attributed{ false };
  for (auto const &record : ctx->history()) {
    if (record.key == "greeting") { step_attributed = record.who == "greet"; }
    if (record.key == "recipe.name") { runner_attributed = record.who == "runner"; }
  }
  CHECK(step_attributed);
  CHECK(runner_attributed);
}

TEST_CASE_FIXTURE(runner_fixture, "runner: history is a bounded FIFO") {
  auto const spec{ make_spec({ make_step("a", 1, "ok") }) };

  sous::runner r{ registry, std::nullopt, 2 };
  for (int i{ 0 }; i < 3; ++i) { r.run(spec, std::make_shared<sous::context>()); }

  auto const stats{ r.stats() };
  CHECK(stats.total_runs == 3);
  CHECK(stats.total_steps_executed == 3);
  CHECK(stats.history_size == 2);
  CHECK(stats.history_capacity == 2);
  CHECK_FALSE(stats.cancellation_requested);

  CHECK(r.history().size() == 2);
  CHECK(r.history(1).size() == 1);
  CHECK(r.history(10).size() == 2);
  CHECK(r.clear_history() == 2);
  CHECK(r.history().empty());
  CHECK(r.stats().total_runs == 3);
}

TEST_CASE_FIXTURE(runner_fixture, "runner: dependency_parallel runs steps after their dependencies") {
  auto const spec{ make_spec({
      make_step("a", 1, "ok"),
      make_step("b", 2, "ok", { { "depends_on", sous::value_array{ "a" } } }),
      make_step("c", 3, "ok", { { "depends_on", sous::value_array{ "a" } } }),
      make_step("d", 4, "ok", { { "depends_on", sous::value_array{ "b", "c" } } }),
  }) };

  sous::execution_options options;
  options.mode = sous::execution_mode::dependency_parallel;
  options.max_parallel = 2;

  sous::runner r{ registry };
  auto const result{ r.run(spec, ctx, options) };

  CHECK(result.status == sous::run_status::completed);
  REQUIRE(started.size() == 4);
  auto const position{ [this](std::string const &name) {
    return std::find(started.begin(), started.end(), name) - started.begin();
  } };
  CHECK(position("a") == 0);
  CHECK(position("d") == 3);

  REQUIRE(result.step_results.size() == 4);
  CHECK(result.step_results[0].step_name == "a");
  CHECK(result.step_results[3].step_name == "d");
}

TEST_CASE_FIXTURE(runner_fixture, "runner: dependency_parallel skips dependents of failed steps") {
  auto const spec{ make_spec({
      make_step("a", 1, "ok"),
      make_step("b", 2, "fail", { { "depends_on", sous::value_array{ "a" } } }),
      make_step("c", 3, "ok", { { "depends_on", sous::value_array{ "a" } } }),
      make_step("d", 4, "ok", { { "depends_on", sous::value_array{ "b", "c" } } }),
  }) };

  sous::execution_options options;
  options.mode = sous::execution_mode::dependency_parallel;
  options.continue_on_error = true;

  sous::runner r{ registry };
  auto const result{ r.run(spec, ctx, options) };

  CHECK(status_of(result, "b") == sous::step_status::failed);
  CHECK(status_of(result, "c") == sous::step_status::succeeded);
  CHECK(status_of(result, "d") == sous::step_status::skipped);
  CHECK(count("d") == 0);
  CHECK(result.status == sous::run_status::partial);
}

TEST_CASE("execution_mode names parse back") {
  CHECK(sous::execution_mode_parse("sequential") == sous::execution_mode::sequential);
  CHECK(sous::execution_mode_parse(sous::execution_mode_name(
            sous::execution_mode::dependency_parallel)) ==
        sous::execution_mode::dependency_parallel);
  CHECK_THROWS_AS(sous::execution_mode_parse("eager"), std::runtime_error);
}

TEST_CASE_FIXTURE(runner_fixture, "runner: oversized timeouts behave as unbounded") {
  auto const spec{ make_spec({ make_step("a", 1, "ok", { { "timeout_seconds", 1e12 } }),
                               make_step("b", 2, "ok") }) };

  sous::runner r{ registry };
  sous::execution_options options;
  options.default_timeout = 1e300;
  auto const result{ r.run(spec, ctx, options) };

  CHECK(status_of(result, "a") == sous::step_status::succeeded);
  CHECK(status_of(result, "b") == sous::step_status::succeeded);
  CHECK(result.overall_success());
}

TEST_CASE_FIXTURE(runner_fixture, "runner: abandoned attempts can be waited out") {
  auto const spec{ make_spec({ make_step("slow", 1, "block", { { "timeout_seconds", 0.05 } }) }) };

  sous::runner r{ registry };
  auto const result{ r.run(spec, ctx) };
  REQUIRE(status_of(result, "slow") == sous::step_status::timed_out);

  CHECK(r.wait_for_abandoned(std::chrono::seconds(5)) == 0);
  CHECK(r.stats().abandoned_attempts_running == 0);
}
