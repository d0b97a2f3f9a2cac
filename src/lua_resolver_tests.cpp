#include "lua_resolver.h"

#include "errors.h"
#include "util.h"

#include "doctest.h"

#include <filesystem>
#include <random>
#include <string>
#include <system_error>

namespace {

struct temp_dir_fixture {
  temp_dir_fixture() {
    static std::mt19937_64 rng{ std::random_device{}() };
    root = std::filesystem::temp_directory_path() /
           ("sous-lua-resolver-test-" + std::to_string(rng()));
    std::filesystem::create_directories(root);

    sous::util_write_text_file(root / "steps.lua", R"lua(
local M = {}

function M.greet(ctx, args)
  ctx:set("greeting", "hello " .. args.who)
  return { step = ctx.step, attempt = ctx.attempt }
end

function M.refuse(ctx, args)
  return false, "not today"
end

function M.explode(ctx, args)
  error("kaboom")
end

function M.read_back(ctx, args)
  return ctx:get("seed", "fallback")
end

function M.poll(ctx, args)
  return { cancelled = ctx:cancelled() }
end

return M
)lua");

    sous::util_write_text_file(root / "globals.lua", R"lua(
function shout(ctx, args) return string.upper(args.text) end
)lua");

    sous::util_write_text_file(root / "broken.lua", "this is not lua");
  }

  ~temp_dir_fixture() {
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
  }

  sous::step_outcome invoke(std::string const &module,
                            std::string const &function,
                            sous::value_table args = {}) {
    sous::lua_resolver const resolver{ root };
    auto const fn{ resolver.resolve(module, function) };
    sous::step_call call{ .ctx = ctx, .args = args, .step = step, .attempt = 2, .token = token };
    return fn(call);
  }

  std::filesystem::path root;
  sous::context ctx;
  sous::cancel_token token;
  std::string step{ "lua-step" };
};

}  // namespace

TEST_CASE_FIXTURE(temp_dir_fixture, "lua_resolver runs a module table function") {
  auto const outcome{ invoke("steps.lua", "greet", { { "who", "sous" } }) };
  REQUIRE(outcome.success);
  CHECK(outcome.output == sous::value{ sous::value_table{ { "attempt", 2 },
                                                          { "step", "lua-step" } } });
  CHECK(ctx.get("greeting") == sous::value{ "hello sous" });
  CHECK(ctx.history().back().who == "lua-step");
}

TEST_CASE_FIXTURE(temp_dir_fixture, "lua_resolver falls back to globals") {
  auto const outcome{ invoke("globals.lua", "shout", { { "text", "hey" } }) };
  REQUIRE(outcome.success);
  CHECK(outcome.output == sous::value{ "HEY" });
}

TEST_CASE_FIXTURE(temp_dir_fixture, "lua_resolver maps false returns to failures") {
  auto const outcome{ invoke("steps.lua", "refuse") };
  CHECK_FALSE(outcome.success);
  CHECK(outcome.error == "not today");
}

TEST_CASE_FIXTURE(temp_dir_fixture, "lua_resolver reports Lua errors with traceback") {
  auto const outcome{ invoke("steps.lua", "explode") };
  CHECK_FALSE(outcome.success);
  CHECK(outcome.error.find("kaboom") != std::string::npos);
  CHECK(outcome.error.find("stack traceback:") != std::string::npos);
}

TEST_CASE_FIXTURE(temp_dir_fixture, "lua ctx:get honors defaults and stored values") {
  CHECK(invoke("steps.lua", "read_back").output == sous::value{ "fallback" });
  ctx.set("seed", 11, "test");
  CHECK(invoke("steps.lua", "read_back").output == sous::value{ 11 });
}

TEST_CASE_FIXTURE(temp_dir_fixture, "lua ctx:cancelled reflects the token") {
  CHECK(invoke("steps.lua", "poll").output ==
        sous::value{ sous::value_table{ { "cancelled", false } } });
  token.cancel();
  CHECK(invoke("steps.lua", "poll").output ==
        sous::value{ sous::value_table{ { "cancelled", true } } });
}

TEST_CASE_FIXTURE(temp_dir_fixture, "lua_resolver rejects unresolvable references") {
  sous::lua_resolver const resolver{ root };

  CHECK_THROWS_WITH_AS(resolver.resolve("builtin", "set"),
                       "not a Lua module: builtin",
                       sous::step_resolution_error);
  CHECK_THROWS_WITH_AS(resolver.resolve("missing.lua", "x"),
                       doctest::Contains("Lua module not found"),
                       sous::step_resolution_error);
  CHECK_THROWS_WITH_AS(resolver.resolve("steps.lua", "nope"),
                       doctest::Contains("no function named 'nope'"),
                       sous::step_resolution_error);
  CHECK_THROWS_WITH_AS(resolver.resolve("broken.lua", "x"),
                       doctest::Contains("cannot resolve broken.lua.x"),
                       sous::step_resolution_error);
}
