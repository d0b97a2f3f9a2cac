#include "cmd.h"

#include "doctest.h"

#include <type_traits>

namespace {

class test_cmd : public sous::cmd {
 public:
  struct cfg : sous::cmd_cfg<test_cmd> {
    bool succeed{ true };
  };

  explicit test_cmd(cfg c) : cfg_{ c } {}
  bool execute() override { return cfg_.succeed; }

 private:
  cfg cfg_;
};

}  // namespace

TEST_CASE("cmd_cfg exposes cmd_t alias") {
  using config_type = test_cmd::cfg;
  using expected_command = test_cmd;
  using actual_command = config_type::cmd_t;
  CHECK(std::is_same_v<actual_command, expected_command>);
}

TEST_CASE("cmd factory creates command from cfg") {
  test_cmd::cfg cfg{};
  cfg.succeed = false;
  auto cmd{ sous::cmd::create(cfg) };
  REQUIRE(cmd);
  CHECK(dynamic_cast<test_cmd *>(cmd.get()));
  CHECK_FALSE(cmd->execute());
}
