#include "cmds/cmd_version.h"

#include "doctest.h"

#include <type_traits>

TEST_CASE("cmd_version config exposes cmd_t alias") {
  using config_type = sous::cmd_version::cfg;
  using expected_command = sous::cmd_version;
  using actual_command = config_type::cmd_t;

  CHECK(std::is_same_v<actual_command, expected_command>);
}

TEST_CASE("cmd_version executes successfully") {
  sous::cmd_version cmd{ sous::cmd_version::cfg{} };
  CHECK(cmd.execute());
}
