#include "cmd_version.h"

#include "platform.h"
#include "tui.h"

#include "CLI11.hpp"
#include "blake3.h"
#include "nlohmann/json.hpp"
#include "semver.hpp"
#include "sol/sol.hpp"
#include "tbb/version.h"

#include <memory>
#include <utility>

#ifndef SOUS_VERSION_STR
#error "SOUS_VERSION_STR must be defined by the build system"
#endif

namespace sous {

void cmd_version::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("version", "Show version information") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_version::cmd_version(cmd_version::cfg cfg) : cfg_{ std::move(cfg) } {}

bool cmd_version::execute() {
  tui::info("sous version %s (%s)",
            SOUS_VERSION_STR,
            platform::get_exe_path().string().c_str());
  tui::info("");
  tui::info("Third-party component versions:");
  tui::info("  Lua: %s", LUA_RELEASE);
  tui::info("  Sol2: %s", SOL_VERSION_STRING);
  tui::info("  oneTBB: %s", TBB_runtime_version());
  tui::info("  BLAKE3: %s", BLAKE3_VERSION_STRING);
  tui::info("  nlohmann/json: %d.%d.%d",
            NLOHMANN_JSON_VERSION_MAJOR,
            NLOHMANN_JSON_VERSION_MINOR,
            NLOHMANN_JSON_VERSION_PATCH);
  tui::info("  Semver: %d.%d.%d",
            SEMVER_VERSION_MAJOR,
            SEMVER_VERSION_MINOR,
            SEMVER_VERSION_PATCH);
  tui::info("  CLI11: %s", CLI11_VERSION);
  return true;
}

}  // namespace sous
