#include "cmd_validate.h"

#include "cmds/cmd_common.h"
#include "planner.h"
#include "tui.h"
#include "util.h"

#include "CLI11.hpp"

#include <memory>
#include <string>
#include <utility>

namespace sous {

void cmd_validate::register_cli(CLI::App &app, std::function<void(cfg)> on_selected) {
  auto *sub{ app.add_subcommand("validate", "Validate a recipe without running it") };
  auto cfg_ptr{ std::make_shared<cfg>() };
  sub->add_option("recipe", cfg_ptr->recipe_path, "Recipe file (.lua or .json)")
      ->required()
      ->check(CLI::ExistingFile);
  sub->add_flag("--plan", cfg_ptr->show_plan, "Print the dependency layers");
  sub->callback(
      [cfg_ptr, on_selected = std::move(on_selected)] { on_selected(*cfg_ptr); });
}

cmd_validate::cmd_validate(cmd_validate::cfg cfg) : cfg_{ std::move(cfg) } {}

bool cmd_validate::execute() {
  auto const loaded{ load_recipe_spec(cfg_.recipe_path) };
  auto const &spec{ loaded.spec };

  report_validation(spec);
  tui::info("%s", spec.summary().c_str());
  tui::info("content hash: %s", spec.metadata.content_hash.c_str());

  if (!spec.is_valid()) { return false; }

  if (cfg_.show_plan) {
    auto const layers{ plan_dependency_layers(spec.steps) };
    for (std::size_t i{ 0 }; i < layers.size(); ++i) {
      tui::info("layer %zu: %s", i + 1, util_join(layers[i], ", ").c_str());
    }
  }
  return true;
}

}  // namespace sous
