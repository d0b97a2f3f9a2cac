#pragma once

#include "cmd.h"

#include <filesystem>
#include <functional>

namespace CLI { class App; }

namespace sous {

class cmd_validate : public cmd {
 public:
  struct cfg : cmd_cfg<cmd_validate> {
    std::filesystem::path recipe_path;
    bool show_plan{ false };
  };

  static void register_cli(CLI::App &app, std::function<void(cfg)> on_selected);

  explicit cmd_validate(cfg cfg);

  bool execute() override;
  cfg const &get_cfg() const { return cfg_; }

 private:
  cfg cfg_;
};

}  // namespace sous
