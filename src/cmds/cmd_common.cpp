#include "cmd_common.h"

#include "lua_resolver.h"
#include "recipe_loader.h"
#include "tui.h"
#include "validator.h"

namespace sous {

std::shared_ptr<step_resolver const> make_default_resolver(
    std::filesystem::path const &recipe_dir) {
  auto builtins{ std::make_shared<registry_resolver>() };
  builtin_steps_install(*builtins);

  auto chain{ std::make_shared<chain_resolver>() };
  chain->add(std::move(builtins));
  chain->add(std::make_shared<lua_resolver>(recipe_dir));
  return chain;
}

loaded_recipe load_recipe_spec(std::filesystem::path const &path) {
  auto const absolute{ std::filesystem::absolute(path) };
  auto resolver{ make_default_resolver(absolute.parent_path()) };

  auto const raw{ recipe_load(absolute) };
  auto spec{ validator{ resolver.get() }.validate(raw) };
  spec.metadata.source_path = absolute;

  tui::debug("loaded recipe %s (%s)",
             absolute.string().c_str(),
             spec.metadata.content_hash.c_str());
  return loaded_recipe{ .spec = std::move(spec), .resolver = std::move(resolver) };
}

std::size_t report_validation(recipe_spec const &spec) {
  std::size_t errors{ 0 };
  for (auto const &m : spec.validation_messages) {
    switch (m.severity) {
      case validation_severity::error:
        ++errors;
        tui::error("%s", m.to_string().c_str());
        break;
      case validation_severity::warning: tui::warn("%s", m.to_string().c_str()); break;
      case validation_severity::info: tui::debug("%s", m.to_string().c_str()); break;
    }
  }
  return errors;
}

}  // namespace sous
