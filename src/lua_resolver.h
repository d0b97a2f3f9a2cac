#pragma once

#include "step_resolver.h"

#include <filesystem>
#include <string>

namespace sous {

// Resolves module "<file>.lua" relative to `base_dir`. The function is looked up as a
// field of the table the chunk returns, falling back to a global of that name. Every
// attempt runs in a fresh Lua state as `function(ctx, args)`; returning false (with an
// optional message) fails the attempt, anything else becomes the step output.
class lua_resolver : public step_resolver {
 public:
  explicit lua_resolver(std::filesystem::path base_dir);

  step_fn resolve(std::string const &module_ref,
                  std::string const &function_ref) const override;

 private:
  std::filesystem::path base_dir_;
};

}  // namespace sous
