#pragma once

#include "sol/sol.hpp"

namespace sous {

// Install sous globals, platform constants, logging and helpers into a Lua state.
void lua_sous_install(sol::state &lua);

}  // namespace sous
