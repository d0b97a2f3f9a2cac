#pragma once

#include <string_view>

namespace sous {

// True when `text` (surrounding whitespace ignored) parses as a semantic version.
bool version_is_semver(std::string_view text);

}  // namespace sous
