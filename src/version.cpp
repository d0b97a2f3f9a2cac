#include "version.h"

#include "semver.hpp"

#include <string_view>

namespace sous {

namespace {

std::string_view trim(std::string_view s) {
  auto const start{ s.find_first_not_of(" \t\n\r") };
  if (start == std::string_view::npos) { return {}; }
  return s.substr(start, s.find_last_not_of(" \t\n\r") - start + 1);
}

}  // namespace

bool version_is_semver(std::string_view text) {
  semver::version<> parsed;
  return semver::parse(trim(text), parsed);
}

}  // namespace sous
