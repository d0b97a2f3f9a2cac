#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace sous {

using blake3_t = std::array<unsigned char, 32>;
blake3_t blake3_hash(void const *data, size_t length);

// Lowercase hex digest of `text`.
std::string blake3_hex(std::string_view text);

}  // namespace sous
