#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace stackctl {

using blake3_t = std::array<unsigned char, 32>;
blake3_t blake3_hash(void const *data, size_t length);

// Lowercase hex of the first `hex_chars` digest characters (at most 64).
std::string blake3_hex(std::string_view text, size_t hex_chars = 64);

}  // namespace stackctl
