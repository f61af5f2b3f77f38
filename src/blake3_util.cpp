#include "blake3_util.h"

#include "util.h"

#include <blake3.h>

#include <algorithm>

namespace stackctl {

blake3_t blake3_hash(void const *data, size_t length) {
  blake3_t digest;
  blake3_hasher hasher;

  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, length);
  blake3_hasher_finalize(&hasher, digest.data(), digest.size());
  return digest;
}

std::string blake3_hex(std::string_view text, size_t hex_chars) {
  auto const digest{ blake3_hash(text.data(), text.size()) };
  auto hex{ util_bytes_to_hex(digest.data(), digest.size()) };
  hex.resize(std::min(hex_chars, hex.size()));
  return hex;
}

}  // namespace stackctl
