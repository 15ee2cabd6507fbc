#include "warden/hash.hpp"

// Hash authority.
//
// DESIGN INVARIANTS:
//   1. BLAKE3 is the sole hash primitive. No fallbacks, no alternatives.
//   2. Domain separation: "src:", "find:", "patch:", "snap:" and "tfset:"
//      prefixes keep a file digest from ever colliding with a finding id or a
//      snapshot key. These prefixes are part of the on-disk contract
//      (version::HASH_ALGORITHM_VERSION); never change them silently.
//
// MICRO_DOCUMENTED: to_hex() uses a lookup table (kHexChars) for O(1) nibble
// encoding instead of snprintf("%02x").

#include <array>

extern "C" {
#include <blake3.h>
}

namespace warden {
namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::string to_hex(const unsigned char* data, std::size_t len) {
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2]     = kHexChars[data[i] >> 4];
    out[i * 2 + 1] = kHexChars[data[i] & 0x0f];
  }
  return out;
}

}  // namespace

HashRuntimeInfo hash_runtime_info() {
  HashRuntimeInfo info;
  info.version = blake3_version();
  info.primitive = "blake3";
  info.backend = "system";
  return info;
}

std::string blake3_hex(std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string hash_domain(std::string_view domain, std::string_view payload) {
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, domain.data(), domain.size());
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  std::array<unsigned char, BLAKE3_OUT_LEN> out{};
  blake3_hasher_finalize(&hasher, out.data(), out.size());
  return to_hex(out.data(), out.size());
}

std::string content_digest(std::string_view raw_bytes) {
  return hash_domain("src:", raw_bytes);
}

std::string snapshot_content_hash(std::string_view raw_bytes) {
  return hash_domain("snap:", raw_bytes);
}

}  // namespace warden
