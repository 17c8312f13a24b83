#include "applogic/hash.hpp"

// Hash authority.
//
// DESIGN INVARIANTS:
//   1. BLAKE3 is the sole hash primitive. No fallbacks.
//   2. Domain separation: "def:" and "state:" prefixes keep a definition and a
//      state that happen to share bytes from colliding. The prefixes are part
//      of the digest contract; changing them means bumping
//      version::HASH_ALGORITHM_VERSION.
//
// MICRO_DOCUMENTED: to_hex() uses a 16-byte lookup table instead of
// snprintf("%02x") per byte.

#include <array>

extern "C" {
#include <blake3.h>
}

namespace applogic {
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

std::string definition_hash(std::string_view canonical_definition_json) {
  return hash_domain("def:", canonical_definition_json);
}

std::string state_hash(std::string_view canonical_state_json) {
  return hash_domain("state:", canonical_state_json);
}

std::string hash_primitive_version() {
  const char* v = blake3_version();
  return v ? std::string(v) : std::string("unknown");
}

}  // namespace applogic
