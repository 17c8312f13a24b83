#pragma once

// applogic/hash.hpp - BLAKE3 digests with domain separation.
//
// Digests identify canonical definition JSON (definition cache keys) and
// canonical state envelopes (ActionResult::state_digest). All digests are
// 64-char lowercase hex.

#include <string>
#include <string_view>

namespace applogic {

std::string blake3_hex(std::string_view payload);

// Domain-separated hashing for different contexts.
std::string hash_domain(std::string_view domain, std::string_view payload);
std::string definition_hash(std::string_view canonical_definition_json);
std::string state_hash(std::string_view canonical_state_json);

// Version string reported by the linked BLAKE3 library.
std::string hash_primitive_version();

}  // namespace applogic
