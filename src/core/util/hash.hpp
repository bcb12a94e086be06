#pragma once

#include <string>
#include <string_view>

namespace sealtrail::util {

// Hex SHA-256. Callers must have run sodium_init() (CryptoEngine::initialize does).
std::string sha256_hex(std::string_view payload);

// Digest binding a canonical log body to its predecessor's hash.
std::string chain_hash(std::string_view canonical_log, std::string_view previous_hash);

bool is_digest_hex(std::string_view value);

}  // namespace sealtrail::util
