#include "core/util/hash.hpp"

#include <array>

#include <sodium.h>

#include "core/util/canonical.hpp"

namespace sealtrail::util {

std::string sha256_hex(std::string_view payload) {
  std::array<unsigned char, crypto_hash_sha256_BYTES> digest{};
  crypto_hash_sha256(digest.data(), reinterpret_cast<const unsigned char*>(payload.data()),
                     static_cast<unsigned long long>(payload.size()));
  return to_hex(std::string_view{reinterpret_cast<const char*>(digest.data()), digest.size()});
}

std::string chain_hash(std::string_view canonical_log, std::string_view previous_hash) {
  return sha256_hex(canonical_join({
      {"log", std::string{canonical_log}},
      {"previous_hash", std::string{previous_hash}},
  }));
}

bool is_digest_hex(std::string_view value) {
  if (value.size() != crypto_hash_sha256_BYTES * 2U) {
    return false;
  }
  for (char c : value) {
    const bool digit = c >= '0' && c <= '9';
    const bool lower = c >= 'a' && c <= 'f';
    if (!digit && !lower) {
      return false;
    }
  }
  return true;
}

}  // namespace sealtrail::util
