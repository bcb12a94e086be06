#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "core/model/types.hpp"

namespace sealtrail {

// Keyed primitives for the chain: HMAC-SHA-256 signatures over (log, hash) and
// XChaCha20-Poly1305 encryption of log bodies at rest. Keys are supplied by the caller
// (external secret store); the engine never generates or rotates them.
class CryptoEngine {
public:
  CryptoEngine() = default;
  ~CryptoEngine();

  CryptoEngine(const CryptoEngine&) = delete;
  CryptoEngine& operator=(const CryptoEngine&) = delete;

  Result initialize(std::string_view signing_key_hex, std::string_view encryption_key_hex);

  [[nodiscard]] bool ready() const { return ready_; }

  // Empty string on failure; callers must treat that as a crypto error.
  [[nodiscard]] std::string sign(std::string_view canonical_log, std::string_view hash) const;
  [[nodiscard]] bool verify_signature(std::string_view canonical_log, std::string_view hash,
                                      std::string_view signature_hex) const;

  // Output is nonce || ciphertext || tag, with a fresh random nonce on every call.
  [[nodiscard]] std::optional<std::string> encrypt(std::string_view plain) const;
  [[nodiscard]] std::optional<std::string> decrypt(std::string_view blob) const;

  static std::optional<std::string> encrypt_with_passphrase(std::string_view plain,
                                                            std::string_view passphrase);
  static std::optional<std::string> decrypt_with_passphrase(std::string_view blob,
                                                            std::string_view passphrase);

  static bool library_ready();
  static std::string random_id();
  static std::string generate_key_hex();

private:
  std::string signing_key_;
  std::string encryption_key_;
  bool ready_ = false;
};

}  // namespace sealtrail
