#include "core/crypto/crypto.hpp"

#include <algorithm>
#include <array>
#include <string>
#include <utility>

#include <sodium.h>

#include "core/model/app_meta.hpp"
#include "core/util/canonical.hpp"

namespace sealtrail {
namespace {

constexpr std::size_t kNonceBytes = crypto_aead_xchacha20poly1305_ietf_NPUBBYTES;
constexpr std::size_t kTagBytes = crypto_aead_xchacha20poly1305_ietf_ABYTES;
constexpr std::size_t kSaltBytes = crypto_pwhash_SALTBYTES;

static_assert(crypto_auth_hmacsha256_KEYBYTES == kSecretKeyBytes);
static_assert(crypto_aead_xchacha20poly1305_ietf_KEYBYTES == kSecretKeyBytes);

const unsigned char* bytes_of(std::string_view text) {
  return reinterpret_cast<const unsigned char*>(text.data());
}

std::string signing_input(std::string_view canonical_log, std::string_view hash) {
  return util::canonical_join({
      {"hash", std::string{hash}},
      {"log", std::string{canonical_log}},
  });
}

std::optional<std::string> seal(std::string_view plain, const unsigned char* key) {
  std::array<unsigned char, kNonceBytes> nonce{};
  randombytes_buf(nonce.data(), nonce.size());

  std::string out(kNonceBytes + plain.size() + kTagBytes, '\0');
  std::copy(nonce.begin(), nonce.end(), out.begin());

  unsigned long long cipher_len = 0;
  if (crypto_aead_xchacha20poly1305_ietf_encrypt(
          reinterpret_cast<unsigned char*>(out.data()) + kNonceBytes, &cipher_len, bytes_of(plain),
          static_cast<unsigned long long>(plain.size()), nullptr, 0, nullptr, nonce.data(),
          key) != 0) {
    return std::nullopt;
  }
  out.resize(kNonceBytes + static_cast<std::size_t>(cipher_len));
  return out;
}

std::optional<std::string> open_sealed(std::string_view blob, const unsigned char* key) {
  if (blob.size() < kNonceBytes + kTagBytes) {
    return std::nullopt;
  }

  const std::string_view cipher = blob.substr(kNonceBytes);
  std::string plain(cipher.size() - kTagBytes, '\0');
  unsigned long long plain_len = 0;
  if (crypto_aead_xchacha20poly1305_ietf_decrypt(
          reinterpret_cast<unsigned char*>(plain.data()), &plain_len, nullptr, bytes_of(cipher),
          static_cast<unsigned long long>(cipher.size()), nullptr, 0, bytes_of(blob), key) != 0) {
    return std::nullopt;
  }
  plain.resize(static_cast<std::size_t>(plain_len));
  return plain;
}

bool derive_passphrase_key(std::string_view passphrase, const unsigned char* salt,
                           std::array<unsigned char, kSecretKeyBytes>& out_key) {
  return crypto_pwhash(out_key.data(), out_key.size(), passphrase.data(),
                       static_cast<unsigned long long>(passphrase.size()), salt,
                       crypto_pwhash_OPSLIMIT_INTERACTIVE, crypto_pwhash_MEMLIMIT_INTERACTIVE,
                       crypto_pwhash_ALG_ARGON2ID13) == 0;
}

}  // namespace

CryptoEngine::~CryptoEngine() {
  if (!signing_key_.empty()) {
    sodium_memzero(signing_key_.data(), signing_key_.size());
  }
  if (!encryption_key_.empty()) {
    sodium_memzero(encryption_key_.data(), encryption_key_.size());
  }
}

Result CryptoEngine::initialize(std::string_view signing_key_hex,
                                std::string_view encryption_key_hex) {
  ready_ = false;

  if (!library_ready()) {
    return Result::failure("libsodium initialization failed.", ErrorKind::Crypto);
  }

  std::string signing = util::from_hex(signing_key_hex);
  if (signing.size() != kSecretKeyBytes) {
    return Result::failure("Signing key must be 32 bytes of hex (64 characters).",
                           ErrorKind::Crypto);
  }
  std::string encryption = util::from_hex(encryption_key_hex);
  if (encryption.size() != kSecretKeyBytes) {
    return Result::failure("Encryption key must be 32 bytes of hex (64 characters).",
                           ErrorKind::Crypto);
  }
  if (sodium_memcmp(signing.data(), encryption.data(), kSecretKeyBytes) == 0) {
    return Result::failure("Signing and encryption keys must differ.", ErrorKind::Crypto);
  }

  signing_key_ = std::move(signing);
  encryption_key_ = std::move(encryption);
  ready_ = true;
  return Result::success("Audit keys loaded.");
}

std::string CryptoEngine::sign(std::string_view canonical_log, std::string_view hash) const {
  if (!ready_) {
    return {};
  }

  const std::string input = signing_input(canonical_log, hash);
  std::array<unsigned char, crypto_auth_hmacsha256_BYTES> mac{};
  if (crypto_auth_hmacsha256(mac.data(), bytes_of(input),
                             static_cast<unsigned long long>(input.size()),
                             bytes_of(signing_key_)) != 0) {
    return {};
  }
  return util::to_hex(std::string_view{reinterpret_cast<const char*>(mac.data()), mac.size()});
}

bool CryptoEngine::verify_signature(std::string_view canonical_log, std::string_view hash,
                                    std::string_view signature_hex) const {
  if (!ready_) {
    return false;
  }

  const std::string provided = util::from_hex(signature_hex);
  if (provided.size() != crypto_auth_hmacsha256_BYTES) {
    return false;
  }

  const std::string input = signing_input(canonical_log, hash);
  std::array<unsigned char, crypto_auth_hmacsha256_BYTES> expected{};
  if (crypto_auth_hmacsha256(expected.data(), bytes_of(input),
                             static_cast<unsigned long long>(input.size()),
                             bytes_of(signing_key_)) != 0) {
    return false;
  }
  return sodium_memcmp(expected.data(), provided.data(), expected.size()) == 0;
}

std::optional<std::string> CryptoEngine::encrypt(std::string_view plain) const {
  if (!ready_) {
    return std::nullopt;
  }
  return seal(plain, bytes_of(encryption_key_));
}

std::optional<std::string> CryptoEngine::decrypt(std::string_view blob) const {
  if (!ready_) {
    return std::nullopt;
  }
  return open_sealed(blob, bytes_of(encryption_key_));
}

std::optional<std::string> CryptoEngine::encrypt_with_passphrase(std::string_view plain,
                                                                 std::string_view passphrase) {
  if (passphrase.empty() || !library_ready()) {
    return std::nullopt;
  }

  std::array<unsigned char, kSaltBytes> salt{};
  randombytes_buf(salt.data(), salt.size());

  std::array<unsigned char, kSecretKeyBytes> key{};
  if (!derive_passphrase_key(passphrase, salt.data(), key)) {
    return std::nullopt;
  }

  auto sealed = seal(plain, key.data());
  sodium_memzero(key.data(), key.size());
  if (!sealed) {
    return std::nullopt;
  }
  return std::string{reinterpret_cast<const char*>(salt.data()), salt.size()} + *sealed;
}

std::optional<std::string> CryptoEngine::decrypt_with_passphrase(std::string_view blob,
                                                                 std::string_view passphrase) {
  if (passphrase.empty() || blob.size() < kSaltBytes || !library_ready()) {
    return std::nullopt;
  }

  std::array<unsigned char, kSecretKeyBytes> key{};
  if (!derive_passphrase_key(passphrase, bytes_of(blob), key)) {
    return std::nullopt;
  }

  auto plain = open_sealed(blob.substr(kSaltBytes), key.data());
  sodium_memzero(key.data(), key.size());
  return plain;
}

bool CryptoEngine::library_ready() {
  // sodium_init() is idempotent and thread-safe; 1 means already initialized.
  return sodium_init() >= 0;
}

std::string CryptoEngine::random_id() {
  std::array<unsigned char, 16> raw{};
  randombytes_buf(raw.data(), raw.size());
  raw[6] = static_cast<unsigned char>((raw[6] & 0x0FU) | 0x40U);
  raw[8] = static_cast<unsigned char>((raw[8] & 0x3FU) | 0x80U);

  const std::string hex =
      util::to_hex(std::string_view{reinterpret_cast<const char*>(raw.data()), raw.size()});
  return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
         hex.substr(16, 4) + "-" + hex.substr(20);
}

std::string CryptoEngine::generate_key_hex() {
  if (!library_ready()) {
    return {};
  }
  std::array<unsigned char, kSecretKeyBytes> key{};
  randombytes_buf(key.data(), key.size());
  std::string hex = util::to_hex(std::string_view{reinterpret_cast<const char*>(key.data()), key.size()});
  sodium_memzero(key.data(), key.size());
  return hex;
}

}  // namespace sealtrail
