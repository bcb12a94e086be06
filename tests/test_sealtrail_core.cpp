#include <atomic>
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <limits>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "core/api/audit_api.hpp"
#include "core/api/export_bundle.hpp"
#include "core/audit/sanitizer.hpp"
#include "core/chain/chain_state.hpp"
#include "core/chain/verifier.hpp"
#include "core/config/config.hpp"
#include "core/crypto/crypto.hpp"
#include "core/model/app_meta.hpp"
#include "core/model/log_codec.hpp"
#include "core/storage/file_store.hpp"
#include "core/storage/memory_store.hpp"
#include "core/util/canonical.hpp"
#include "core/util/hash.hpp"

namespace {

using sealtrail::AuditConfig;
using sealtrail::AuditEvent;
using sealtrail::AuditTrail;
using sealtrail::ChainTip;
using sealtrail::ComplianceTag;
using sealtrail::ErrorKind;
using sealtrail::EventCategory;
using sealtrail::MetaValue;
using sealtrail::Outcome;
using sealtrail::Result;
using sealtrail::SealedEntry;

const std::string kSigningKey(64, '1');
const std::string kEncryptionKey(64, '2');
const std::string kExportKey = "correct horse battery staple";

std::filesystem::path temp_dir(const std::string& name) {
  const auto root = std::filesystem::temp_directory_path() / "sealtrail-tests" / name;
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
  std::filesystem::create_directories(root, ec);
  return root;
}

AuditConfig test_config(const std::string& backend = "memory", const std::string& data_dir = {}) {
  AuditConfig config;
  config.store_backend = backend;
  config.data_dir = data_dir;
  config.signing_key_hex = kSigningKey;
  config.encryption_key_hex = kEncryptionKey;
  config.store_retry_attempts = 3;
  config.store_retry_backoff_ms = 1;
  config.log_level = "off";
  return config;
}

sealtrail::CryptoEngine& test_crypto() {
  static sealtrail::CryptoEngine crypto;
  if (!crypto.ready()) {
    const Result init = crypto.initialize(kSigningKey, kEncryptionKey);
    assert(init.ok);
  }
  return crypto;
}

Result log_payment(AuditTrail& trail, const std::string& actor, const std::string& action) {
  sealtrail::PaymentEventDraft draft;
  draft.actor_id = actor;
  draft.action = action;
  draft.transaction_id = "txn-" + actor;
  draft.amount = "42.00";
  draft.currency = "EUR";
  draft.network_origin = "203.0.113.7";
  return trail.log_payment_event(draft);
}

std::vector<sealtrail::SecureAuditEntry> decoded_entries(const AuditTrail& trail,
                                                        std::uint64_t start,
                                                        std::uint64_t end) {
  const auto exported = trail.export_range(start, end, kExportKey);
  assert(exported.status.ok);
  std::vector<sealtrail::SecureAuditEntry> entries;
  const Result opened = AuditTrail::open_export_bundle(*exported.bundle, kExportKey, entries);
  assert(opened.ok);
  return entries;
}

// Unsynchronized store whose entries the tests edit in place to simulate tampering.
class TamperStore : public sealtrail::AuditStore {
public:
  Result insert(const SealedEntry& entry) override {
    const std::uint64_t expected = entries.empty() ? 1 : entries.back().block_number + 1;
    if (entry.block_number != expected) {
      return Result::failure("not contiguous");
    }
    entries.push_back(entry);
    return Result::success();
  }

  Result query_range(std::uint64_t start_block, std::uint64_t end_block,
                     const EntryVisitor& visitor) const override {
    for (const auto& entry : entries) {
      if (entry.block_number >= start_block && entry.block_number <= end_block &&
          !visitor(entry)) {
        break;
      }
    }
    return Result::success();
  }

  std::optional<ChainTip> last_block() const override {
    if (entries.empty()) {
      return std::nullopt;
    }
    return ChainTip{entries.back().block_number, entries.back().hash};
  }

  SealedEntry& at(std::uint64_t block_number) {
    for (auto& entry : entries) {
      if (entry.block_number == block_number) {
        return entry;
      }
    }
    std::abort();
  }

  std::vector<SealedEntry> entries;
};

// Fails the next `fail_next` inserts, or lands one insert and still reports a failure.
class FlakyStore : public sealtrail::AuditStore {
public:
  Result insert(const SealedEntry& entry) override {
    ++insert_calls;
    if (land_then_fail) {
      land_then_fail = false;
      const Result landed = inner.insert(entry);
      assert(landed.ok);
      return Result::failure("timeout waiting for acknowledgement");
    }
    if (fail_next > 0) {
      --fail_next;
      return Result::failure("connection reset");
    }
    return inner.insert(entry);
  }

  Result query_range(std::uint64_t start_block, std::uint64_t end_block,
                     const EntryVisitor& visitor) const override {
    return inner.query_range(start_block, end_block, visitor);
  }

  std::optional<ChainTip> last_block() const override { return inner.last_block(); }

  sealtrail::MemoryStore inner;
  int fail_next = 0;
  bool land_then_fail = false;
  int insert_calls = 0;
};

void test_sanitizer_redacts_nested_fields() {
  AuditEvent event;
  event.category = EventCategory::Payment;
  event.actor_id = "user-1";
  event.metadata = MetaValue::object({
      {"Password", MetaValue::of("hunter2")},
      {"profile", MetaValue::object({
                      {"api_key", MetaValue::of("abc")},
                      {"name", MetaValue::of("Ada")},
                  })},
      {"items", MetaValue::list({
                    MetaValue::object({{"card_number", MetaValue::of("4111111111111111")}}),
                    MetaValue::of("plain"),
                })},
  });
  event.changes = sealtrail::ChangeSnapshot{
      MetaValue::object({{"client_secret", MetaValue::of("old")}}),
      MetaValue::object({{"client_secret", MetaValue::of("new")}, {"mode", MetaValue::of("live")}}),
  };

  const sealtrail::Sanitizer sanitizer;
  const sealtrail::SanitizedEvent clean = sanitizer.sanitize(event);

  assert(clean.actor_id == "user-1");
  assert(clean.metadata.find("Password")->text == "[REDACTED]");
  const MetaValue* profile = clean.metadata.find("profile");
  assert(profile != nullptr && profile->is_object());
  assert(profile->find("api_key")->text == "[REDACTED]");
  assert(profile->find("name")->text == "Ada");

  const MetaValue* items = clean.metadata.find("items");
  assert(items != nullptr && items->items.size() == 2);
  assert(items->items[0].find("card_number")->text == "[REDACTED]");
  assert(items->items[1].text == "plain");

  assert(clean.changes->before.find("client_secret")->text == "[REDACTED]");
  assert(clean.changes->after.find("client_secret")->text == "[REDACTED]");
  assert(clean.changes->after.find("mode")->text == "live");

  // The caller's event is left as it was.
  assert(event.metadata.find("Password")->text == "hunter2");

  sealtrail::SanitizerPolicy policy;
  policy.sensitive_field_patterns = {"iban"};
  policy.redaction_token = "***";
  const sealtrail::Sanitizer custom{policy};
  assert(custom.is_sensitive_key("Payee_IBAN"));
  assert(!custom.is_sensitive_key("password"));
}

void test_hash_is_deterministic_and_bound_to_predecessor() {
  assert(sealtrail::CryptoEngine::library_ready());
  assert(sealtrail::util::sha256_hex("abc") ==
         "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");

  const std::string genesis{sealtrail::kGenesisHash};
  const std::string a = sealtrail::util::chain_hash("log-body", genesis);
  const std::string b = sealtrail::util::chain_hash("log-body", genesis);
  const std::string c = sealtrail::util::chain_hash("log-body", a);
  const std::string d = sealtrail::util::chain_hash("log-body!", genesis);
  assert(a == b);
  assert(a != c);
  assert(a != d);
  assert(sealtrail::util::is_digest_hex(a));
  assert(!sealtrail::util::is_digest_hex("abc"));
  assert(!sealtrail::util::is_digest_hex(std::string(64, 'G')));
}

void test_signatures_detect_tampering() {
  sealtrail::CryptoEngine& crypto = test_crypto();
  const std::string hash = sealtrail::util::chain_hash("body", std::string{sealtrail::kGenesisHash});
  const std::string signature = crypto.sign("body", hash);
  assert(signature.size() == 64);
  assert(crypto.sign("body", hash) == signature);
  assert(crypto.verify_signature("body", hash, signature));
  assert(!crypto.verify_signature("body2", hash, signature));
  assert(!crypto.verify_signature("body", std::string(64, 'a'), signature));

  std::string flipped = signature;
  flipped.back() = flipped.back() == '0' ? '1' : '0';
  assert(!crypto.verify_signature("body", hash, flipped));
  assert(!crypto.verify_signature("body", hash, signature.substr(0, 62)));
  assert(!crypto.verify_signature("body", hash, ""));

  sealtrail::CryptoEngine other;
  assert(other.initialize(std::string(64, '3'), kEncryptionKey).ok);
  assert(!other.verify_signature("body", hash, signature));

  sealtrail::CryptoEngine rejected;
  Result init = rejected.initialize(kSigningKey, kSigningKey);
  assert(!init.ok && init.kind == ErrorKind::Crypto);
  init = rejected.initialize("abcd", kEncryptionKey);
  assert(!init.ok && init.kind == ErrorKind::Crypto);
  assert(!rejected.ready());
  assert(rejected.sign("body", hash).empty());
}

void test_cipher_round_trip_and_tamper_rejection() {
  sealtrail::CryptoEngine& crypto = test_crypto();
  const std::string plain = "format=sealtrail-log-v1\nactor_id=user-9\n";

  const auto first = crypto.encrypt(plain);
  const auto second = crypto.encrypt(plain);
  assert(first && second);
  assert(*first != *second);
  assert(first->substr(0, 24) != second->substr(0, 24));
  assert(crypto.decrypt(*first) == plain);
  assert(crypto.decrypt(*second) == plain);

  std::string tampered = *first;
  tampered[30] = static_cast<char>(tampered[30] ^ 0x01);
  assert(!crypto.decrypt(tampered));
  assert(!crypto.decrypt(first->substr(0, 10)));

  sealtrail::CryptoEngine other;
  assert(other.initialize(kSigningKey, std::string(64, '4')).ok);
  assert(!other.decrypt(*first));

  const auto sealed = sealtrail::CryptoEngine::encrypt_with_passphrase(plain, kExportKey);
  assert(sealed);
  assert(sealtrail::CryptoEngine::decrypt_with_passphrase(*sealed, kExportKey) == plain);
  assert(!sealtrail::CryptoEngine::decrypt_with_passphrase(*sealed, "wrong passphrase!"));
}

void test_log_codec_is_canonical() {
  sealtrail::AuditLog log;
  log.timestamp_ms = 1'700'000'000'123;
  log.event.category = EventCategory::Admin;
  log.event.actor_id = "admin-1";
  log.event.action = "config_change";
  log.event.resource = "limits";
  log.event.result = Outcome::Failure;
  log.event.risk_level = sealtrail::RiskLevel::High;
  log.event.compliance_tags = {ComplianceTag::Sox, ComplianceTag::FinancialRecord};
  log.event.metadata = MetaValue::object({
      {"note", MetaValue::of("line one\nline=two\\three")},
      {"limits", MetaValue::list({MetaValue::of("10"), MetaValue::of("20")})},
  });
  log.event.changes = sealtrail::ChangeSnapshot{MetaValue::object({{"max", MetaValue::of("10")}}),
                                                MetaValue::object({{"max", MetaValue::of("20")}})};

  const std::string encoded = sealtrail::encode_log(log);
  const auto decoded = sealtrail::decode_log(encoded);
  assert(decoded);
  assert(decoded->timestamp_ms == log.timestamp_ms);
  assert(decoded->event.category == EventCategory::Admin);
  assert(decoded->event.result == Outcome::Failure);
  assert(decoded->event.compliance_tags == log.event.compliance_tags);
  assert(decoded->event.metadata.find("note")->text == "line one\nline=two\\three");
  assert(decoded->event.metadata.find("limits")->items[1].text == "20");
  assert(decoded->event.changes->after.find("max")->text == "20");
  assert(sealtrail::encode_log(*decoded) == encoded);

  // Field order in the input does not change the bytes.
  sealtrail::AuditLog reordered = log;
  reordered.event.metadata = MetaValue::object({
      {"limits", MetaValue::list({MetaValue::of("10"), MetaValue::of("20")})},
      {"note", MetaValue::of("line one\nline=two\\three")},
  });
  assert(sealtrail::encode_log(reordered) == encoded);

  assert(!sealtrail::decode_log("format=other\n"));
  assert(sealtrail::decode_tags("pci-dss, SOX,unknown") ==
         std::set<ComplianceTag>({ComplianceTag::PciDss, ComplianceTag::Sox}));
}

void test_chain_state_initializes_once() {
  sealtrail::ChainState empty;
  assert(empty.phase() == sealtrail::ChainState::Phase::Uninitialized);
  assert(empty.initialize(std::nullopt).ok);
  assert(empty.ready());
  assert(empty.block_number() == 0);
  assert(empty.last_hash() == sealtrail::kGenesisHash);

  const Result again = empty.initialize(ChainTip{3, std::string(64, 'a')});
  assert(!again.ok && again.kind == ErrorKind::Validation);
  assert(empty.block_number() == 0);

  sealtrail::ChainState resumed;
  assert(resumed.initialize(ChainTip{7, std::string(64, 'b')}).ok);
  assert(resumed.block_number() == 7);
  resumed.advance(std::string(64, 'c'), 8);
  assert(resumed.tip().block_number == 8 && resumed.last_hash() == std::string(64, 'c'));

  sealtrail::ChainState malformed;
  assert(!malformed.initialize(ChainTip{2, "not-a-hash"}).ok);
  assert(!malformed.ready());
}

void test_cold_start_appends_block_one_after_genesis() {
  auto store = std::make_shared<sealtrail::MemoryStore>();
  AuditTrail trail;
  assert(trail.init(test_config(), store).ok);
  assert(trail.tip()->block_number == 0);
  assert(trail.tip()->hash == sealtrail::kGenesisHash);

  const Result logged = trail.log_event(EventCategory::Auth, "user-1", "authentication",
                                        Outcome::Success, MetaValue::object({}));
  assert(logged.ok);
  assert(!logged.data.empty());
  assert(store->size() == 1);

  SealedEntry first;
  assert(store->query_range(1, 1, [&first](const SealedEntry& entry) {
    first = entry;
    return true;
  }).ok);
  assert(first.block_number == 1);
  assert(first.id == logged.data);
  assert(first.previous_hash == sealtrail::kGenesisHash);
  assert(trail.tip()->hash == first.hash);
  assert(first.encrypted_log.find("user-1") == std::string::npos);

  const Result twice = trail.init(test_config(), store);
  assert(!twice.ok && twice.kind == ErrorKind::Validation);
}

void test_tampering_is_located_at_the_altered_block() {
  auto store = std::make_shared<TamperStore>();
  AuditTrail trail;
  assert(trail.init(test_config(), store).ok);
  for (int i = 0; i < 5; ++i) {
    assert(log_payment(trail, "user-" + std::to_string(i), "payment_attempt").ok);
  }

  const auto clean = trail.verify_chain();
  assert(clean.ok && clean.complete);
  assert(clean.entries_checked == 5);
  assert(clean.last_verified_block == 5);
  assert(clean.last_verified_hash == trail.tip()->hash);

  const std::vector<SealedEntry> pristine = store->entries;
  const auto broken_at = [&](const std::function<void(TamperStore&)>& tamper,
                             std::uint64_t end_block = 5) {
    TamperStore copy;
    copy.entries = pristine;
    tamper(copy);
    const sealtrail::IntegrityVerifier verifier{copy, test_crypto()};
    sealtrail::VerifyRequest request;
    request.end_block = end_block;
    const auto result = verifier.verify(request);
    assert(!result.ok);
    assert(!result.reason.empty());
    return *result.broken_at_block;
  };

  assert(broken_at([](TamperStore& s) { s.at(3).hash = std::string(64, 'e'); }) == 3);
  assert(broken_at([](TamperStore& s) { s.at(3).previous_hash = std::string(64, 'e'); }) == 3);
  assert(broken_at([](TamperStore& s) {
           std::string& sig = s.at(3).signature;
           sig.front() = sig.front() == 'a' ? 'b' : 'a';
         }) == 3);
  assert(broken_at([](TamperStore& s) {
           std::string& blob = s.at(3).encrypted_log;
           blob[30] = static_cast<char>(blob[30] ^ 0x01);
         }) == 3);
  // Attacker holding the encryption key but not the signing key rewrites a log body.
  assert(broken_at([](TamperStore& s) {
           SealedEntry& entry = s.at(3);
           auto body = test_crypto().decrypt(entry.encrypted_log);
           auto log = sealtrail::decode_log(*body);
           log->event.actor_id = "someone-else";
           entry.encrypted_log = *test_crypto().encrypt(sealtrail::encode_log(*log));
         }) == 3);
  assert(broken_at([](TamperStore& s) { s.entries.erase(s.entries.begin() + 2); }) == 3);
  assert(broken_at([](TamperStore& s) { s.entries.pop_back(); }) == 5);
  assert(broken_at([](TamperStore& s) { s.entries.insert(s.entries.begin() + 1, s.entries[1]); }) ==
         2);

  // Blocks before the break still verify.
  TamperStore partial;
  partial.entries = pristine;
  partial.at(4).signature = std::string(64, '0');
  const sealtrail::IntegrityVerifier verifier{partial, test_crypto()};
  sealtrail::VerifyRequest request;
  request.end_block = 5;
  const auto result = verifier.verify(request);
  assert(!result.ok && *result.broken_at_block == 4);
  assert(result.entries_checked == 3);
  assert(result.last_verified_block == 3);

  // A window after the altered block starts at its own first entry and stays clean.
  store->at(3).hash = std::string(64, 'e');
  const auto after_break = trail.verify_chain(4, 5);
  assert(after_break.ok && after_break.complete);
  assert(after_break.entries_checked == 2);
  const auto whole = trail.verify_chain();
  assert(!whole.ok && *whole.broken_at_block == 3);
}

void test_restart_continues_the_chain() {
  const auto dir = temp_dir("restart");
  std::string tip_hash;
  {
    AuditTrail trail;
    assert(trail.init(test_config("file", dir.string())).ok);
    for (int i = 0; i < 10; ++i) {
      assert(log_payment(trail, "user-" + std::to_string(i), "payment_success").ok);
    }
    assert(trail.tip()->block_number == 10);
    tip_hash = trail.tip()->hash;
  }

  AuditTrail reopened;
  assert(reopened.init(test_config("file", dir.string())).ok);
  assert(reopened.tip()->block_number == 10);
  assert(reopened.tip()->hash == tip_hash);
  assert(log_payment(reopened, "user-10", "refund").ok);
  assert(reopened.tip()->block_number == 11);

  sealtrail::FileStore store;
  assert(store.open(dir.string()).ok);
  assert(store.entry_count() == 11);
  SealedEntry eleventh;
  assert(store.query_range(11, 11, [&eleventh](const SealedEntry& entry) {
    eleventh = entry;
    return true;
  }).ok);
  assert(eleventh.previous_hash == tip_hash);

  const auto verified = reopened.verify_chain();
  assert(verified.ok && verified.complete && verified.entries_checked == 11);
}

void test_concurrent_appends_stay_contiguous() {
  auto store = std::make_shared<sealtrail::MemoryStore>();
  AuditTrail trail;
  assert(trail.init(test_config(), store).ok);

  constexpr int kThreads = 8;
  constexpr int kPerThread = 25;
  std::atomic<int> failures{0};
  std::vector<std::thread> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&trail, &failures, t] {
      for (int i = 0; i < kPerThread; ++i) {
        const Result logged =
            trail.log_event(EventCategory::DataAccess, "worker-" + std::to_string(t),
                            "personal_data", Outcome::Success,
                            MetaValue::object({{"seq", MetaValue::of(std::to_string(i))}}));
        if (!logged.ok) {
          ++failures;
        }
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  assert(failures.load() == 0);
  assert(store->size() == kThreads * kPerThread);
  assert(trail.tip()->block_number == kThreads * kPerThread);

  std::uint64_t expected = 1;
  std::string previous{sealtrail::kGenesisHash};
  assert(store->query_range(1, expected + kThreads * kPerThread, [&](const SealedEntry& entry) {
    assert(entry.block_number == expected);
    assert(entry.previous_hash == previous);
    previous = entry.hash;
    ++expected;
    return true;
  }).ok);

  const auto verified = trail.verify_chain();
  assert(verified.ok && verified.complete);
  assert(verified.entries_checked == kThreads * kPerThread);
}

void test_store_failures_do_not_advance_the_chain() {
  auto store = std::make_shared<FlakyStore>();
  AuditTrail trail;
  assert(trail.init(test_config(), store).ok);

  store->fail_next = 5;
  Result logged = log_payment(trail, "user-1", "payment_attempt");
  assert(!logged.ok);
  assert(logged.kind == ErrorKind::Store);
  assert(store->insert_calls == 3);
  assert(trail.tip()->block_number == 0);
  assert(trail.tip()->hash == sealtrail::kGenesisHash);
  assert(!store->last_block());

  store->fail_next = 2;
  logged = log_payment(trail, "user-1", "payment_attempt");
  assert(logged.ok);
  assert(trail.tip()->block_number == 1);
  assert(store->last_block()->block_number == 1);

  store->land_then_fail = true;
  logged = log_payment(trail, "user-2", "payment_success");
  assert(logged.ok);
  assert(trail.tip()->block_number == 2);
  assert(store->inner.size() == 2);

  assert(log_payment(trail, "user-3", "refund").ok);
  const auto verified = trail.verify_chain();
  assert(verified.ok && verified.complete && verified.entries_checked == 3);
}

void test_validation_errors_are_returned() {
  AuditTrail uninitialized;
  Result logged = uninitialized.log_event(EventCategory::Auth, "user-1", "authentication",
                                          Outcome::Success, MetaValue::object({}));
  assert(!logged.ok && logged.kind == ErrorKind::Validation);
  assert(!uninitialized.verify_chain().ok);

  AuditTrail trail;
  assert(trail.init(test_config()).ok);

  logged = trail.log_event(EventCategory::Unspecified, "user-1", "authentication",
                           Outcome::Success, MetaValue::object({}));
  assert(!logged.ok && logged.kind == ErrorKind::Validation);

  logged = trail.log_event(EventCategory::Auth, "  ", "authentication", Outcome::Success,
                           MetaValue::object({}));
  assert(!logged.ok && logged.kind == ErrorKind::Validation);

  logged = trail.log_event(EventCategory::Auth, "user-1", "authentication", Outcome::Success,
                           MetaValue::of("not-an-object"));
  assert(!logged.ok && logged.kind == ErrorKind::Validation);

  logged = trail.log_event(EventCategory::Auth, "user-1", "authentication", Outcome::Success,
                           MetaValue::object({{"ip", MetaValue::of("10.0.0.1")},
                                              {"ip", MetaValue::of("10.0.0.2")}}));
  assert(!logged.ok && logged.kind == ErrorKind::Validation);

  AuditEvent nested;
  nested.category = EventCategory::Admin;
  nested.actor_id = "admin-1";
  nested.changes = sealtrail::ChangeSnapshot{
      MetaValue::object({}),
      MetaValue::object({{"roles", MetaValue::list({MetaValue::object({
                                        {"name", MetaValue::of("ops")},
                                        {"name", MetaValue::of("root")},
                                    })})}}),
  };
  logged = trail.log(nested);
  assert(!logged.ok && logged.kind == ErrorKind::Validation);
  assert(trail.tip()->block_number == 0);

  AuditTrail bad_keys;
  AuditConfig config = test_config();
  config.encryption_key_hex.clear();
  const Result init = bad_keys.init(config);
  assert(!init.ok && init.kind == ErrorKind::Crypto);
  assert(!bad_keys.ready());
}

void test_verification_cancels_and_resumes() {
  AuditTrail trail;
  assert(trail.init(test_config()).ok);
  for (int i = 0; i < 20; ++i) {
    assert(log_payment(trail, "user-" + std::to_string(i), "payment_attempt").ok);
  }

  sealtrail::VerifyRequest first_page;
  first_page.max_entries = 7;
  const auto paused = trail.verify(first_page);
  assert(paused.ok);
  assert(!paused.complete);
  assert(paused.entries_checked == 7);
  assert(paused.last_verified_block == 7);

  sealtrail::VerifyRequest rest;
  rest.start_block = paused.last_verified_block + 1;
  rest.expected_previous_hash = paused.last_verified_hash;
  const auto resumed = trail.verify(rest);
  assert(resumed.ok && resumed.complete);
  assert(resumed.entries_checked == 13);
  assert(resumed.last_verified_block == 20);
  assert(resumed.last_verified_hash == trail.tip()->hash);

  const std::atomic<bool> stop{true};
  sealtrail::VerifyRequest stopped;
  stopped.stop = &stop;
  const auto cancelled = trail.verify(stopped);
  assert(cancelled.ok && !cancelled.complete);
  assert(cancelled.entries_checked == 0);
}

void test_sub_range_verification_uses_expected_hash() {
  AuditTrail trail;
  assert(trail.init(test_config()).ok);
  for (int i = 0; i < 10; ++i) {
    assert(log_payment(trail, "user-" + std::to_string(i), "payment_attempt").ok);
  }

  sealtrail::VerifyRequest head;
  head.end_block = 4;
  const auto anchor = trail.verify(head);
  assert(anchor.ok && anchor.complete && anchor.last_verified_block == 4);

  sealtrail::VerifyRequest window;
  window.start_block = 5;
  window.end_block = 10;
  window.expected_previous_hash = anchor.last_verified_hash;
  const auto verified = trail.verify(window);
  assert(verified.ok && verified.complete && verified.entries_checked == 6);

  window.expected_previous_hash = std::string(64, 'f');
  const auto mismatched = trail.verify(window);
  assert(!mismatched.ok);
  assert(*mismatched.broken_at_block == 5);

  // Without a supplied hash the window is checked from its own first entry.
  const auto implicit = trail.verify_chain(5, 10);
  assert(implicit.ok && implicit.entries_checked == 6);

  // End beyond the tip is clamped; start beyond the tip is an empty range.
  const auto clamped = trail.verify_chain(1, 500);
  assert(clamped.ok && clamped.complete && clamped.entries_checked == 10);
  const auto empty = trail.verify_chain(11, 20);
  assert(empty.ok && empty.entries_checked == 0);
}

void test_file_store_persists_and_reports_damage() {
  const auto dir = temp_dir("file-store");
  {
    AuditTrail trail;
    assert(trail.init(test_config("file", dir.string())).ok);
    for (int i = 0; i < 3; ++i) {
      assert(log_payment(trail, "user-" + std::to_string(i), "payment_attempt").ok);
    }
  }

  const auto chain_path = dir / "audit-chain.dat";
  assert(std::filesystem::exists(chain_path));

  std::vector<std::string> lines;
  {
    std::ifstream in(chain_path);
    std::string line;
    while (std::getline(in, line)) {
      lines.push_back(line);
    }
  }
  assert(lines.size() == 4);
  assert(lines[0] == "# sealtrail chain version=1");
  SealedEntry parsed;
  assert(sealtrail::FileStore::parse_entry_line(lines[2], parsed));
  assert(parsed.block_number == 2);
  assert(parsed.compliance_tags.contains(ComplianceTag::PciDss));
  assert(sealtrail::FileStore::serialize_entry_line(parsed) == lines[2] + "\n");

  {
    std::ofstream out(chain_path, std::ios::out | std::ios::trunc);
    out << lines[0] << '\n' << lines[1] << '\n' << "garbage line" << '\n' << lines[3] << '\n';
  }

  sealtrail::FileStore damaged;
  assert(damaged.open(dir.string()).ok);
  assert(damaged.entry_count() == 2);
  assert(damaged.parse_error_count() == 1);

  AuditTrail trail;
  assert(trail.init(test_config("file", dir.string())).ok);
  assert(trail.tip()->block_number == 3);
  const auto result = trail.verify_chain();
  assert(!result.ok);
  assert(*result.broken_at_block == 2);
  assert(result.entries_checked == 1);
}

void test_file_store_recovers_torn_tail() {
  const auto dir = temp_dir("torn-tail");
  {
    AuditTrail trail;
    assert(trail.init(test_config("file", dir.string())).ok);
    for (int i = 0; i < 3; ++i) {
      assert(log_payment(trail, "user-" + std::to_string(i), "payment_attempt").ok);
    }
  }

  const auto chain_path = dir / "audit-chain.dat";
  std::vector<std::string> lines;
  {
    std::ifstream in(chain_path);
    std::string line;
    while (std::getline(in, line)) {
      lines.push_back(line);
    }
  }
  assert(lines.size() == 4);

  // Crash halfway through writing block 3: no trailing newline.
  {
    std::ofstream out(chain_path, std::ios::out | std::ios::trunc | std::ios::binary);
    out << lines[0] << '\n' << lines[1] << '\n' << lines[2] << '\n'
        << lines[3].substr(0, lines[3].size() / 2);
  }

  {
    AuditTrail restarted;
    assert(restarted.init(test_config("file", dir.string())).ok);
    assert(restarted.tip()->block_number == 2);
    assert(log_payment(restarted, "user-3", "payment_success").ok);
    assert(restarted.tip()->block_number == 3);
  }

  sealtrail::FileStore reopened;
  assert(reopened.open(dir.string()).ok);
  assert(reopened.entry_count() == 3);
  assert(reopened.parse_error_count() == 0);

  AuditTrail trail;
  assert(trail.init(test_config("file", dir.string())).ok);
  assert(trail.tip()->block_number == 3);
  const auto verified = trail.verify_chain();
  assert(verified.ok && verified.complete && verified.entries_checked == 3);

  // A torn header alone leaves an empty chain that is written afresh.
  const auto header_dir = temp_dir("torn-header");
  {
    std::ofstream out(header_dir / "audit-chain.dat", std::ios::out | std::ios::binary);
    out << "# sealtrail ch";
  }
  sealtrail::FileStore fresh;
  assert(fresh.open(header_dir.string()).ok);
  assert(fresh.entry_count() == 0);
  std::ifstream header(header_dir / "audit-chain.dat");
  std::string first_line;
  std::getline(header, first_line);
  assert(first_line == "# sealtrail chain version=1");
}

void test_export_bundle_round_trip() {
  auto store = std::make_shared<TamperStore>();
  AuditTrail trail;
  assert(trail.init(test_config(), store).ok);
  for (int i = 0; i < 6; ++i) {
    AuditEvent event;
    event.category = EventCategory::DataAccess;
    event.actor_id = "analyst-" + std::to_string(i);
    event.resource = "personal_data";
    event.metadata = MetaValue::object({
        {"password", MetaValue::of("pw-" + std::to_string(i))},
        {"record", MetaValue::of("rec-" + std::to_string(i))},
    });
    assert(trail.log(event).ok);
  }

  const auto exported = trail.export_range(2, 5, kExportKey);
  assert(exported.status.ok);
  assert(exported.verification.ok && exported.verification.complete);
  assert(exported.bundle->entry_count == 4);
  assert(exported.bundle->start_block == 2 && exported.bundle->end_block == 5);
  assert(exported.bundle->ciphertext.find("analyst-") == std::string::npos);

  const auto reparsed = sealtrail::parse_bundle(sealtrail::serialize_bundle(*exported.bundle));
  assert(reparsed);
  assert(reparsed->ciphertext == exported.bundle->ciphertext);
  assert(reparsed->last_hash == exported.bundle->last_hash);

  std::vector<sealtrail::SecureAuditEntry> entries;
  assert(AuditTrail::open_export_bundle(*reparsed, kExportKey, entries).ok);
  assert(entries.size() == 4);
  assert(entries.front().block_number == 2);
  assert(entries.back().block_number == 5);
  assert(entries[0].log.event.actor_id == "analyst-1");
  assert(entries[0].log.event.action == "data-access");
  assert(!entries[0].log.event.correlation_id.empty());
  assert(entries[0].log.event.metadata.find("password")->text == "[REDACTED]");
  assert(entries[0].log.event.metadata.find("record")->text == "rec-1");
  assert(entries[1].previous_hash == entries[0].hash);

  Result opened = AuditTrail::open_export_bundle(*exported.bundle, "not the right key", entries);
  assert(!opened.ok && opened.kind == ErrorKind::Crypto);
  assert(entries.empty());

  auto short_key = trail.export_range(1, 2, "short");
  assert(!short_key.status.ok && short_key.status.kind == ErrorKind::Validation);
  auto beyond = trail.export_range(1, 7, kExportKey);
  assert(!beyond.status.ok && beyond.status.kind == ErrorKind::Validation);

  store->at(2).signature = std::string(64, '0');
  const auto refused = trail.export_range(3, 4, kExportKey);
  assert(!refused.status.ok);
  assert(!refused.bundle);
  assert(*refused.verification.broken_at_block == 2);
}

void test_typed_helpers_set_compliance_fields() {
  AuditTrail trail;
  assert(trail.init(test_config()).ok);

  assert(log_payment(trail, "user-1", "payment_failure").ok);

  sealtrail::AuthEventDraft auth;
  auth.actor_id = "user-1";
  auth.action = "failed_login";
  auth.risk_factors = {"new_device", "tor_exit"};
  assert(trail.log_auth_event(auth).ok);

  sealtrail::DataAccessEventDraft access;
  access.actor_id = "support-7";
  access.action = "data_export";
  access.data_type = "kyc_documents";
  access.legal_basis = "contract";
  assert(trail.log_data_access_event(access).ok);

  sealtrail::AdminEventDraft admin;
  admin.actor_id = "admin-1";
  admin.action = "config_change";
  admin.resource = "payment_limits";
  admin.changes = sealtrail::ChangeSnapshot{
      MetaValue::object({{"daily_limit", MetaValue::of("1000")}, {"api_token", MetaValue::of("t1")}}),
      MetaValue::object({{"daily_limit", MetaValue::of("5000")}, {"api_token", MetaValue::of("t2")}}),
  };
  assert(trail.log_admin_event(admin).ok);

  assert(trail.record_retention_sweep("scheduler", 1'600'000'000'000, "7y-financial").ok);

  const auto entries = decoded_entries(trail, 1, 5);
  assert(entries.size() == 5);

  const auto& payment = entries[0].log.event;
  assert(payment.category == EventCategory::Payment);
  assert(payment.resource == "payment");
  assert(payment.result == Outcome::Failure);
  assert(payment.risk_level == sealtrail::RiskLevel::High);
  assert(payment.sensitive_data_accessed);
  assert(payment.compliance_tags.contains(ComplianceTag::PciDss));
  assert(payment.metadata.find("currency")->text == "EUR");
  assert(payment.metadata.find("error_code") == nullptr);

  const auto& login = entries[1].log.event;
  assert(login.result == Outcome::Failure);
  assert(login.risk_level == sealtrail::RiskLevel::High);
  assert(login.compliance_tags.contains(ComplianceTag::Gdpr));
  assert(login.metadata.find("risk_factors")->items.size() == 2);

  const auto& data = entries[2].log.event;
  assert(data.resource == "personal_data");
  assert(data.metadata.find("data_type")->text == "kyc_documents");

  const auto& change = entries[3].log.event;
  assert(change.compliance_tags.contains(ComplianceTag::Sox));
  assert(change.changes->after.find("daily_limit")->text == "5000");
  assert(change.changes->after.find("api_token")->text == "[REDACTED]");

  const auto& sweep = entries[4].log.event;
  assert(sweep.action == "retention_sweep");
  assert(sweep.metadata.find("policy")->text == "7y-financial");
  assert(sweep.metadata.find("cutoff_ms")->text == "1600000000000");
}

void test_compliance_report_groups_events() {
  AuditTrail trail;
  assert(trail.init(test_config()).ok);
  for (int i = 0; i < 3; ++i) {
    assert(log_payment(trail, "user-" + std::to_string(i), "payment_attempt").ok);
  }
  assert(log_payment(trail, "user-9", "payment_failure").ok);

  sealtrail::AuthEventDraft auth;
  auth.actor_id = "user-1";
  auth.action = "login";
  assert(trail.log_auth_event(auth).ok);

  const auto report =
      trail.compliance_report(ComplianceTag::PciDss, 0, std::numeric_limits<std::int64_t>::max());
  assert(report.integrity_verified);
  assert(report.total_events == 4);
  assert(report.groups.size() == 2);
  assert(report.groups[0].action == "payment_attempt");
  assert(report.groups[0].count == 3);
  assert(report.groups[0].first_seen_ms <= report.groups[0].last_seen_ms);
  assert(report.groups[1].result == Outcome::Failure);
  assert(report.by_category.at("payment") == 4);

  std::size_t per_day = 0;
  for (const auto& [day, count] : report.by_day) {
    assert(day.size() == 10);
    per_day += count;
  }
  assert(per_day == 4);
  assert(!sealtrail::render_report_text(report).empty());

  const auto gdpr =
      trail.compliance_report(ComplianceTag::Gdpr, 0, std::numeric_limits<std::int64_t>::max());
  assert(gdpr.total_events == 1);

  const std::int64_t future = sealtrail::util::unix_millis_now() + 3'600'000;
  const auto later = trail.compliance_report(ComplianceTag::PciDss, future,
                                             std::numeric_limits<std::int64_t>::max());
  assert(later.total_events == 0);
}

void test_config_parsing_and_validation() {
  const auto dir = temp_dir("config");
  const auto path = dir / "sealtrail.conf";
  {
    std::ofstream out(path);
    out << "# audit chain\n"
        << "data_dir = /var/lib/sealtrail\n"
        << "store=FILE\n"
        << "signing_key=" << kSigningKey << '\n'
        << "encryption_key=" << kEncryptionKey << '\n'
        << "sensitive_fields=password, iban ,pin\n"
        << "redaction_token=<hidden>\n"
        << "store_retry_attempts=5\n"
        << "store_retry_backoff_ms=50\n"
        << "log_level=debug\n";
  }

  AuditConfig config;
  assert(sealtrail::load_config_file(path.string(), config).ok);
  assert(config.data_dir == "/var/lib/sealtrail");
  assert(config.store_backend == "file");
  assert(config.sanitizer.sensitive_field_patterns ==
         std::vector<std::string>({"password", "iban", "pin"}));
  assert(config.sanitizer.redaction_token == "<hidden>");
  assert(config.store_retry_attempts == 5);
  assert(config.store_retry_backoff_ms == 50);
  assert(config.log_level == "debug");
  assert(sealtrail::validate_config(config).ok);

  setenv("SEALTRAIL_LOG_LEVEL", "warn", 1);
  setenv("SEALTRAIL_STORE", "memory", 1);
  sealtrail::apply_env_overrides(config);
  unsetenv("SEALTRAIL_LOG_LEVEL");
  unsetenv("SEALTRAIL_STORE");
  assert(config.log_level == "warn");
  assert(config.store_backend == "memory");

  AuditConfig same_keys = config;
  same_keys.encryption_key_hex = same_keys.signing_key_hex;
  Result checked = sealtrail::validate_config(same_keys);
  assert(!checked.ok && checked.kind == ErrorKind::Crypto);

  AuditConfig short_key = config;
  short_key.signing_key_hex = "abcdef";
  checked = sealtrail::validate_config(short_key);
  assert(!checked.ok && checked.kind == ErrorKind::Crypto);

  AuditConfig unknown_store = config;
  unknown_store.store_backend = "redis";
  checked = sealtrail::validate_config(unknown_store);
  assert(!checked.ok && checked.kind == ErrorKind::Validation);

  AuditConfig no_retries = config;
  no_retries.store_retry_attempts = 0;
  assert(!sealtrail::validate_config(no_retries).ok);

  AuditConfig bad_number;
  checked = sealtrail::apply_config_values({{"store_retry_attempts", "three"}}, bad_number);
  assert(!checked.ok && checked.kind == ErrorKind::Validation);

  AuditConfig missing;
  assert(!sealtrail::load_config_file((dir / "absent.conf").string(), missing).ok);
}

}  // namespace

int main() {
  test_sanitizer_redacts_nested_fields();
  test_hash_is_deterministic_and_bound_to_predecessor();
  test_signatures_detect_tampering();
  test_cipher_round_trip_and_tamper_rejection();
  test_log_codec_is_canonical();
  test_chain_state_initializes_once();
  test_cold_start_appends_block_one_after_genesis();
  test_tampering_is_located_at_the_altered_block();
  test_restart_continues_the_chain();
  test_concurrent_appends_stay_contiguous();
  test_store_failures_do_not_advance_the_chain();
  test_validation_errors_are_returned();
  test_verification_cancels_and_resumes();
  test_sub_range_verification_uses_expected_hash();
  test_file_store_persists_and_reports_damage();
  test_file_store_recovers_torn_tail();
  test_export_bundle_round_trip();
  test_typed_helpers_set_compliance_fields();
  test_compliance_report_groups_events();
  test_config_parsing_and_validation();

  std::cout << "sealtrail_unit_tests passed\n";
  return 0;
}
