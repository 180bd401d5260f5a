#pragma once

#include <registrar/audit/index.hpp>
#include <registrar/coalescer/submission_coalescer.hpp>
#include <registrar/ledger/ledger.hpp>
#include <registrar/registry/options.hpp>
#include <registrar/registry/signature_verifier.hpp>
#include <registrar/schema/audit_event.hpp>
#include <registrar/schema/ledger_entry.hpp>
#include <registrar/schema/operation.hpp>
#include <registrar/schema/outcome.hpp>
#include <registrar/schema/primitives.hpp>
#include <registrar/storage/memory/storage.hpp>
#include <registrar/storage/rocksdb/storage.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace registrar::registry {

/// Operation fingerprint registry: the single entry point for callers that
/// must apply a side effect at most once.
///
/// Writes go codec -> coalescer -> ledger -> audit index. Reads go straight to
/// the ledger or the audit index and never wait on in-flight writes.
template <typename StorageTag>
class registry final {
 public:
  using storage_t = registrar::storage::storage<StorageTag>;
  using ledger_t = registrar::ledger::ledger<StorageTag>;

  /// Bind to `storage`, reload persisted rows and rebuild the audit index.
  explicit registry(storage_t& storage, registry_options options = {});

  registry(const registry&) = delete;
  registry& operator=(const registry&) = delete;

  /// Claim (kind, record_id, nonce) for `signer`.
  ///
  /// accepted: the caller may apply its side effect.
  /// duplicate_fingerprint: the operation was already claimed; do not apply.
  /// encoding_error, backend_unavailable, coalescer_timeout: the outcome is
  /// unknown or not attempted; the ledger was not changed by this call.
  /// `timeout` overrides registry_options::wait_timeout for this call.
  registrar::schema::outcome_t submit(
      const std::string_view kind,
      const std::string_view record_id,
      const int64_t nonce,
      const registrar::schema::signer_id_t& signer,
      const std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  /// As submit, after checking `signature` over the fingerprint pre-image.
  registrar::schema::outcome_t submit_signed(
      const std::string_view kind,
      const std::string_view record_id,
      const int64_t nonce,
      const registrar::schema::signer_id_t& signer,
      const registrar::schema::signature_t& signature,
      const std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  /// Signer bound to (kind, record_id, nonce), if it was ever accepted.
  std::optional<registrar::schema::signer_id_t> signer_of(
      const std::string_view kind,
      const std::string_view record_id,
      const int64_t nonce) const;

  /// Accepted writes by `signer`, ascending by sequence.
  std::vector<registrar::schema::audit_event_t> history_of(
      const registrar::schema::signer_id_t& signer) const;

  std::optional<registrar::schema::audit_event_t> event_for(
      const registrar::schema::fingerprint_t& fingerprint) const;

  std::optional<registrar::schema::fingerprint_t> fingerprint_of(
      const std::string_view kind,
      const std::string_view record_id,
      const int64_t nonce,
      std::string& error) const;

  /// Every ledger row, ascending by sequence.
  std::vector<registrar::schema::ledger_entry_t> entries() const;

  std::size_t size() const;
  std::size_t pending_count() const;

  /// Replace the verifier used by submit_signed.
  void set_signature_verifier(signature_verifier_t verifier);

 private:
  registrar::schema::outcome_t submit_operation(
      const registrar::schema::operation_t& operation,
      const registrar::schema::signer_id_t& signer,
      const std::optional<std::chrono::milliseconds> timeout);

  registry_options options_;
  ledger_t ledger_;
  registrar::audit::index audit_;
  registrar::coalescer::submission_coalescer<ledger_t> coalescer_;
  signature_verifier_t signature_verifier_;
};

extern template class registry<registrar::storage::memory_storage_tag>;
extern template class registry<registrar::storage::rocksdb_storage_tag>;

}  // namespace registrar::registry
