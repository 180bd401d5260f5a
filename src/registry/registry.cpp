#include <spdlog/spdlog.h>
#include <registrar/crypto/verify.hpp>
#include <registrar/fingerprint/codec.hpp>
#include <registrar/registry/registry.hpp>
#include <utility>

using namespace registrar::schema;

namespace registrar::registry {

template <typename StorageTag>
registry<StorageTag>::registry(storage_t& storage, registry_options options)
    : options_{std::move(options)},
      ledger_{storage},
      audit_{},
      coalescer_{ledger_},
      signature_verifier_{registrar::crypto::verify_signature} {
  audit_.rebuild(ledger_.entries());
  ledger_.set_insert_observer([this](const ledger_entry_t& entry) {
    audit_.record(make_audit_event(entry));
  });
}

template <typename StorageTag>
outcome_t registry<StorageTag>::submit(
    const std::string_view kind,
    const std::string_view record_id,
    const int64_t nonce,
    const signer_id_t& signer,
    const std::optional<std::chrono::milliseconds> timeout) {
  auto error = std::string{};
  auto operation = make_operation(kind, record_id, nonce, error);
  if (!operation) {
    spdlog::warn("Rejecting malformed operation from {}: {}", to_string(signer),
                 error);
    return make_failure(outcome_code::encoding_error, std::move(error));
  }
  return submit_operation(*operation, signer, timeout);
}

template <typename StorageTag>
outcome_t registry<StorageTag>::submit_signed(
    const std::string_view kind,
    const std::string_view record_id,
    const int64_t nonce,
    const signer_id_t& signer,
    const signature_t& signature,
    const std::optional<std::chrono::milliseconds> timeout) {
  auto error = std::string{};
  auto operation = make_operation(kind, record_id, nonce, error);
  if (!operation) {
    spdlog::warn("Rejecting malformed operation from {}: {}", to_string(signer),
                 error);
    return make_failure(outcome_code::encoding_error, std::move(error));
  }
  auto message = registrar::fingerprint::codec::preimage(*operation);
  if (!signature_verifier_ ||
      !signature_verifier_(bytes_view_t{message.data(), message.size()},
                           signer, signature)) {
    spdlog::warn("Signature check failed for {} on {}:{}:{}",
                 to_string(signer), operation->kind, operation->record_id,
                 operation->nonce);
    return make_failure(outcome_code::signature_verification_failed,
                        "signature verification failed");
  }
  return submit_operation(*operation, signer, timeout);
}

template <typename StorageTag>
std::optional<signer_id_t> registry<StorageTag>::signer_of(
    const std::string_view kind,
    const std::string_view record_id,
    const int64_t nonce) const {
  auto error = std::string{};
  auto fingerprint =
      registrar::fingerprint::codec::encode(kind, record_id, nonce, error);
  if (!fingerprint) {
    // Malformed input can never have been accepted.
    spdlog::debug("signer_of on malformed operation: {}", error);
    return std::nullopt;
  }
  auto entry = ledger_.lookup(*fingerprint);
  if (!entry) {
    return std::nullopt;
  }
  return entry->signer;
}

template <typename StorageTag>
std::vector<audit_event_t> registry<StorageTag>::history_of(
    const signer_id_t& signer) const {
  return audit_.records_by(signer);
}

template <typename StorageTag>
std::optional<audit_event_t> registry<StorageTag>::event_for(
    const fingerprint_t& fingerprint) const {
  return audit_.event_for(fingerprint);
}

template <typename StorageTag>
std::optional<fingerprint_t> registry<StorageTag>::fingerprint_of(
    const std::string_view kind,
    const std::string_view record_id,
    const int64_t nonce,
    std::string& error) const {
  return registrar::fingerprint::codec::encode(kind, record_id, nonce, error);
}

template <typename StorageTag>
std::vector<ledger_entry_t> registry<StorageTag>::entries() const {
  return ledger_.entries();
}

template <typename StorageTag>
std::size_t registry<StorageTag>::size() const {
  return ledger_.size();
}

template <typename StorageTag>
std::size_t registry<StorageTag>::pending_count() const {
  return coalescer_.pending_count();
}

template <typename StorageTag>
void registry<StorageTag>::set_signature_verifier(
    signature_verifier_t verifier) {
  signature_verifier_ = std::move(verifier);
}

template <typename StorageTag>
outcome_t registry<StorageTag>::submit_operation(
    const operation_t& operation,
    const signer_id_t& signer,
    const std::optional<std::chrono::milliseconds> timeout) {
  auto fingerprint = registrar::fingerprint::codec::encode(operation);
  spdlog::debug("Submitting {}:{}:{} as {} (fingerprint {})", operation.kind,
                operation.record_id, operation.nonce, to_string(signer),
                to_hex(fingerprint));
  auto result = coalescer_.submit(fingerprint, signer, operation.nonce,
                                  timeout ? timeout : options_.wait_timeout);
  if (result.code == outcome_code::coalescer_timeout) {
    spdlog::warn("Timed out waiting on in-flight {}:{}:{}", operation.kind,
                 operation.record_id, operation.nonce);
  }
  return result;
}

template class registry<registrar::storage::memory_storage_tag>;
template class registry<registrar::storage::rocksdb_storage_tag>;

}  // namespace registrar::registry
