#pragma once

#include <registrar/schema/ledger_entry.hpp>
#include <registrar/schema/outcome.hpp>
#include <registrar/schema/primitives.hpp>
#include <registrar/storage/memory/storage.hpp>
#include <registrar/storage/rocksdb/storage.hpp>
#include <registrar/storage/storage.hpp>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

namespace registrar::ledger {

/// Append-only, write-once map from fingerprint to the signer that claimed
/// it.
///
/// The ledger does not own its store: the backend is injected so callers
/// (and tests) decide its lifetime and kind. Every successful insert gets the
/// next sequence number; rejected or failed attempts never consume one. The
/// counter lives in the store and is read and advanced inside the insert
/// itself, so ledgers sharing one store never hand out the same sequence.
template <typename StorageTag>
class ledger final {
 public:
  using storage_t = registrar::storage::storage<StorageTag>;
  using insert_observer_t =
      std::function<void(const registrar::schema::ledger_entry_t&)>;

  /// Bind to `storage` and check its persisted sequence counter.
  explicit ledger(storage_t& storage);

  ledger(const ledger&) = delete;
  ledger& operator=(const ledger&) = delete;

  /// Claim `fingerprint` for `signer`.
  ///
  /// Exactly one call per fingerprint is ever accepted. A claimed fingerprint
  /// yields duplicate_fingerprint; an unreachable backend yields
  /// backend_unavailable and leaves the fingerprint unclaimed.
  registrar::schema::outcome_t try_insert(
      const registrar::schema::fingerprint_t& fingerprint,
      const registrar::schema::signer_id_t& signer,
      const registrar::schema::nonce_t nonce);

  /// Point-in-time read of the row for `fingerprint`.
  std::optional<registrar::schema::ledger_entry_t> lookup(
      const registrar::schema::fingerprint_t& fingerprint) const;

  /// All rows ordered by sequence.
  std::vector<registrar::schema::ledger_entry_t> entries() const;

  /// Number of accepted rows.
  std::size_t size() const;

  /// Sequence the next accepted insert will receive, as persisted.
  registrar::schema::sequence_t next_sequence() const;

  /// Install a callback invoked once per accepted insert, while the insert
  /// lock is held, so observers see rows in sequence order.
  void set_insert_observer(insert_observer_t observer);

 private:
  mutable std::mutex mutex_;
  storage_t& storage_;
  insert_observer_t observer_;
};

extern template class ledger<registrar::storage::memory_storage_tag>;
extern template class ledger<registrar::storage::rocksdb_storage_tag>;

}  // namespace registrar::ledger
