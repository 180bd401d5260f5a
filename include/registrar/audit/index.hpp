#pragma once

#include <registrar/schema/audit_event.hpp>
#include <registrar/schema/ledger_entry.hpp>
#include <registrar/schema/primitives.hpp>
#include <cstddef>
#include <map>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace registrar::audit {

/// Append-only projection of accepted ledger rows, queryable by fingerprint
/// and by signer.
///
/// Rows are published once per accepted insert, in sequence order. A signer
/// maps to the ordered list of fingerprints it claimed so history queries do
/// not scan every event.
class index final {
 public:
  index() = default;
  index(const index&) = delete;
  index& operator=(const index&) = delete;

  /// Publish one accepted row. A fingerprint already indexed is ignored.
  void record(const registrar::schema::audit_event_t& event);

  /// Replace the index contents with `entries` (any order).
  void rebuild(const std::vector<registrar::schema::ledger_entry_t>& entries);

  /// Accepted writes by `signer`, ascending by sequence.
  std::vector<registrar::schema::audit_event_t> records_by(
      const registrar::schema::signer_id_t& signer) const;

  std::optional<registrar::schema::audit_event_t> event_for(
      const registrar::schema::fingerprint_t& fingerprint) const;

  std::size_t size() const;

 private:
  void record_unlocked(const registrar::schema::audit_event_t& event);

  mutable std::shared_mutex mutex_;
  std::map<registrar::schema::fingerprint_t, registrar::schema::audit_event_t>
      events_;
  std::map<registrar::schema::signer_id_t,
           std::vector<registrar::schema::fingerprint_t>>
      by_signer_;
};

}  // namespace registrar::audit
