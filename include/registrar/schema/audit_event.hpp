#pragma once

#include <registrar/schema/ledger_entry.hpp>
#include <registrar/schema/primitives.hpp>
#include <cstdint>

// Schema type: audit event.
// Registry workflow: Read-only projection of an accepted ledger entry served
// to history queries. Derived, never the source of truth.
namespace registrar::schema {

template <uint16_t Version>
struct audit_event;

template <>
struct audit_event<1> final {
  uint16_t version{1};
  signer_id_t signer;
  fingerprint_t fingerprint{};
  sequence_t sequence{};
  nonce_t nonce{};

  bool operator==(const audit_event<1>&) const = default;
};

using audit_event_t = audit_event<1>;

inline audit_event_t make_audit_event(const ledger_entry_t& entry) {
  return audit_event_t{.signer = entry.signer,
                       .fingerprint = entry.fingerprint,
                       .sequence = entry.sequence,
                       .nonce = entry.nonce};
}

}  // namespace registrar::schema
