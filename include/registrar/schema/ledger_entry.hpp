#pragma once

#include <registrar/schema/primitives.hpp>
#include <cstdint>

// Schema type: ledger entry.
// Registry workflow: Write-once row binding a fingerprint to the signer that
// claimed it. The sequence is assigned at insert time and orders the audit
// trail.
namespace registrar::schema {

template <uint16_t Version>
struct ledger_entry;

template <>
struct ledger_entry<1> final {
  uint16_t version{1};
  fingerprint_t fingerprint{};
  signer_id_t signer;
  nonce_t nonce{};
  sequence_t sequence{};

  bool operator==(const ledger_entry<1>&) const = default;
};

using ledger_entry_t = ledger_entry<1>;

}  // namespace registrar::schema
