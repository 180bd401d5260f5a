#pragma once

#include <registrar/schema/ledger_entry.hpp>
#include <registrar/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <tuple>

// Persisted row layouts. Signers are written as (tag, key bytes) so a row
// never depends on variant support in the codec.
namespace registrar::schema::encoding::scale {

using signer_row_t = std::tuple<uint8_t, registrar::schema::bytes_t>;

using ledger_entry_row_t = std::tuple<uint16_t,
                                      registrar::schema::fingerprint_t,
                                      signer_row_t,
                                      registrar::schema::nonce_t,
                                      registrar::schema::sequence_t>;

signer_row_t to_row(const registrar::schema::signer_id_t& signer);
std::optional<registrar::schema::signer_id_t> from_row(
    const signer_row_t& row);

ledger_entry_row_t to_row(const registrar::schema::ledger_entry_t& entry);
std::optional<registrar::schema::ledger_entry_t> from_row(
    const ledger_entry_row_t& row);

}  // namespace registrar::schema::encoding::scale
