#pragma once
#include <registrar/schema/primitives.hpp>
#include <string_view>

// Schema key type: ledger entry.
// Registry workflow: Fingerprint keyspace holding the write-once rows, plus
// the persisted sequence counter that sits outside it.
namespace registrar::schema::key {

inline constexpr auto kLedgerEntryPrefix = std::string_view{"FP|"};
inline constexpr auto kNextSequenceKey =
    std::string_view{"SYS|LEDGER|NEXT_SEQUENCE"};

bytes_t make_ledger_entry_key(const fingerprint_t& fingerprint);
bytes_t make_ledger_entry_prefix();
bytes_t make_next_sequence_key();

}  // namespace registrar::schema::key
