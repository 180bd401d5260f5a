#include <registrar/schema/key/builder.hpp>
#include <registrar/schema/key/ledger_entry.hpp>

using namespace registrar::schema;

namespace registrar::schema::key {

bytes_t make_ledger_entry_key(const fingerprint_t& fingerprint) {
  auto b = builder{};
  b.write(kLedgerEntryPrefix);
  b.write(std::span(fingerprint.data(), fingerprint.size()));
  return b.data;
}

bytes_t make_ledger_entry_prefix() {
  return builder{}.write(kLedgerEntryPrefix).data;
}

bytes_t make_next_sequence_key() {
  return builder{}.write(kNextSequenceKey).data;
}

}  // namespace registrar::schema::key
