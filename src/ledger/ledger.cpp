#include <spdlog/spdlog.h>
#include <algorithm>
#include <registrar/common/critical.hpp>
#include <registrar/ledger/ledger.hpp>
#include <registrar/schema/encoding/scale/encoder.hpp>
#include <registrar/schema/encoding/scale/ledger_entry.hpp>
#include <registrar/schema/key/ledger_entry.hpp>
#include <utility>

using namespace registrar::schema;

namespace {

using encoder_t = registrar::schema::encoding::scale_encoder_t;

ledger_entry_t decode_entry(const bytes_t& raw) {
  auto encoder = encoder_t{};
  auto row = encoder.try_decode<encoding::scale::ledger_entry_row_t>(
      bytes_view_t{raw.data(), raw.size()});
  if (!row.has_value()) {
    registrar::common::critical("failed to decode ledger entry");
  }
  auto entry = encoding::scale::from_row(row.value());
  if (!entry.has_value()) {
    registrar::common::critical("ledger entry has an unsupported layout");
  }
  return std::move(entry.value());
}

// An absent counter means an empty ledger; sequences start at 1.
sequence_t decode_sequence(const std::optional<bytes_t>& raw) {
  if (!raw.has_value()) {
    return 1;
  }
  auto encoder = encoder_t{};
  auto decoded =
      encoder.try_decode<sequence_t>(bytes_view_t{raw->data(), raw->size()});
  if (!decoded.has_value() || decoded.value() == 0) {
    registrar::common::critical("failed to decode ledger sequence counter");
  }
  return decoded.value();
}

}  // namespace

namespace registrar::ledger {

template <typename StorageTag>
ledger<StorageTag>::ledger(storage_t& storage) : storage_{storage} {
  auto next = next_sequence();
  spdlog::info("Ledger ready with {} entries (next sequence {})", next - 1,
               next);
}

template <typename StorageTag>
outcome_t ledger<StorageTag>::try_insert(const fingerprint_t& fingerprint,
                                         const signer_id_t& signer,
                                         const nonce_t nonce) {
  auto lock = std::scoped_lock{mutex_};
  auto entry = ledger_entry_t{
      .fingerprint = fingerprint, .signer = signer, .nonce = nonce};

  auto entry_key = key::make_ledger_entry_key(fingerprint);
  auto counter_key = key::make_next_sequence_key();
  auto status = storage_.insert_if_absent(
      bytes_view_t{entry_key.data(), entry_key.size()},
      bytes_view_t{counter_key.data(), counter_key.size()},
      [&](const std::optional<bytes_t>& counter) {
        entry.sequence = decode_sequence(counter);
        auto encoder = encoder_t{};
        return registrar::storage::insert_rows_t{
            .value = encoder.encode(encoding::scale::to_row(entry)),
            .companions = {{counter_key, encoder.encode(entry.sequence + 1)}}};
      });
  switch (status) {
    case registrar::storage::insert_status::inserted:
      spdlog::info("Fingerprint {} claimed by {} at sequence {}",
                   to_hex(fingerprint), to_string(signer), entry.sequence);
      if (observer_) {
        observer_(entry);
      }
      return make_accepted(entry.sequence);
    case registrar::storage::insert_status::exists: {
      auto existing = lookup(fingerprint);
      auto owner = existing ? to_string(existing->signer) : std::string{"?"};
      spdlog::debug("Fingerprint {} already claimed by {}", to_hex(fingerprint),
                    owner);
      return make_rejected(existing ? existing->sequence : 0,
                           "fingerprint already claimed by " + owner);
    }
    case registrar::storage::insert_status::unavailable:
      break;
  }
  spdlog::error("Ledger backend unavailable; fingerprint {} not claimed",
                to_hex(fingerprint));
  return make_failure(outcome_code::backend_unavailable,
                      "ledger backend unavailable");
}

template <typename StorageTag>
std::optional<ledger_entry_t> ledger<StorageTag>::lookup(
    const fingerprint_t& fingerprint) const {
  auto entry_key = key::make_ledger_entry_key(fingerprint);
  auto raw = storage_.get(bytes_view_t{entry_key.data(), entry_key.size()});
  if (!raw.has_value()) {
    return std::nullopt;
  }
  return decode_entry(raw.value());
}

template <typename StorageTag>
std::vector<ledger_entry_t> ledger<StorageTag>::entries() const {
  auto prefix = key::make_ledger_entry_prefix();
  auto rows =
      storage_.list_by_prefix(bytes_view_t{prefix.data(), prefix.size()});
  auto out = std::vector<ledger_entry_t>{};
  out.reserve(rows.size());
  for (const auto& row : rows) {
    out.push_back(decode_entry(row.second));
  }
  std::ranges::sort(out, {}, &ledger_entry_t::sequence);
  return out;
}

// Sequences are dense and only consumed by accepted inserts, so the counter
// also counts rows.
template <typename StorageTag>
std::size_t ledger<StorageTag>::size() const {
  return static_cast<std::size_t>(next_sequence() - 1);
}

template <typename StorageTag>
sequence_t ledger<StorageTag>::next_sequence() const {
  auto counter_key = key::make_next_sequence_key();
  return decode_sequence(
      storage_.get(bytes_view_t{counter_key.data(), counter_key.size()}));
}

template <typename StorageTag>
void ledger<StorageTag>::set_insert_observer(insert_observer_t observer) {
  auto lock = std::scoped_lock{mutex_};
  observer_ = std::move(observer);
}

template class ledger<registrar::storage::memory_storage_tag>;
template class ledger<registrar::storage::rocksdb_storage_tag>;

}  // namespace registrar::ledger
