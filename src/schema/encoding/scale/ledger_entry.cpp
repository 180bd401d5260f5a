#include <registrar/schema/encoding/scale/ledger_entry.hpp>

#include <algorithm>
#include <iterator>
#include <utility>

using namespace registrar::schema;

namespace registrar::schema::encoding::scale {

namespace {

constexpr auto kEd25519Tag = uint8_t{0};
constexpr auto kSecp256k1Tag = uint8_t{1};
constexpr auto kNamedTag = uint8_t{2};

template <typename Key>
std::optional<Key> copy_key(const bytes_t& bytes) {
  auto key = Key{};
  if (bytes.size() != key.size()) {
    return std::nullopt;
  }
  std::copy(std::begin(bytes), std::end(bytes), std::begin(key));
  return key;
}

}  // namespace

signer_row_t to_row(const signer_id_t& signer) {
  return std::visit(
      overloaded{[](const ed25519_signer_id& arg) {
                   return signer_row_t{kEd25519Tag,
                                       make_bytes(bytes_view_t{arg.public_key})};
                 },
                 [](const secp256k1_signer_id& arg) {
                   return signer_row_t{kSecp256k1Tag,
                                       make_bytes(bytes_view_t{arg.public_key})};
                 },
                 [](const named_signer_t& arg) {
                   return signer_row_t{kNamedTag, make_bytes(arg)};
                 }},
      signer);
}

std::optional<signer_id_t> from_row(const signer_row_t& row) {
  const auto& [tag, bytes] = row;
  switch (tag) {
    case kEd25519Tag: {
      auto key = copy_key<std::array<uint8_t, 32>>(bytes);
      if (!key) {
        return std::nullopt;
      }
      return signer_id_t{ed25519_signer_id{.public_key = *key}};
    }
    case kSecp256k1Tag: {
      auto key = copy_key<std::array<uint8_t, 33>>(bytes);
      if (!key) {
        return std::nullopt;
      }
      return signer_id_t{secp256k1_signer_id{.public_key = *key}};
    }
    case kNamedTag:
      return signer_id_t{make_string(bytes_view_t{bytes})};
    default:
      return std::nullopt;
  }
}

ledger_entry_row_t to_row(const ledger_entry_t& entry) {
  return ledger_entry_row_t{entry.version, entry.fingerprint,
                            to_row(entry.signer), entry.nonce,
                            entry.sequence};
}

std::optional<ledger_entry_t> from_row(const ledger_entry_row_t& row) {
  const auto& [version, fingerprint, signer_row, nonce, sequence] = row;
  if (version != 1) {
    return std::nullopt;
  }
  auto signer = from_row(signer_row);
  if (!signer) {
    return std::nullopt;
  }
  return ledger_entry_t{.version = version,
                        .fingerprint = fingerprint,
                        .signer = std::move(*signer),
                        .nonce = nonce,
                        .sequence = sequence};
}

}  // namespace registrar::schema::encoding::scale
