#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/utilities/transaction.h>
#include <rocksdb/utilities/transaction_db.h>
#include <registrar/storage/storage.hpp>
#include <memory>
#include <string_view>

namespace registrar::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const registrar::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline registrar::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

/// Durable backend. insert_if_absent runs inside a pessimistic transaction
/// that locks both the key and the guard key with GetForUpdate before
/// writing.
template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::TransactionDB> database;

  std::optional<registrar::schema::bytes_t> get(
      const registrar::schema::bytes_view_t& key) const;
  insert_status insert_if_absent(
      const registrar::schema::bytes_view_t& key,
      const registrar::schema::bytes_view_t& guard_key,
      const insert_builder_t& build);
  std::vector<key_value_entry_t> list_by_prefix(
      const registrar::schema::bytes_view_t& prefix) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

}  // namespace registrar::storage
