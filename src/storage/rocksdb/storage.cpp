#include <spdlog/spdlog.h>
#include <registrar/common/critical.hpp>
#include <registrar/storage/rocksdb/storage.hpp>
#include <string>

using namespace registrar::schema;

namespace registrar::storage {

std::optional<bytes_t> storage<rocksdb_storage_tag>::get(
    const bytes_view_t& key) const {
  if (!database) {
    registrar::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    } else {
      spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
      registrar::common::critical("Failed to get value from RocksDB");
    }
  }
  return make_bytes(value);
}

insert_status storage<rocksdb_storage_tag>::insert_if_absent(
    const bytes_view_t& key,
    const bytes_view_t& guard_key,
    const insert_builder_t& build) {
  if (!database) {
    registrar::common::critical("RocksDB database is not initialized");
  }
  auto transaction = std::unique_ptr<ROCKSDB_NAMESPACE::Transaction>{
      database->BeginTransaction(ROCKSDB_NAMESPACE::WriteOptions{})};
  if (!transaction) {
    spdlog::error("Failed to begin RocksDB transaction");
    return insert_status::unavailable;
  }
  auto rollback = [&transaction] {
    auto status = transaction->Rollback();
    if (!status.ok()) {
      spdlog::warn("Failed to roll back RocksDB transaction: {}",
                   status.ToString());
    }
  };

  auto existing = std::string{};
  auto status = transaction->GetForUpdate(ROCKSDB_NAMESPACE::ReadOptions{},
                                          detail::to_slice(key), &existing);
  if (status.ok()) {
    rollback();
    return insert_status::exists;
  }
  if (!status.IsNotFound()) {
    spdlog::error("Failed to lock key in RocksDB: {}", status.ToString());
    rollback();
    return insert_status::unavailable;
  }

  auto guard_value = std::string{};
  status = transaction->GetForUpdate(ROCKSDB_NAMESPACE::ReadOptions{},
                                     detail::to_slice(guard_key), &guard_value);
  auto guard = std::optional<bytes_t>{};
  if (status.ok()) {
    guard = make_bytes(guard_value);
  } else if (!status.IsNotFound()) {
    spdlog::error("Failed to lock guard key in RocksDB: {}",
                  status.ToString());
    rollback();
    return insert_status::unavailable;
  }

  auto rows = build(guard);
  status = transaction->Put(detail::to_slice(key),
                            detail::to_slice(bytes_view_t{rows.value}));
  for (const auto& [companion_key, companion_value] : rows.companions) {
    if (!status.ok()) {
      break;
    }
    status = transaction->Put(detail::to_slice(bytes_view_t{companion_key}),
                              detail::to_slice(bytes_view_t{companion_value}));
  }
  if (status.ok()) {
    status = transaction->Commit();
  }
  if (!status.ok()) {
    spdlog::error("Failed to commit insert into RocksDB: {}",
                  status.ToString());
    rollback();
    return insert_status::unavailable;
  }
  return insert_status::inserted;
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const bytes_view_t& prefix) const {
  if (!database) {
    registrar::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string = make_string(prefix);

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    registrar::common::critical("RocksDB iteration failed");
  }
  return entries;
}

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();
  auto transaction_options = ROCKSDB_NAMESPACE::TransactionDBOptions{};

  ROCKSDB_NAMESPACE::TransactionDB* database{nullptr};
  auto status = ROCKSDB_NAMESPACE::TransactionDB::Open(
      options, transaction_options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    registrar::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

}  // namespace registrar::storage
