#include <gtest/gtest.h>
#include <registrar/schema/encoding/scale/encoder.hpp>
#include <registrar/storage/memory/storage.hpp>
#include <registrar/storage/rocksdb/storage.hpp>
#include <registrar/storage/storage.hpp>
#include <registrar/testing/common.hpp>

#include <optional>
#include <string>
#include <vector>

using namespace registrar::schema;

namespace {

using memory_storage_t =
    registrar::storage::storage<registrar::storage::memory_storage_tag>;
using rocksdb_storage_t =
    registrar::storage::storage<registrar::storage::rocksdb_storage_tag>;

bytes_view_t view(const bytes_t& bytes) {
  return make_bytes_view(bytes);
}

const auto kCounterKey = make_bytes(std::string_view{"SYS|COUNTER"});

// Writes `value` and ignores the guard.
registrar::storage::insert_builder_t write_value(const bytes_t& value) {
  return [value](const std::optional<bytes_t>&) {
    return registrar::storage::insert_rows_t{.value = value};
  };
}

// Stores the guard counter (1 when absent) as the value and advances it.
registrar::storage::insert_builder_t claim_counter() {
  return [](const std::optional<bytes_t>& guard) {
    auto current = guard ? guard->at(0) : uint8_t{1};
    auto next = static_cast<uint8_t>(current + 1);
    return registrar::storage::insert_rows_t{
        .value = bytes_t{current}, .companions = {{kCounterKey, bytes_t{next}}}};
  };
}

// Same contract, both backends.
template <typename Storage>
void expect_insert_if_absent_is_write_once(Storage& storage) {
  auto key = make_bytes(std::string_view{"FP|alpha"});
  auto first = make_bytes(std::string_view{"first"});
  auto second = make_bytes(std::string_view{"second"});

  EXPECT_EQ(storage.insert_if_absent(view(key), view(kCounterKey),
                                     write_value(first)),
            registrar::storage::insert_status::inserted);

  auto built = false;
  EXPECT_EQ(storage.insert_if_absent(
                view(key), view(kCounterKey),
                [&](const std::optional<bytes_t>&) {
                  built = true;
                  return registrar::storage::insert_rows_t{.value = second};
                }),
            registrar::storage::insert_status::exists);
  EXPECT_FALSE(built);

  auto stored = storage.get(view(key));
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(*stored, first);
}

template <typename Storage>
void expect_guard_counter_advances_with_each_insert(Storage& storage) {
  auto alpha = make_bytes(std::string_view{"FP|alpha"});
  auto beta = make_bytes(std::string_view{"FP|beta"});

  ASSERT_EQ(storage.insert_if_absent(view(alpha), view(kCounterKey),
                                     claim_counter()),
            registrar::storage::insert_status::inserted);
  ASSERT_EQ(storage.insert_if_absent(view(beta), view(kCounterKey),
                                     claim_counter()),
            registrar::storage::insert_status::inserted);
  EXPECT_EQ(storage.get(view(alpha)), bytes_t{0x01});
  EXPECT_EQ(storage.get(view(beta)), bytes_t{0x02});
  EXPECT_EQ(storage.get(view(kCounterKey)), bytes_t{0x03});

  // Rejected inserts leave the counter untouched.
  EXPECT_EQ(storage.insert_if_absent(view(beta), view(kCounterKey),
                                     claim_counter()),
            registrar::storage::insert_status::exists);
  EXPECT_EQ(storage.get(view(kCounterKey)), bytes_t{0x03});
}

template <typename Storage>
void expect_prefix_listing_is_scoped(Storage& storage) {
  for (const auto* name : {"FP|a", "FP|b", "FQ|c", "SYS|d"}) {
    auto key = make_bytes(std::string_view{name});
    ASSERT_EQ(storage.insert_if_absent(view(key), view(kCounterKey),
                                       write_value(key)),
              registrar::storage::insert_status::inserted);
  }
  auto prefix = make_bytes(std::string_view{"FP|"});
  auto rows = storage.list_by_prefix(view(prefix));
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_EQ(rows[0].first, make_bytes(std::string_view{"FP|a"}));
  EXPECT_EQ(rows[1].first, make_bytes(std::string_view{"FP|b"}));
  EXPECT_EQ(rows[1].second, rows[1].first);
}

}  // namespace

TEST(storage_types, defaults_are_stable) {
  auto entry = registrar::storage::key_value_entry_t{};
  EXPECT_TRUE(entry.first.empty());
  EXPECT_TRUE(entry.second.empty());

  auto storage = memory_storage_t{};
  EXPECT_TRUE(storage.available());
  auto key = make_bytes(std::string_view{"missing"});
  EXPECT_FALSE(storage.get(view(key)).has_value());
}

TEST(storage_types, memory_insert_if_absent_is_write_once) {
  auto storage = memory_storage_t{};
  expect_insert_if_absent_is_write_once(storage);
}

TEST(storage_types, memory_guard_counter_advances_with_each_insert) {
  auto storage = memory_storage_t{};
  expect_guard_counter_advances_with_each_insert(storage);
}

TEST(storage_types, memory_prefix_listing_is_scoped) {
  auto storage = memory_storage_t{};
  expect_prefix_listing_is_scoped(storage);
}

TEST(storage_types, memory_unavailable_backend_refuses_writes) {
  auto storage = memory_storage_t{};
  storage.set_available(false);
  auto key = make_bytes(std::string_view{"FP|gamma"});
  EXPECT_EQ(storage.insert_if_absent(view(key), view(kCounterKey),
                                     claim_counter()),
            registrar::storage::insert_status::unavailable);
  EXPECT_FALSE(storage.get(view(key)).has_value());
  EXPECT_FALSE(storage.get(view(kCounterKey)).has_value());

  storage.set_available(true);
  EXPECT_EQ(storage.insert_if_absent(view(key), view(kCounterKey),
                                     claim_counter()),
            registrar::storage::insert_status::inserted);
}

TEST(storage_types, memory_before_insert_hook_runs_for_every_insert) {
  auto storage = memory_storage_t{};
  auto calls = 0;
  storage.set_before_insert([&] { ++calls; });
  auto key = make_bytes(std::string_view{"FP|hooked"});
  storage.insert_if_absent(view(key), view(kCounterKey), write_value(key));
  storage.insert_if_absent(view(key), view(kCounterKey), write_value(key));
  EXPECT_EQ(calls, 2);

  storage.set_before_insert({});
  storage.insert_if_absent(view(key), view(kCounterKey), write_value(key));
  EXPECT_EQ(calls, 2);
}

TEST(storage_types, rocksdb_insert_if_absent_is_write_once) {
  auto db = registrar::testing::scoped_db_path{"registrar_storage_once"};
  auto storage =
      registrar::storage::make_storage<registrar::storage::rocksdb_storage_tag>(
          db.path());
  expect_insert_if_absent_is_write_once(storage);
}

TEST(storage_types, rocksdb_guard_counter_advances_with_each_insert) {
  auto db = registrar::testing::scoped_db_path{"registrar_storage_counter"};
  auto storage =
      registrar::storage::make_storage<registrar::storage::rocksdb_storage_tag>(
          db.path());
  expect_guard_counter_advances_with_each_insert(storage);
}

TEST(storage_types, rocksdb_prefix_listing_is_scoped) {
  auto db = registrar::testing::scoped_db_path{"registrar_storage_prefix"};
  auto storage =
      registrar::storage::make_storage<registrar::storage::rocksdb_storage_tag>(
          db.path());
  expect_prefix_listing_is_scoped(storage);
}

TEST(storage_types, rocksdb_rows_survive_reopen) {
  auto db = registrar::testing::scoped_db_path{"registrar_storage_reopen"};
  auto key = make_bytes(std::string_view{"FP|durable"});
  auto encoder = registrar::schema::encoding::scale_encoder_t{};
  auto value = encoder.encode(uint64_t{42});
  {
    auto storage = registrar::storage::make_storage<
        registrar::storage::rocksdb_storage_tag>(db.path());
    ASSERT_EQ(storage.insert_if_absent(view(key), view(kCounterKey),
                                       write_value(value)),
              registrar::storage::insert_status::inserted);
  }
  auto storage =
      registrar::storage::make_storage<registrar::storage::rocksdb_storage_tag>(
          db.path());
  auto stored = storage.get(view(key));
  ASSERT_TRUE(stored.has_value());
  auto decoded = encoder.try_decode<uint64_t>(view(*stored));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded.value(), 42u);
  EXPECT_EQ(storage.insert_if_absent(view(key), view(kCounterKey),
                                     write_value(value)),
            registrar::storage::insert_status::exists);
}
