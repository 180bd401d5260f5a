#pragma once
#include <registrar/schema/primitives.hpp>
#include <functional>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace registrar::storage {

using key_value_entry_t =
    std::pair<registrar::schema::bytes_t, registrar::schema::bytes_t>;

/// Result of an insert-if-absent against the durability backend.
enum class insert_status {
  inserted,
  exists,
  unavailable,
};

/// Rows written by a successful insert: the value stored at the claimed key
/// plus companion rows committed in the same atomic write.
struct insert_rows_t final {
  registrar::schema::bytes_t value;
  std::vector<key_value_entry_t> companions;
};

/// Builds the rows to write from the current value at the guard key. Runs
/// inside the insert's critical section, so the guard cannot change between
/// the read and the commit.
using insert_builder_t = std::function<insert_rows_t(
    const std::optional<registrar::schema::bytes_t>& guard)>;

template <typename Library>
struct storage {
  /// Return raw value at key, or std::nullopt when missing.
  std::optional<registrar::schema::bytes_t> get(
      const registrar::schema::bytes_view_t& key) const;

  /// Atomically write `key` when it is absent.
  ///
  /// `guard_key` is read and locked together with `key`; `build` turns its
  /// current value into the rows to commit. `build` is not called when the
  /// key already exists or the backend cannot be reached.
  insert_status insert_if_absent(
      const registrar::schema::bytes_view_t& key,
      const registrar::schema::bytes_view_t& guard_key,
      const insert_builder_t& build);

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const registrar::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace registrar::storage
