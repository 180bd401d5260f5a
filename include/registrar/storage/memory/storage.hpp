#pragma once
#include <registrar/storage/storage.hpp>
#include <atomic>
#include <functional>
#include <map>
#include <mutex>

namespace registrar::storage {

struct memory_storage_tag {};

/// Process-local backend. One instance per registry (or per test case).
template <>
struct storage<memory_storage_tag> final {
  storage() = default;
  storage(const storage&) = delete;
  storage& operator=(const storage&) = delete;

  std::optional<registrar::schema::bytes_t> get(
      const registrar::schema::bytes_view_t& key) const;
  insert_status insert_if_absent(
      const registrar::schema::bytes_view_t& key,
      const registrar::schema::bytes_view_t& guard_key,
      const insert_builder_t& build);
  std::vector<key_value_entry_t> list_by_prefix(
      const registrar::schema::bytes_view_t& prefix) const;

  /// Simulate the collaborator being unreachable. While unavailable, writes
  /// report insert_status::unavailable and leave state untouched.
  void set_available(bool available);
  bool available() const;

  /// Install a callback run at the start of every insert, before the store
  /// lock is taken. Models a slow collaborator; an empty function clears it.
  void set_before_insert(std::function<void()> hook);

 private:
  mutable std::mutex mutex_;
  std::map<registrar::schema::bytes_t, registrar::schema::bytes_t> rows_;
  std::atomic<bool> available_{true};
  mutable std::mutex hook_mutex_;
  std::function<void()> before_insert_;
};

template <>
storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view& path);

}  // namespace registrar::storage
