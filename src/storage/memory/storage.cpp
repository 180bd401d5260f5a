#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <utility>
#include <registrar/storage/memory/storage.hpp>

using namespace registrar::schema;

namespace registrar::storage {

std::optional<bytes_t> storage<memory_storage_tag>::get(
    const bytes_view_t& key) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = rows_.find(make_bytes(key));
  if (it == std::end(rows_)) {
    return std::nullopt;
  }
  return it->second;
}

insert_status storage<memory_storage_tag>::insert_if_absent(
    const bytes_view_t& key,
    const bytes_view_t& guard_key,
    const insert_builder_t& build) {
  auto hook = std::function<void()>{};
  {
    auto hook_lock = std::scoped_lock{hook_mutex_};
    hook = before_insert_;
  }
  if (hook) {
    hook();
  }

  auto lock = std::scoped_lock{mutex_};
  if (!available_) {
    spdlog::warn("memory storage unavailable; refusing write");
    return insert_status::unavailable;
  }
  auto row_key = make_bytes(key);
  if (rows_.contains(row_key)) {
    return insert_status::exists;
  }
  auto guard = std::optional<bytes_t>{};
  if (auto it = rows_.find(make_bytes(guard_key)); it != std::end(rows_)) {
    guard = it->second;
  }
  auto rows = build(guard);
  rows_.emplace(std::move(row_key), std::move(rows.value));
  for (auto& [companion_key, companion_value] : rows.companions) {
    rows_.insert_or_assign(std::move(companion_key),
                           std::move(companion_value));
  }
  return insert_status::inserted;
}

std::vector<key_value_entry_t> storage<memory_storage_tag>::list_by_prefix(
    const bytes_view_t& prefix) const {
  auto lock = std::scoped_lock{mutex_};
  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_bytes = make_bytes(prefix);
  for (auto it = rows_.lower_bound(prefix_bytes); it != std::end(rows_);
       ++it) {
    if (it->first.size() < prefix_bytes.size() ||
        !std::equal(std::begin(prefix_bytes), std::end(prefix_bytes),
                    std::begin(it->first))) {
      break;
    }
    entries.emplace_back(it->first, it->second);
  }
  return entries;
}

void storage<memory_storage_tag>::set_available(const bool available) {
  available_ = available;
}

bool storage<memory_storage_tag>::available() const {
  return available_;
}

void storage<memory_storage_tag>::set_before_insert(
    std::function<void()> hook) {
  auto lock = std::scoped_lock{hook_mutex_};
  before_insert_ = std::move(hook);
}

template <>
storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view& path) {
  if (!path.empty()) {
    spdlog::debug("memory storage ignores path '{}'", path);
  }
  return storage<memory_storage_tag>{};
}

}  // namespace registrar::storage
