#pragma once
#include <spdlog/spdlog.h>
#include <mandate/common/critical.hpp>
#include <mandate/storage/storage.hpp>
#include <algorithm>
#include <iterator>
#include <map>
#include <memory>
#include <string_view>

namespace mandate::storage {

/// Process-local backend over an ordered map. Used as the store test double
/// and by hosts that keep delegation state elsewhere.
struct memory_storage_tag {};

template <>
struct storage<memory_storage_tag> final {
  std::unique_ptr<std::map<mandate::schema::bytes_t, mandate::schema::bytes_t>>
      database;

  std::optional<mandate::schema::bytes_t> get(
      const mandate::schema::bytes_view_t& key) const;

  void write(const std::vector<write_entry_t>& entries) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const mandate::schema::bytes_view_t& prefix) const;
};

template <>
inline storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view& path) {
  auto store = storage<memory_storage_tag>();
  store.database = std::make_unique<
      std::map<mandate::schema::bytes_t, mandate::schema::bytes_t>>();
  spdlog::debug("Opened in-memory storage '{}'", path);
  return store;
}

inline std::optional<mandate::schema::bytes_t>
storage<memory_storage_tag>::get(
    const mandate::schema::bytes_view_t& key) const {
  if (!database) {
    mandate::common::critical("in-memory database is not initialized");
  }
  auto it = database->find(mandate::schema::make_bytes(key));
  if (it == std::end(*database)) {
    return std::nullopt;
  }
  return it->second;
}

inline void storage<memory_storage_tag>::write(
    const std::vector<write_entry_t>& entries) const {
  if (!database) {
    mandate::common::critical("in-memory database is not initialized");
  }
  for (const auto& [key, value] : entries) {
    if (value.has_value()) {
      (*database)[key] = *value;
    } else {
      database->erase(key);
    }
  }
}

inline std::vector<key_value_entry_t>
storage<memory_storage_tag>::list_by_prefix(
    const mandate::schema::bytes_view_t& prefix) const {
  if (!database) {
    mandate::common::critical("in-memory database is not initialized");
  }
  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_bytes = mandate::schema::make_bytes(prefix);
  for (auto it = database->lower_bound(prefix_bytes);
       it != std::end(*database); ++it) {
    const auto& key = it->first;
    if (key.size() < prefix_bytes.size() ||
        !std::equal(std::begin(prefix_bytes), std::end(prefix_bytes),
                    std::begin(key))) {
      break;
    }
    entries.push_back(*it);
  }
  return entries;
}

}  // namespace mandate::storage
