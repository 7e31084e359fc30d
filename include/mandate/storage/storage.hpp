#pragma once
#include <mandate/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace mandate::storage {

using key_value_entry_t =
    std::pair<mandate::schema::bytes_t, mandate::schema::bytes_t>;

/// One staged mutation: a value to put, or std::nullopt to delete the key.
using write_entry_t =
    std::pair<mandate::schema::bytes_t,
              std::optional<mandate::schema::bytes_t>>;

template <typename Library>
struct storage {
  /// Return raw bytes at key, or std::nullopt when missing.
  std::optional<mandate::schema::bytes_t> get(
      const mandate::schema::bytes_view_t& key) const;

  /// Apply all puts and deletes as one atomic batch.
  void write(const std::vector<write_entry_t>& entries) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const mandate::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace mandate::storage
