#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <mandate/common/critical.hpp>
#include <mandate/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>

namespace mandate::storage {

namespace detail {

inline mandate::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const mandate::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  std::optional<mandate::schema::bytes_t> get(
      const mandate::schema::bytes_view_t& key) const;

  void write(const std::vector<write_entry_t>& entries) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const mandate::schema::bytes_view_t& prefix) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline std::optional<mandate::schema::bytes_t>
storage<rocksdb_storage_tag>::get(
    const mandate::schema::bytes_view_t& key) const {
  if (!database) {
    mandate::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    mandate::common::critical("Failed to get value from RocksDB");
  }
  return mandate::schema::bytes_t(std::begin(value), std::end(value));
}

inline void storage<rocksdb_storage_tag>::write(
    const std::vector<write_entry_t>& entries) const {
  if (!database) {
    mandate::common::critical("RocksDB database is not initialized");
  }
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto key_slice = detail::to_slice(
        mandate::schema::bytes_view_t{key.data(), key.size()});
    auto status = value.has_value()
                      ? batch.Put(key_slice,
                                  detail::to_slice(mandate::schema::bytes_view_t{
                                      value->data(), value->size()}))
                      : batch.Delete(key_slice);
    if (!status.ok()) {
      spdlog::error("Failed to stage RocksDB batch entry: {}",
                    status.ToString());
      mandate::common::critical("failed staging write batch");
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit RocksDB batch: {}",
                  write_status.ToString());
    mandate::common::critical("failed to commit write batch");
  }
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const mandate::schema::bytes_view_t& prefix) const {
  if (!database) {
    mandate::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

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
    mandate::common::critical("failed iterating key prefix");
  }
  return entries;
}

}  // namespace mandate::storage
