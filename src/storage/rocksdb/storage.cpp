#include <mandate/common/critical.hpp>
#include <mandate/storage/rocksdb/storage.hpp>

namespace mandate::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.paranoid_checks = true;
  options.keep_log_file_num = 4;

  ROCKSDB_NAMESPACE::DB* raw{nullptr};
  auto status = ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &raw);
  if (!status.ok()) {
    spdlog::error("Cannot open delegation database '{}': {}", path,
                  status.ToString());
    mandate::common::critical("failed to open RocksDB");
  }
  spdlog::debug("Opened delegation database '{}'", path);

  auto opened = storage<rocksdb_storage_tag>{};
  opened.database.reset(raw);
  return opened;
}

}  // namespace mandate::storage
