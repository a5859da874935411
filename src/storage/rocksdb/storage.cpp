#include <chronicle/common/critical.hpp>
#include <chronicle/storage/rocksdb/storage.hpp>
#include <algorithm>
#include <filesystem>
#include <system_error>
#include <thread>

namespace chronicle::storage {

namespace {

ROCKSDB_NAMESPACE::Options event_log_options() {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.paranoid_checks = true;
  options.keep_log_file_num = 4;
  // Event keys are append-mostly and read back by prefix scans.
  options.OptimizeLevelStyleCompaction();
  auto threads = static_cast<int>(
      std::max(2u, std::thread::hardware_concurrency()));
  options.IncreaseParallelism(threads);
  return options;
}

}  // namespace

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto directory = std::filesystem::path{std::string{path}};
  auto error = std::error_code{};
  std::filesystem::create_directories(directory, error);
  if (error) {
    spdlog::error("Cannot create storage directory {}: {}", directory.string(),
                  error.message());
    chronicle::common::critical("storage", "storage directory unavailable");
  }

  ROCKSDB_NAMESPACE::DB* raw{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(event_log_options(), directory.string(), &raw);
  if (!status.ok()) {
    spdlog::error("RocksDB open failed for {}: {}", directory.string(),
                  status.ToString());
    chronicle::common::critical("storage", "event log cannot be opened");
  }

  auto store = storage<rocksdb_storage_tag>{};
  store.database.reset(raw);
  spdlog::debug("Event log ready at {}", directory.string());
  return store;
}

}  // namespace chronicle::storage
