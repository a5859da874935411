#pragma once

#include <chronicle/common/ids.hpp>
#include <chronicle/schema/event.hpp>
#include <chronicle/storage/rocksdb/storage.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace chronicle::testing {

inline std::string make_db_path(const std::string_view prefix) {
  static auto counter = std::atomic<uint64_t>{};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)) +
                     "_" + std::to_string(counter++));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// RocksDB instance in a fresh temporary directory, removed on destruction.
struct temp_storage final {
  std::string path;
  chronicle::storage::rocksdb_storage_t storage;

  explicit temp_storage(const std::string_view prefix)
      : path{make_db_path(prefix)},
        storage{chronicle::storage::make_storage<
            chronicle::storage::rocksdb_storage_tag>(path)} {}

  ~temp_storage() {
    storage.database.reset();
    remove_path(path);
  }

  temp_storage(const temp_storage&) = delete;
  temp_storage& operator=(const temp_storage&) = delete;
};

inline chronicle::schema::event_t make_event(
    std::string type,
    chronicle::schema::payload_t data,
    std::optional<chronicle::schema::id_t> subject_id = std::nullopt,
    std::optional<chronicle::schema::user_id_t> user_id =
        std::string{"user-1"}) {
  auto event = chronicle::schema::event_t{};
  event.id = chronicle::common::make_uuid();
  event.type = std::move(type);
  event.subject_id = std::move(subject_id);
  event.user_id = std::move(user_id);
  event.timestamp = chronicle::common::now_ms();
  event.data = std::move(data);
  return event;
}

}  // namespace chronicle::testing
