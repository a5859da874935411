#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <chronicle/common/critical.hpp>
#include <chronicle/schema/encoding/scale/encoder.hpp>
#include <chronicle/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string_view>

namespace chronicle::storage {

namespace detail {

inline chronicle::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const chronicle::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const chronicle::schema::bytes_view_t& key) const;

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const chronicle::schema::bytes_view_t& key,
           const T& value) const;

  template <typename Encoder, typename T>
  bool put_if_absent(Encoder& encoder,
                     const chronicle::schema::bytes_view_t& key,
                     const T& value) const;

  bool contains(const chronicle::schema::bytes_view_t& key) const;
  void erase(const chronicle::schema::bytes_view_t& key) const;
  void commit(const write_batch& batch) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const chronicle::schema::bytes_view_t& prefix) const;

  template <typename Encoder, typename T>
  std::vector<T> scan(Encoder& encoder,
                      const chronicle::schema::bytes_view_t& prefix) const;

 private:
  void require_open() const;
};

using rocksdb_storage_t = storage<rocksdb_storage_tag>;

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline void storage<rocksdb_storage_tag>::require_open() const {
  if (!database) {
    chronicle::common::critical("RocksDB database is not initialized");
  }
}

template <typename Encoder, typename T>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const chronicle::schema::bytes_view_t& key) const {
  require_open();
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    } else {
      spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
      chronicle::common::critical("Failed to get value from RocksDB");
    }
  }
  return {encoder.template decode<T>(chronicle::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename Encoder, typename T>
void storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const chronicle::schema::bytes_view_t& key,
    const T& value) const {
  require_open();
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(chronicle::schema::make_bytes_view(encoded_value)));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    chronicle::common::critical("Failed to put value into RocksDB");
  }
}

// Callers only race on keys whose value is a pure function of the key
// (projection rows, memoized steps), so a lost race rewrites identical bytes.
template <typename Encoder, typename T>
bool storage<rocksdb_storage_tag>::put_if_absent(
    Encoder& encoder,
    const chronicle::schema::bytes_view_t& key,
    const T& value) const {
  if (contains(key)) {
    return false;
  }
  put(encoder, key, value);
  return true;
}

inline bool storage<rocksdb_storage_tag>::contains(
    const chronicle::schema::bytes_view_t& key) const {
  require_open();
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return false;
  }
  if (!status.ok()) {
    spdlog::error("Failed to probe RocksDB key: {}", status.ToString());
    chronicle::common::critical("Failed to probe RocksDB key");
  }
  return true;
}

inline void storage<rocksdb_storage_tag>::erase(
    const chronicle::schema::bytes_view_t& key) const {
  require_open();
  auto status = database->Delete(ROCKSDB_NAMESPACE::WriteOptions{},
                                 detail::to_slice(key));
  if (!status.ok()) {
    spdlog::error("Failed to delete RocksDB key: {}", status.ToString());
    chronicle::common::critical("Failed to delete RocksDB key");
  }
}

inline void storage<rocksdb_storage_tag>::commit(
    const write_batch& batch) const {
  require_open();
  auto rocks_batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : batch.puts) {
    auto put_status =
        rocks_batch.Put(detail::to_slice(chronicle::schema::make_bytes_view(key)),
                        detail::to_slice(chronicle::schema::make_bytes_view(value)));
    if (!put_status.ok()) {
      chronicle::common::critical("failed staging key in write batch");
    }
  }
  for (const auto& key : batch.erases) {
    auto delete_status =
        rocks_batch.Delete(detail::to_slice(chronicle::schema::make_bytes_view(key)));
    if (!delete_status.ok()) {
      chronicle::common::critical("failed staging delete in write batch");
    }
  }
  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &rocks_batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit write batch: {}", write_status.ToString());
    chronicle::common::critical("failed to commit write batch");
  }
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const chronicle::schema::bytes_view_t& prefix) const {
  require_open();

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
    chronicle::common::critical("RocksDB iteration failed");
  }
  return entries;
}

template <typename Encoder, typename T>
std::vector<T> storage<rocksdb_storage_tag>::scan(
    Encoder& encoder,
    const chronicle::schema::bytes_view_t& prefix) const {
  auto values = std::vector<T>{};
  for (const auto& [key, value] : list_by_prefix(prefix)) {
    values.push_back(encoder.template decode<T>(
        chronicle::schema::bytes_view_t{value.data(), value.size()}));
  }
  return values;
}

}  // namespace chronicle::storage
