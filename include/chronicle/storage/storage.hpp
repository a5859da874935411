#pragma once
#include <chronicle/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace chronicle::storage {

using key_value_entry_t =
    std::pair<chronicle::schema::bytes_t, chronicle::schema::bytes_t>;

/// Set of writes applied atomically by storage::commit().
struct write_batch final {
  std::vector<key_value_entry_t> puts;
  std::vector<chronicle::schema::bytes_t> erases;

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const chronicle::schema::bytes_view_t& key,
           const T& value) {
    puts.emplace_back(chronicle::schema::make_bytes(key),
                      encoder.encode(value));
  }
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const chronicle::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const chronicle::schema::bytes_view_t& key,
           const T& value) const;

  /// Persist value unless the key already exists. Returns true when written.
  template <typename Encoder, typename T>
  bool put_if_absent(Encoder& encoder,
                     const chronicle::schema::bytes_view_t& key,
                     const T& value) const;

  bool contains(const chronicle::schema::bytes_view_t& key) const;

  void erase(const chronicle::schema::bytes_view_t& key) const;

  /// Apply every put and erase of the batch atomically.
  void commit(const write_batch& batch) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const chronicle::schema::bytes_view_t& prefix) const;

  /// Decode every value under prefix, in key order.
  template <typename Encoder, typename T>
  std::vector<T> scan(Encoder& encoder,
                      const chronicle::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace chronicle::storage
