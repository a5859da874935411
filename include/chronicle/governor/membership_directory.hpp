#pragma once

#include <chronicle/schema/membership.hpp>
#include <chronicle/storage/rocksdb/storage.hpp>

#include <optional>
#include <string_view>
#include <vector>

namespace chronicle::governor {

/// Role memberships and workspace settings. Written by the membership
/// worker, read by the governor.
class membership_directory final {
 public:
  explicit membership_directory(chronicle::storage::rocksdb_storage_t& storage);

  void upsert(const chronicle::schema::membership_t& membership);

  /// Returns false when there was nothing to remove.
  bool remove(const chronicle::schema::context_type_t context_type,
              const std::string_view context_id,
              const std::string_view user_id);

  std::optional<chronicle::schema::membership_t> find(
      const chronicle::schema::context_type_t context_type,
      const std::string_view context_id,
      const std::string_view user_id) const;

  std::vector<chronicle::schema::membership_t> members(
      const chronicle::schema::context_type_t context_type,
      const std::string_view context_id) const;

  void save_settings(const chronicle::schema::workspace_settings_t& settings);

  std::optional<chronicle::schema::workspace_settings_t> settings(
      const std::string_view workspace_id) const;

 private:
  chronicle::storage::rocksdb_storage_t& storage_;
};

}  // namespace chronicle::governor
