#pragma once

#include <chronicle/schema/entity_row.hpp>
#include <chronicle/storage/rocksdb/storage.hpp>
#include <chronicle/workers/tenant_scope.hpp>

#include <optional>
#include <string_view>
#include <vector>

namespace chronicle::workers {

/// Entity rows and their task extension. Only the entities worker writes
/// here.
class entity_repository final {
 public:
  explicit entity_repository(chronicle::storage::rocksdb_storage_t& storage);

  /// Insert or replace by id.
  void upsert(const chronicle::schema::entity_row_t& row);

  /// Unscoped lookup, including soft deleted rows.
  std::optional<chronicle::schema::entity_row_t> get(
      const std::string_view id) const;

  /// Live row visible to scope.
  std::optional<chronicle::schema::entity_row_t> find(
      const std::string_view id,
      const tenant_scope_t& scope) const;

  /// Live rows owned by a user, in id order.
  std::vector<chronicle::schema::entity_row_t> list_for_user(
      const std::string_view user_id) const;

  void upsert_task(const chronicle::schema::task_row_t& task);

  std::optional<chronicle::schema::task_row_t> task(
      const std::string_view entity_id) const;

  std::size_t count() const;

 private:
  chronicle::storage::rocksdb_storage_t& storage_;
};

}  // namespace chronicle::workers
