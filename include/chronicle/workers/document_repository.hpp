#pragma once

#include <chronicle/schema/document_row.hpp>
#include <chronicle/storage/rocksdb/storage.hpp>
#include <chronicle/workers/tenant_scope.hpp>

#include <optional>
#include <string_view>
#include <vector>

namespace chronicle::workers {

/// Document rows. Only the documents worker writes here.
class document_repository final {
 public:
  explicit document_repository(chronicle::storage::rocksdb_storage_t& storage);

  /// Insert or replace by id.
  void upsert(const chronicle::schema::document_row_t& row);

  /// Unscoped lookup, including soft deleted rows.
  std::optional<chronicle::schema::document_row_t> get(
      const std::string_view id) const;

  /// Live row visible to scope.
  std::optional<chronicle::schema::document_row_t> find(
      const std::string_view id,
      const tenant_scope_t& scope) const;

  /// Live rows owned by a user, in id order.
  std::vector<chronicle::schema::document_row_t> list_for_user(
      const std::string_view user_id) const;

  std::size_t count() const;

 private:
  chronicle::storage::rocksdb_storage_t& storage_;
};

}  // namespace chronicle::workers
