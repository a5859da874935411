#include <chronicle/schema/key/builder.hpp>
#include <chronicle/workers/document_repository.hpp>

namespace chronicle::workers {

using namespace chronicle::schema;

namespace {

using encoder_t = chronicle::schema::encoding::scale_encoder_t;

key::builder document_key(const std::string_view id) {
  auto key = key::builder{};
  key.segment("DOC").write(id);
  return key;
}

key::builder owner_prefix(const std::string_view user_id) {
  auto key = key::builder{};
  key.segment("DOC-USR").segment(user_id);
  return key;
}

}  // namespace

document_repository::document_repository(
    chronicle::storage::rocksdb_storage_t& storage)
    : storage_{storage} {}

void document_repository::upsert(const document_row_t& row) {
  auto encoder = encoder_t{};
  auto batch = chronicle::storage::write_batch{};
  batch.put(encoder, document_key(row.id).view(), row);
  batch.put(encoder, owner_prefix(row.user_id).write(row.id).view(), row.id);
  storage_.commit(batch);
}

std::optional<document_row_t> document_repository::get(
    const std::string_view id) const {
  auto encoder = encoder_t{};
  return storage_.get<encoder_t, document_row_t>(encoder,
                                                 document_key(id).view());
}

std::optional<document_row_t> document_repository::find(
    const std::string_view id,
    const tenant_scope_t& scope) const {
  auto row = get(id);
  if (!row || row->audit.deleted_at ||
      !visible(scope, row->user_id, row->workspace_id)) {
    return std::nullopt;
  }
  return row;
}

std::vector<document_row_t> document_repository::list_for_user(
    const std::string_view user_id) const {
  auto encoder = encoder_t{};
  auto rows = std::vector<document_row_t>{};
  for (const auto& id :
       storage_.scan<encoder_t, id_t>(encoder, owner_prefix(user_id).view())) {
    auto row = get(id);
    if (row && !row->audit.deleted_at) {
      rows.push_back(std::move(*row));
    }
  }
  return rows;
}

std::size_t document_repository::count() const {
  auto prefix = key::builder{};
  prefix.segment("DOC");
  return storage_.list_by_prefix(prefix.view()).size();
}

}  // namespace chronicle::workers
