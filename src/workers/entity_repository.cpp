#include <chronicle/schema/key/builder.hpp>
#include <chronicle/workers/entity_repository.hpp>

namespace chronicle::workers {

using namespace chronicle::schema;

namespace {

using encoder_t = chronicle::schema::encoding::scale_encoder_t;

key::builder entity_key(const std::string_view id) {
  auto key = key::builder{};
  key.segment("ENT").write(id);
  return key;
}

key::builder owner_prefix(const std::string_view user_id) {
  auto key = key::builder{};
  key.segment("ENT-USR").segment(user_id);
  return key;
}

key::builder task_key(const std::string_view entity_id) {
  auto key = key::builder{};
  key.segment("TASK").write(entity_id);
  return key;
}

}  // namespace

entity_repository::entity_repository(
    chronicle::storage::rocksdb_storage_t& storage)
    : storage_{storage} {}

void entity_repository::upsert(const entity_row_t& row) {
  auto encoder = encoder_t{};
  auto batch = chronicle::storage::write_batch{};
  batch.put(encoder, entity_key(row.id).view(), row);
  batch.put(encoder, owner_prefix(row.user_id).write(row.id).view(), row.id);
  storage_.commit(batch);
}

std::optional<entity_row_t> entity_repository::get(
    const std::string_view id) const {
  auto encoder = encoder_t{};
  return storage_.get<encoder_t, entity_row_t>(encoder, entity_key(id).view());
}

std::optional<entity_row_t> entity_repository::find(
    const std::string_view id,
    const tenant_scope_t& scope) const {
  auto row = get(id);
  if (!row || row->audit.deleted_at ||
      !visible(scope, row->user_id, row->workspace_id)) {
    return std::nullopt;
  }
  return row;
}

std::vector<entity_row_t> entity_repository::list_for_user(
    const std::string_view user_id) const {
  auto encoder = encoder_t{};
  auto rows = std::vector<entity_row_t>{};
  for (const auto& id :
       storage_.scan<encoder_t, id_t>(encoder, owner_prefix(user_id).view())) {
    auto row = get(id);
    if (row && !row->audit.deleted_at) {
      rows.push_back(std::move(*row));
    }
  }
  return rows;
}

void entity_repository::upsert_task(const task_row_t& task) {
  auto encoder = encoder_t{};
  storage_.put(encoder, task_key(task.entity_id).view(), task);
}

std::optional<task_row_t> entity_repository::task(
    const std::string_view entity_id) const {
  auto encoder = encoder_t{};
  return storage_.get<encoder_t, task_row_t>(encoder,
                                             task_key(entity_id).view());
}

std::size_t entity_repository::count() const {
  auto prefix = key::builder{};
  prefix.segment("ENT");
  return storage_.list_by_prefix(prefix.view()).size();
}

}  // namespace chronicle::workers
