#include <chronicle/governor/membership_directory.hpp>
#include <chronicle/schema/key/builder.hpp>

#include <spdlog/spdlog.h>

namespace chronicle::governor {

using namespace chronicle::schema;

namespace {

using encoder_t = chronicle::schema::encoding::scale_encoder_t;

key::builder context_prefix(const context_type_t context_type,
                            const std::string_view context_id) {
  auto key = key::builder{};
  key.segment("MEM").segment(to_string(context_type)).segment(context_id);
  return key;
}

key::builder settings_key(const std::string_view workspace_id) {
  auto key = key::builder{};
  key.segment("WSP").write(workspace_id);
  return key;
}

}  // namespace

membership_directory::membership_directory(
    chronicle::storage::rocksdb_storage_t& storage)
    : storage_{storage} {}

void membership_directory::upsert(const membership_t& membership) {
  auto encoder = encoder_t{};
  storage_.put(encoder,
               context_prefix(membership.context_type, membership.context_id)
                   .write(membership.user_id)
                   .view(),
               membership);
  spdlog::info("Granted {} on {} {} to {}", to_string(membership.role),
               to_string(membership.context_type), membership.context_id,
               membership.user_id);
}

bool membership_directory::remove(const context_type_t context_type,
                                  const std::string_view context_id,
                                  const std::string_view user_id) {
  auto key = context_prefix(context_type, context_id);
  key.write(user_id);
  if (!storage_.contains(key.view())) {
    return false;
  }
  storage_.erase(key.view());
  spdlog::info("Removed {} from {} {}", user_id, to_string(context_type),
               context_id);
  return true;
}

std::optional<membership_t> membership_directory::find(
    const context_type_t context_type,
    const std::string_view context_id,
    const std::string_view user_id) const {
  auto encoder = encoder_t{};
  return storage_.get<encoder_t, membership_t>(
      encoder, context_prefix(context_type, context_id).write(user_id).view());
}

std::vector<membership_t> membership_directory::members(
    const context_type_t context_type,
    const std::string_view context_id) const {
  auto encoder = encoder_t{};
  return storage_.scan<encoder_t, membership_t>(
      encoder, context_prefix(context_type, context_id).view());
}

void membership_directory::save_settings(
    const workspace_settings_t& settings) {
  auto encoder = encoder_t{};
  storage_.put(encoder, settings_key(settings.workspace_id).view(), settings);
}

std::optional<workspace_settings_t> membership_directory::settings(
    const std::string_view workspace_id) const {
  auto encoder = encoder_t{};
  return storage_.get<encoder_t, workspace_settings_t>(
      encoder, settings_key(workspace_id).view());
}

}  // namespace chronicle::governor
