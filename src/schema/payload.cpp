#include <chronicle/schema/payload.hpp>

namespace chronicle::schema {

std::string_view payload_name(const payload_t& payload) {
  return std::visit(
      overloaded{
          [](const unvalidated_payload_t&) -> std::string_view {
            return "unvalidated";
          },
          [](const entity_create_t&) -> std::string_view {
            return "entity_create";
          },
          [](const entity_update_t&) -> std::string_view {
            return "entity_update";
          },
          [](const entity_delete_t&) -> std::string_view {
            return "entity_delete";
          },
          [](const document_create_t&) -> std::string_view {
            return "document_create";
          },
          [](const document_update_t&) -> std::string_view {
            return "document_update";
          },
          [](const document_delete_t&) -> std::string_view {
            return "document_delete";
          },
          [](const workspace_create_t&) -> std::string_view {
            return "workspace_create";
          },
          [](const workspace_update_t&) -> std::string_view {
            return "workspace_update";
          },
          [](const member_upsert_t&) -> std::string_view {
            return "member_upsert";
          },
          [](const member_remove_t&) -> std::string_view {
            return "member_remove";
          },
          [](const command_completed_t&) -> std::string_view {
            return "command_completed";
          }},
      payload);
}

}  // namespace chronicle::schema
