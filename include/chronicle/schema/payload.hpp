#pragma once

#include <chronicle/schema/command_completed.hpp>
#include <chronicle/schema/document_create.hpp>
#include <chronicle/schema/document_delete.hpp>
#include <chronicle/schema/document_update.hpp>
#include <chronicle/schema/entity_create.hpp>
#include <chronicle/schema/entity_delete.hpp>
#include <chronicle/schema/entity_update.hpp>
#include <chronicle/schema/member_remove.hpp>
#include <chronicle/schema/member_upsert.hpp>
#include <chronicle/schema/unvalidated_payload.hpp>
#include <chronicle/schema/workspace_create.hpp>
#include <chronicle/schema/workspace_update.hpp>

#include <string_view>
#include <variant>

namespace chronicle::schema {

/// Closed set of event payloads. The registry decides which alternative is
/// legal for a given event type.
using payload_t = std::variant<unvalidated_payload_t,
                               entity_create_t,
                               entity_update_t,
                               entity_delete_t,
                               document_create_t,
                               document_update_t,
                               document_delete_t,
                               workspace_create_t,
                               workspace_update_t,
                               member_upsert_t,
                               member_remove_t,
                               command_completed_t>;

std::string_view payload_name(const payload_t& payload);

}  // namespace chronicle::schema
