#pragma once

#include <chronicle/schema/event.hpp>
#include <chronicle/schema/primitives.hpp>

#include <optional>

namespace chronicle::workers {

/// Caller identity applied to every row read. Workspace rows are visible
/// inside their workspace; personal rows only to their owner.
struct tenant_scope_t final {
  chronicle::schema::user_id_t user_id;
  std::optional<chronicle::schema::id_t> workspace_id;
};

tenant_scope_t make_tenant_scope(const chronicle::schema::event_t& event);

bool visible(const tenant_scope_t& scope,
             const chronicle::schema::user_id_t& owner_id,
             const std::optional<chronicle::schema::id_t>& workspace_id);

}  // namespace chronicle::workers
