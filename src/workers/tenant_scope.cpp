#include <chronicle/workers/tenant_scope.hpp>

namespace chronicle::workers {

tenant_scope_t make_tenant_scope(const chronicle::schema::event_t& event) {
  return tenant_scope_t{.user_id = event.user_id.value_or(""),
                        .workspace_id = event.scope.workspace_id};
}

bool visible(const tenant_scope_t& scope,
             const chronicle::schema::user_id_t& owner_id,
             const std::optional<chronicle::schema::id_t>& workspace_id) {
  if (workspace_id) {
    return scope.workspace_id == workspace_id;
  }
  return !scope.user_id.empty() && scope.user_id == owner_id;
}

}  // namespace chronicle::workers
