#include <chronicle/common/ids.hpp>
#include <chronicle/governor/governor.hpp>
#include <chronicle/governor/permission_matrix.hpp>
#include <chronicle/schema/error_code.hpp>
#include <chronicle/schema/event_type.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace chronicle::governor {

using namespace chronicle::schema;

namespace {

constexpr auto kResolutionKey = std::string_view{"approval.resolution"};

permission_decision_t deny(std::string reason) {
  return permission_decision_t{.granted = false,
                               .needs_approval = false,
                               .approvers = {},
                               .reason = std::move(reason)};
}

permission_decision_t grant(std::string reason) {
  return permission_decision_t{.granted = true,
                               .needs_approval = false,
                               .approvers = {},
                               .reason = std::move(reason)};
}

permission_decision_t await(user_id_t approver, std::string reason) {
  return permission_decision_t{.granted = false,
                               .needs_approval = true,
                               .approvers = {std::move(approver)},
                               .reason = std::move(reason)};
}

phase_t phase_of(const permission_decision_t& decision) {
  if (decision.granted) {
    return phase_t::validated;
  }
  return decision.needs_approval ? phase_t::pending : phase_t::denied;
}

/// Copy of `origin` retyped to `type`, caused by `origin`.
event_t derive(const event_t& origin, std::string type) {
  auto derived = origin;
  derived.id = chronicle::common::make_uuid();
  derived.type = std::move(type);
  derived.timestamp = chronicle::common::now_ms();
  derived.trace.causation_id = origin.id;
  if (!derived.trace.correlation_id) {
    derived.trace.correlation_id = origin.id;
  }
  derived.metadata.approval.reset();
  derived.metadata.annotations.clear();
  return derived;
}

}  // namespace

governor::governor(chronicle::events::event_store& store,
                   const membership_directory& directory,
                   chronicle::events::publisher& publisher)
    : store_{store}, directory_{directory}, publisher_{publisher} {}

permission_decision_t governor::decide(const event_t& event) const {
  if (!event.user_id || event.user_id->empty()) {
    return deny("no user context");
  }
  auto type = parse_event_type(event.type);
  if (!type) {
    return deny(fmt::format("malformed event type '{}'", event.type));
  }
  const auto& user_id = *event.user_id;
  const auto& workspace_id = event.scope.workspace_id;

  if (event.source == source_t::intelligence) {
    if (!workspace_id) {
      return await(user_id, "AI-initiated command requires user approval");
    }
    auto settings = directory_.settings(*workspace_id);
    if (!settings) {
      return deny(fmt::format("workspace {} not found", *workspace_id));
    }
    if (!settings->ai_auto_approve) {
      return await(settings->owner_id,
                   "AI-initiated command requires approval from the "
                   "workspace owner");
    }
  }

  if (!workspace_id) {
    return grant("personal resource");
  }

  auto membership =
      directory_.find(context_type_t::workspace, *workspace_id, user_id);
  if (!membership) {
    return deny(fmt::format("user {} is not a member of workspace {}", user_id,
                            *workspace_id));
  }
  auto role = membership->role;
  auto context = std::string_view{"workspace"};
  if (event.scope.project_id) {
    auto project =
        directory_.find(context_type_t::project, *event.scope.project_id, user_id);
    if (project) {
      role = project->role;
      context = "project";
    }
  }

  auto permission = required_permission(type->subject, type->action);
  if (!permission) {
    return deny(fmt::format("unsupported action '{}'", type->action));
  }
  if (!has_permission(role, *permission)) {
    return deny(fmt::format(
        "insufficient role: {} role '{}' lacks '{}' permission (requires {})",
        context, to_string(role), to_string(*permission),
        to_string(minimum_role(*permission))));
  }
  return grant(fmt::format("{} role '{}' grants '{}'", context,
                           to_string(role), to_string(*permission)));
}

std::optional<id_t> governor::process(const stored_event_t& requested) {
  const auto& event = requested.event;
  auto type = parse_event_type(event.type);
  if (!type || type->phase != phase_t::requested) {
    spdlog::warn("Governor ignoring non-requested event {} ({})", event.id,
                 event.type);
    return std::nullopt;
  }

  auto decision = decide(event);
  auto annotated = store_.annotate(event.id, decision);
  if (annotated.code != 0) {
    throw std::runtime_error{annotated.log};
  }

  auto phase = phase_of(decision);
  auto outcome = derive(event, with_phase(*type, phase));
  // Redelivery of the same requested event must map onto the same outcome.
  outcome.id = chronicle::common::make_deterministic_uuid("governor", event.id);
  outcome.metadata.approval = decision;

  auto published = publisher_.publish(outcome);
  if (published.code == to_code(error_code::duplicate_event)) {
    spdlog::debug("Decision for {} already published", event.id);
    return outcome.id;
  }
  if (published.code != 0) {
    throw std::runtime_error{fmt::format("failed to publish {}: {}",
                                         outcome.type, published.log)};
  }
  spdlog::info("{} -> {} ({})", event.type, to_string(phase), decision.reason);
  return outcome.id;
}

resolution_result governor::resolve_pending(
    const std::string_view pending_event_id,
    const std::string_view approver_id,
    const bool approve) {
  auto pending = store_.get(pending_event_id);
  if (!pending) {
    return resolution_result{
        .code = to_code(error_code::event_not_found),
        .log = fmt::format("event {} not found", pending_event_id)};
  }
  const auto& event = pending->event;
  auto type = parse_event_type(event.type);
  if (!type || type->phase != phase_t::pending) {
    return resolution_result{
        .code = to_code(error_code::not_pending),
        .log = fmt::format("event {} is not pending", pending_event_id)};
  }
  if (find_property(event.metadata.annotations, kResolutionKey)) {
    return resolution_result{
        .code = to_code(error_code::not_pending),
        .log = fmt::format("event {} was already resolved", pending_event_id)};
  }
  const auto& approvers = event.metadata.approval
                              ? event.metadata.approval->approvers
                              : std::vector<user_id_t>{};
  if (std::ranges::find(approvers, approver_id) == std::end(approvers)) {
    return resolution_result{
        .code = to_code(error_code::not_an_approver),
        .log = fmt::format("{} may not resolve {}", approver_id,
                           pending_event_id)};
  }

  auto next = approve ? derive(event, with_phase(*type, phase_t::requested))
                      : derive(event, with_phase(*type, phase_t::denied));
  if (approve) {
    // The approver takes ownership of the command, which now goes through
    // the normal role checks as a human request.
    next.user_id = std::string{approver_id};
    next.source = source_t::user;
  } else {
    next.metadata.approval =
        deny(fmt::format("rejected by {}", approver_id));
  }

  // One resolution per pending event: a second attempt collides on the id.
  next.id = chronicle::common::make_deterministic_uuid("resolution",
                                                      pending_event_id);
  auto published = publisher_.publish(next);
  if (published.code == to_code(error_code::duplicate_event)) {
    record_resolution(pending_event_id, next.id);
    return resolution_result{
        .code = to_code(error_code::not_pending),
        .log = fmt::format("event {} was already resolved", pending_event_id)};
  }
  if (published.code != 0) {
    return resolution_result{.code = published.code, .log = published.log};
  }
  record_resolution(pending_event_id, next.id);
  spdlog::info("Pending {} {} by {}", pending_event_id,
               approve ? "approved" : "rejected", approver_id);
  return resolution_result{.event_id = next.id};
}

void governor::record_resolution(const std::string_view pending_event_id,
                                 const std::string_view resolution_id) {
  auto resolution = store_.get(resolution_id);
  if (!resolution) {
    return;
  }
  auto type = parse_event_type(resolution->event.type);
  auto value = type && type->phase == phase_t::denied ? "rejected" : "approved";
  auto recorded = store_.annotate_once(pending_event_id, kResolutionKey, value);
  if (recorded.code != 0) {
    spdlog::warn("Could not record resolution of {}: {}", pending_event_id,
                 recorded.log);
  }
}

}  // namespace chronicle::governor
