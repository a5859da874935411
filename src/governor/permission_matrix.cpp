#include <chronicle/governor/permission_matrix.hpp>
#include <chronicle/schema/action.hpp>

#include <algorithm>
#include <array>

namespace chronicle::governor {

using namespace chronicle::schema;

namespace {

constexpr auto kViewer = std::array{permission_t::read};
constexpr auto kEditor = std::array{permission_t::read, permission_t::write};
constexpr auto kAdmin = std::array{permission_t::read, permission_t::write,
                                   permission_t::manage, permission_t::invite};
constexpr auto kOwner =
    std::array{permission_t::read, permission_t::write, permission_t::remove,
               permission_t::manage, permission_t::invite};

bool is_membership_subject(const std::string_view subject) {
  return subject == "workspace_members" || subject == "project_members";
}

}  // namespace

std::span<const permission_t> permissions_for(const role_t role) {
  switch (role) {
    case role_t::viewer:
      return kViewer;
    case role_t::editor:
      return kEditor;
    case role_t::admin:
      return kAdmin;
    case role_t::owner:
      return kOwner;
  }
  return {};
}

bool has_permission(const role_t role, const permission_t permission) {
  return std::ranges::find(permissions_for(role), permission) !=
         std::end(permissions_for(role));
}

std::optional<permission_t> required_permission(const std::string_view subject,
                                                const std::string_view action) {
  auto parsed = try_from_string<action_t>(action);
  if (!parsed) {
    return std::nullopt;
  }
  if (*parsed == action_t::read || *parsed == action_t::list) {
    return permission_t::read;
  }
  if (is_membership_subject(subject)) {
    return *parsed == action_t::create ? permission_t::invite
                                       : permission_t::manage;
  }
  if (subject == "workspaces" && *parsed == action_t::update) {
    return permission_t::manage;
  }
  if (*parsed == action_t::remove) {
    return permission_t::remove;
  }
  return permission_t::write;
}

role_t minimum_role(const permission_t permission) {
  for (auto role :
       {role_t::viewer, role_t::editor, role_t::admin, role_t::owner}) {
    if (has_permission(role, permission)) {
      return role;
    }
  }
  return role_t::owner;
}

}  // namespace chronicle::governor
