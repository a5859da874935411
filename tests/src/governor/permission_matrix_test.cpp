#include <chronicle/governor/permission_matrix.hpp>
#include <gtest/gtest.h>

#include <array>

namespace {

using namespace chronicle::schema;
using chronicle::governor::has_permission;
using chronicle::governor::minimum_role;
using chronicle::governor::required_permission;

constexpr auto kRoles =
    std::array{role_t::viewer, role_t::editor, role_t::admin, role_t::owner};
constexpr auto kPermissions =
    std::array{permission_t::read, permission_t::write, permission_t::remove,
               permission_t::manage, permission_t::invite};

}  // namespace

TEST(permission_matrix, grants_are_fixed_per_role) {
  EXPECT_TRUE(has_permission(role_t::viewer, permission_t::read));
  EXPECT_FALSE(has_permission(role_t::viewer, permission_t::write));
  EXPECT_TRUE(has_permission(role_t::editor, permission_t::write));
  EXPECT_FALSE(has_permission(role_t::editor, permission_t::invite));
  EXPECT_TRUE(has_permission(role_t::admin, permission_t::invite));
  EXPECT_TRUE(has_permission(role_t::admin, permission_t::manage));
  EXPECT_FALSE(has_permission(role_t::admin, permission_t::remove));
  for (auto permission : kPermissions) {
    EXPECT_TRUE(has_permission(role_t::owner, permission));
  }
}

TEST(permission_matrix, stronger_roles_never_lose_permissions) {
  for (auto permission : kPermissions) {
    auto held = false;
    for (auto role : kRoles) {
      auto now = has_permission(role, permission);
      EXPECT_TRUE(now || !held) << to_string(role) << " " << to_string(permission);
      held = now;
    }
  }
}

TEST(permission_matrix, minimum_roles) {
  EXPECT_EQ(minimum_role(permission_t::read), role_t::viewer);
  EXPECT_EQ(minimum_role(permission_t::write), role_t::editor);
  EXPECT_EQ(minimum_role(permission_t::invite), role_t::admin);
  EXPECT_EQ(minimum_role(permission_t::remove), role_t::owner);
}

TEST(permission_matrix, actions_map_to_permissions) {
  EXPECT_EQ(required_permission("entities", "create"), permission_t::write);
  EXPECT_EQ(required_permission("entities", "update"), permission_t::write);
  EXPECT_EQ(required_permission("entities", "delete"), permission_t::remove);
  EXPECT_EQ(required_permission("documents", "read"), permission_t::read);
  EXPECT_EQ(required_permission("workspaces", "update"), permission_t::manage);
  EXPECT_EQ(required_permission("workspace_members", "create"),
            permission_t::invite);
  EXPECT_EQ(required_permission("project_members", "delete"),
            permission_t::manage);
  EXPECT_FALSE(required_permission("entities", "explode").has_value());
}
