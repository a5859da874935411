#include <chronicle/schema/command_completed.hpp>
#include <chronicle/schema/error_code.hpp>
#include <chronicle/testing/pipeline_fixture.hpp>
#include <chronicle/workers/membership_worker.hpp>
#include <gtest/gtest.h>

namespace {

using namespace chronicle::schema;
using chronicle::testing::pipeline_fixture;
using chronicle::workers::membership_worker;

class membership_worker_test : public pipeline_fixture {
 protected:
  std::optional<execution_failure_t> failure_of(const std::string& type) {
    auto validated = events_of_type(type);
    EXPECT_FALSE(validated.empty()) << "no " << type;
    if (validated.empty()) {
      return std::nullopt;
    }
    return chronicle().runner().failure(validated.back().event.id,
                                        membership_worker::kName);
  }
};

}  // namespace

TEST_F(membership_worker_test, creating_a_workspace_makes_its_creator_owner) {
  auto workspace_id = create_workspace("owner", false);

  auto settings = chronicle().directory().settings(workspace_id);
  ASSERT_TRUE(settings.has_value());
  EXPECT_EQ(settings->owner_id, "owner");
  EXPECT_EQ(settings->name, "Team");
  EXPECT_FALSE(settings->ai_auto_approve);

  auto membership = chronicle().directory().find(context_type_t::workspace,
                                                 workspace_id, "owner");
  ASSERT_TRUE(membership.has_value());
  EXPECT_EQ(membership->role, role_t::owner);

  auto completed = events_of_type("workspaces.create.completed");
  ASSERT_EQ(completed.size(), 1u);
  EXPECT_EQ(std::get<command_completed_t>(completed[0].event.data).resource_id,
            workspace_id);
}

TEST_F(membership_worker_test, another_user_cannot_take_over_a_workspace_id) {
  auto workspace_id = create_workspace("owner", false);
  ASSERT_EQ(submit("workspaces.create.requested",
                   workspace_create_t{.workspace_id = workspace_id,
                                      .name = "Mine"},
                   "intruder")
                .code,
            0u);

  auto failure = failure_of("workspaces.create.validated");
  ASSERT_TRUE(failure.has_value());
  EXPECT_EQ(failure->attempts, 1u);
  EXPECT_EQ(chronicle().directory().settings(workspace_id)->owner_id, "owner");
  EXPECT_FALSE(chronicle()
                   .directory()
                   .find(context_type_t::workspace, workspace_id, "intruder")
                   .has_value());
}

TEST_F(membership_worker_test, owners_can_update_workspace_settings) {
  auto workspace_id = create_workspace("owner", false);
  ASSERT_EQ(submit("workspaces.update.requested",
                   workspace_update_t{.workspace_id = workspace_id,
                                      .name = "Renamed",
                                      .ai_auto_approve = true},
                   "owner", workspace_id, source_t::user, workspace_id)
                .code,
            0u);

  auto settings = chronicle().directory().settings(workspace_id);
  ASSERT_TRUE(settings.has_value());
  EXPECT_EQ(settings->name, "Renamed");
  EXPECT_TRUE(settings->ai_auto_approve);
  EXPECT_EQ(settings->owner_id, "owner");
  EXPECT_EQ(events_of_type("workspaces.update.completed").size(), 1u);
}

TEST_F(membership_worker_test, updating_a_workspace_outside_the_scope_fails) {
  auto workspace_id = create_workspace("owner", false);
  auto other_id = create_workspace("someone-else", false);
  ASSERT_EQ(submit("workspaces.update.requested",
                   workspace_update_t{.workspace_id = other_id,
                                      .name = "Hijacked"},
                   "owner", workspace_id)
                .code,
            0u);

  auto failure = failure_of("workspaces.update.validated");
  ASSERT_TRUE(failure.has_value());
  EXPECT_EQ(failure->attempts, 1u);
  EXPECT_EQ(chronicle().directory().settings(other_id)->name, "Team");
  EXPECT_TRUE(events_of_type("workspaces.update.completed").empty());
}

TEST_F(membership_worker_test, members_can_be_added_and_removed) {
  auto workspace_id = create_workspace("owner", false);
  add_member(workspace_id, "owner", "member", role_t::editor);
  ASSERT_TRUE(chronicle()
                  .directory()
                  .find(context_type_t::workspace, workspace_id, "member")
                  .has_value());

  ASSERT_EQ(submit("workspace_members.delete.requested",
                   member_remove_t{.context_type = context_type_t::workspace,
                                   .context_id = workspace_id,
                                   .member_id = "member"},
                   "owner", workspace_id)
                .code,
            0u);

  EXPECT_FALSE(chronicle()
                   .directory()
                   .find(context_type_t::workspace, workspace_id, "member")
                   .has_value());
  auto removed = events_of_type("workspace_members.delete.completed");
  ASSERT_EQ(removed.size(), 1u);
  auto added = events_of_type("workspace_members.create.completed");
  ASSERT_EQ(added.size(), 1u);
  EXPECT_EQ(std::get<command_completed_t>(removed[0].event.data).resource_id,
            std::get<command_completed_t>(added[0].event.data).resource_id);
}

TEST_F(membership_worker_test, removing_an_absent_member_still_completes) {
  auto workspace_id = create_workspace("owner", false);
  ASSERT_EQ(submit("workspace_members.delete.requested",
                   member_remove_t{.context_type = context_type_t::workspace,
                                   .context_id = workspace_id,
                                   .member_id = "nobody"},
                   "owner", workspace_id)
                .code,
            0u);
  EXPECT_EQ(events_of_type("workspace_members.delete.completed").size(), 1u);
  EXPECT_TRUE(chronicle().runner().list_failures().empty());
}

TEST_F(membership_worker_test, grants_outside_the_command_scope_are_refused) {
  auto workspace_id = create_workspace("owner", false);
  auto other_id = create_workspace("someone-else", false);
  ASSERT_EQ(submit("workspace_members.create.requested",
                   member_upsert_t{.context_type = context_type_t::workspace,
                                   .context_id = other_id,
                                   .member_id = "owner",
                                   .role = role_t::admin},
                   "owner", workspace_id)
                .code,
            0u);

  auto failure = failure_of("workspace_members.create.validated");
  ASSERT_TRUE(failure.has_value());
  EXPECT_EQ(failure->attempts, 1u);
  EXPECT_FALSE(chronicle()
                   .directory()
                   .find(context_type_t::workspace, other_id, "owner")
                   .has_value());
  EXPECT_TRUE(events_of_type("workspace_members.create.completed").empty());
}

TEST_F(membership_worker_test, unscoped_grants_are_refused) {
  auto workspace_id = create_workspace("owner", false);
  ASSERT_EQ(submit("workspace_members.create.requested",
                   member_upsert_t{.context_type = context_type_t::workspace,
                                   .context_id = workspace_id,
                                   .member_id = "friend",
                                   .role = role_t::viewer},
                   "owner")
                .code,
            0u);

  auto failure = failure_of("workspace_members.create.validated");
  ASSERT_TRUE(failure.has_value());
  EXPECT_FALSE(chronicle()
                   .directory()
                   .find(context_type_t::workspace, workspace_id, "friend")
                   .has_value());
}
