#include <chronicle/events/event_store.hpp>
#include <chronicle/events/publisher.hpp>
#include <chronicle/governor/governor.hpp>
#include <chronicle/governor/membership_directory.hpp>
#include <chronicle/schema/entity_create.hpp>
#include <chronicle/schema/entity_delete.hpp>
#include <chronicle/schema/error_code.hpp>
#include <chronicle/testing/common.hpp>
#include <gtest/gtest.h>

#include <mutex>
#include <vector>

namespace {

using namespace chronicle::schema;

/// Appends published events without dispatching them.
class appending_publisher final : public chronicle::events::publisher {
 public:
  explicit appending_publisher(chronicle::events::event_store& store)
      : store_{store} {}

  chronicle::events::append_result publish(const event_t& event) override {
    {
      auto lock = std::scoped_lock{mutex_};
      if (failures_remaining_ > 0) {
        --failures_remaining_;
        return {.code = 99, .log = "publisher unavailable"};
      }
    }
    auto result = store_.append(event);
    if (result.code == 0) {
      auto lock = std::scoped_lock{mutex_};
      published_.push_back(event);
    }
    return result;
  }

  void fail_next(int count) {
    auto lock = std::scoped_lock{mutex_};
    failures_remaining_ = count;
  }

  std::vector<event_t> published() const {
    auto lock = std::scoped_lock{mutex_};
    return published_;
  }

 private:
  chronicle::events::event_store& store_;
  mutable std::mutex mutex_;
  std::vector<event_t> published_;
  int failures_remaining_{};
};

class governor_test : public ::testing::Test {
 protected:
  void SetUp() override {
    chronicle::events::register_default_schemas(registry_);
    auto settings = workspace_settings_t{};
    settings.workspace_id = "ws-1";
    settings.name = "Team";
    settings.owner_id = "owner";
    directory_.save_settings(settings);
    grant(context_type_t::workspace, "ws-1", "owner", role_t::owner);
    grant(context_type_t::workspace, "ws-1", "editor", role_t::editor);
    grant(context_type_t::workspace, "ws-1", "viewer", role_t::viewer);
  }

  void grant(context_type_t type,
             const std::string& context,
             const std::string& user,
             role_t role) {
    auto membership = membership_t{};
    membership.context_type = type;
    membership.context_id = context;
    membership.user_id = user;
    membership.role = role;
    directory_.upsert(membership);
  }

  event_t create_request(std::optional<std::string> user,
                         std::optional<std::string> workspace,
                         source_t source = source_t::user) {
    auto payload = entity_create_t{};
    payload.entity_type = "note";
    payload.title = "hello";
    auto event =
        chronicle::testing::make_event("entities.create.requested", payload,
                                       std::nullopt, std::move(user));
    event.scope.workspace_id = std::move(workspace);
    event.source = source;
    return event;
  }

  event_t delete_request(const std::string& user,
                         std::optional<std::string> project = std::nullopt) {
    auto payload = entity_delete_t{};
    payload.entity_id = "entity-1";
    auto event = chronicle::testing::make_event("entities.delete.requested",
                                                payload, "entity-1", user);
    event.scope.workspace_id = "ws-1";
    event.scope.project_id = std::move(project);
    return event;
  }

  stored_event_t append(const event_t& event) {
    auto result = store_.append(event);
    EXPECT_EQ(result.code, 0u) << result.log;
    return *result.stored;
  }

  chronicle::testing::temp_storage db_{"chronicle_governor"};
  chronicle::events::schema_registry registry_;
  chronicle::events::event_store store_{db_.storage, registry_};
  chronicle::governor::membership_directory directory_{db_.storage};
  appending_publisher publisher_{store_};
  chronicle::governor::governor governor_{store_, directory_, publisher_};
};

}  // namespace

TEST_F(governor_test, missing_user_is_denied) {
  auto decision = governor_.decide(create_request(std::nullopt, "ws-1"));
  EXPECT_FALSE(decision.granted);
  EXPECT_FALSE(decision.needs_approval);
  EXPECT_EQ(decision.reason, "no user context");
}

TEST_F(governor_test, personal_resources_are_granted) {
  auto decision = governor_.decide(create_request("stranger", std::nullopt));
  EXPECT_TRUE(decision.granted);
  EXPECT_EQ(decision.reason, "personal resource");
}

TEST_F(governor_test, non_members_are_denied) {
  auto decision = governor_.decide(create_request("stranger", "ws-1"));
  EXPECT_FALSE(decision.granted);
  EXPECT_NE(decision.reason.find("not a member"), std::string::npos);
}

TEST_F(governor_test, viewer_cannot_delete) {
  auto decision = governor_.decide(delete_request("viewer"));
  EXPECT_FALSE(decision.granted);
  EXPECT_NE(decision.reason.find("insufficient role"), std::string::npos);
  EXPECT_NE(decision.reason.find("viewer"), std::string::npos);
}

TEST_F(governor_test, editor_writes_but_only_owner_deletes) {
  EXPECT_TRUE(governor_.decide(create_request("editor", "ws-1")).granted);
  EXPECT_FALSE(governor_.decide(delete_request("editor")).granted);
  EXPECT_TRUE(governor_.decide(delete_request("owner")).granted);
}

TEST_F(governor_test, project_role_overrides_workspace_role) {
  grant(context_type_t::project, "project-1", "editor", role_t::owner);
  EXPECT_TRUE(governor_.decide(delete_request("editor", "project-1")).granted);
  EXPECT_FALSE(governor_.decide(delete_request("editor", "project-2")).granted);
}

TEST_F(governor_test, ai_commands_wait_for_the_owner_whatever_the_role) {
  for (const auto* user : {"owner", "editor"}) {
    auto decision = governor_.decide(
        create_request(user, "ws-1", source_t::intelligence));
    EXPECT_FALSE(decision.granted);
    EXPECT_TRUE(decision.needs_approval);
    EXPECT_EQ(decision.approvers, std::vector<user_id_t>{"owner"});
  }
}

TEST_F(governor_test, ai_commands_fall_through_with_auto_approve) {
  auto settings = *directory_.settings("ws-1");
  settings.ai_auto_approve = true;
  directory_.save_settings(settings);
  EXPECT_TRUE(governor_
                  .decide(create_request("editor", "ws-1",
                                         source_t::intelligence))
                  .granted);
  EXPECT_FALSE(governor_
                   .decide(create_request("viewer", "ws-1",
                                          source_t::intelligence))
                   .granted);
}

TEST_F(governor_test, personal_ai_commands_wait_for_the_user) {
  auto decision = governor_.decide(
      create_request("user-1", std::nullopt, source_t::intelligence));
  EXPECT_TRUE(decision.needs_approval);
  EXPECT_EQ(decision.approvers, std::vector<user_id_t>{"user-1"});
}

TEST_F(governor_test, process_records_decision_and_publishes_one_outcome) {
  auto requested = append(create_request("editor", "ws-1"));
  auto first = governor_.process(requested);
  auto second = governor_.process(requested);
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first, second);

  auto published = publisher_.published();
  ASSERT_EQ(published.size(), 1u);
  EXPECT_EQ(published[0].type, "entities.create.validated");
  EXPECT_EQ(published[0].trace.causation_id, requested.event.id);
  EXPECT_EQ(published[0].trace.correlation_id, requested.event.id);
  ASSERT_TRUE(published[0].metadata.approval.has_value());
  EXPECT_TRUE(published[0].metadata.approval->granted);

  auto annotated = store_.get(requested.event.id);
  ASSERT_TRUE(annotated->event.metadata.approval.has_value());
  EXPECT_TRUE(annotated->event.metadata.approval->granted);
}

TEST_F(governor_test, process_ignores_other_phases) {
  auto event = create_request("editor", "ws-1");
  event.type = "entities.create.validated";
  EXPECT_FALSE(governor_.process(append(event)).has_value());
  EXPECT_TRUE(publisher_.published().empty());
}

TEST_F(governor_test, approval_resubmits_as_the_approver) {
  auto requested =
      append(create_request("editor", "ws-1", source_t::intelligence));
  auto pending_id = governor_.process(requested);
  ASSERT_TRUE(pending_id.has_value());
  EXPECT_EQ(publisher_.published().back().type, "entities.create.pending");

  auto refused = governor_.resolve_pending(*pending_id, "editor", true);
  EXPECT_EQ(refused.code, to_code(error_code::not_an_approver));

  auto approved = governor_.resolve_pending(*pending_id, "owner", true);
  ASSERT_EQ(approved.code, 0u) << approved.log;
  auto resubmitted = publisher_.published().back();
  EXPECT_EQ(resubmitted.id, approved.event_id);
  EXPECT_EQ(resubmitted.type, "entities.create.requested");
  EXPECT_EQ(resubmitted.user_id, "owner");
  EXPECT_EQ(resubmitted.source, source_t::user);
  EXPECT_EQ(resubmitted.trace.causation_id, *pending_id);
  EXPECT_EQ(resubmitted.trace.correlation_id, requested.event.id);

  auto again = governor_.resolve_pending(*pending_id, "owner", false);
  EXPECT_EQ(again.code, to_code(error_code::not_pending));
}

TEST_F(governor_test, rejection_publishes_denied) {
  auto requested =
      append(create_request("editor", "ws-1", source_t::intelligence));
  auto pending_id = governor_.process(requested);
  ASSERT_TRUE(pending_id.has_value());

  auto rejected = governor_.resolve_pending(*pending_id, "owner", false);
  ASSERT_EQ(rejected.code, 0u) << rejected.log;
  auto denied = publisher_.published().back();
  EXPECT_EQ(denied.type, "entities.create.denied");
  ASSERT_TRUE(denied.metadata.approval.has_value());
  EXPECT_FALSE(denied.metadata.approval->granted);
  EXPECT_EQ(denied.metadata.approval->reason, "rejected by owner");
}

TEST_F(governor_test, only_pending_events_can_be_resolved) {
  auto requested = append(create_request("editor", "ws-1"));
  EXPECT_EQ(governor_.resolve_pending(requested.event.id, "owner", true).code,
            to_code(error_code::not_pending));
  EXPECT_EQ(governor_.resolve_pending("missing", "owner", true).code,
            to_code(error_code::event_not_found));
}

TEST_F(governor_test, failed_resolution_can_be_retried) {
  auto requested =
      append(create_request("editor", "ws-1", source_t::intelligence));
  auto pending_id = governor_.process(requested);
  ASSERT_TRUE(pending_id.has_value());

  publisher_.fail_next(1);
  auto failed = governor_.resolve_pending(*pending_id, "owner", true);
  EXPECT_EQ(failed.code, 99u);
  EXPECT_EQ(publisher_.published().back().type, "entities.create.pending");
  auto pending = store_.get(*pending_id);
  ASSERT_TRUE(pending.has_value());
  EXPECT_FALSE(find_property(pending->event.metadata.annotations,
                             "approval.resolution")
                   .has_value());

  auto approved = governor_.resolve_pending(*pending_id, "owner", true);
  ASSERT_EQ(approved.code, 0u) << approved.log;
  EXPECT_EQ(publisher_.published().back().type, "entities.create.requested");
  EXPECT_EQ(find_property(store_.get(*pending_id)->event.metadata.annotations,
                          "approval.resolution"),
            "approved");
}

TEST_F(governor_test, an_unrecorded_resolution_is_not_published_twice) {
  auto requested =
      append(create_request("editor", "ws-1", source_t::intelligence));
  auto pending_id = governor_.process(requested);
  ASSERT_TRUE(pending_id.has_value());

  // Resolution appended by an earlier call that stopped before annotating.
  auto earlier = *store_.get(*pending_id);
  earlier.event.id =
      chronicle::common::make_deterministic_uuid("resolution", *pending_id);
  earlier.event.type = "entities.create.denied";
  earlier.event.metadata.annotations.clear();
  append(earlier.event);
  auto published = publisher_.published().size();

  auto late = governor_.resolve_pending(*pending_id, "owner", true);
  EXPECT_EQ(late.code, to_code(error_code::not_pending));
  EXPECT_EQ(publisher_.published().size(), published);
  EXPECT_EQ(find_property(store_.get(*pending_id)->event.metadata.annotations,
                          "approval.resolution"),
            "rejected");
}
