#include <chronicle/blake3/hash.hpp>
#include <chronicle/schema/command_completed.hpp>
#include <chronicle/schema/document_create.hpp>
#include <chronicle/schema/document_delete.hpp>
#include <chronicle/schema/document_update.hpp>
#include <chronicle/testing/pipeline_fixture.hpp>
#include <chronicle/workers/documents_worker.hpp>
#include <gtest/gtest.h>

namespace {

using namespace chronicle::schema;
using chronicle::testing::pipeline_fixture;
using chronicle::workers::documents_worker;

class documents_worker_test : public pipeline_fixture {
 protected:
  void create_document(const std::string& document_id,
                       const std::string& user_id = "user-1",
                       std::optional<id_t> workspace_id = std::nullopt) {
    auto payload = document_create_t{};
    payload.document_id = document_id;
    payload.title = "Plan";
    payload.content = make_bytes(std::string_view{"# Plan"});
    auto result = submit("documents.create.requested", payload, user_id,
                         std::move(workspace_id));
    EXPECT_EQ(result.code, 0u) << result.log;
  }

  chronicle::dispatch::handler_result submit_update(
      document_update_t update,
      const std::string& user_id = "user-1",
      std::optional<id_t> workspace_id = std::nullopt) {
    auto subject = update.document_id;
    auto result = submit("documents.update.requested", std::move(update),
                         user_id, std::move(workspace_id), source_t::user,
                         subject);
    return {.success = result.code == 0, .message = result.log};
  }

  std::optional<execution_failure_t> failure_of(const stored_event_t& event) {
    return chronicle().runner().failure(event.event.id,
                                        documents_worker::kName);
  }
};

}  // namespace

TEST_F(documents_worker_test, create_stores_the_body_with_a_checksum) {
  create_document("doc-1");

  auto row = chronicle().documents().get("doc-1");
  ASSERT_TRUE(row.has_value());
  EXPECT_EQ(row->user_id, "user-1");
  EXPECT_EQ(row->row_version, 1u);
  EXPECT_EQ(row->content.key, "documents/doc-1/body");
  EXPECT_EQ(row->content.content_type, "text/markdown");
  EXPECT_EQ(row->content.size, 6u);
  EXPECT_EQ(row->content.checksum,
            chronicle::blake3::hex_digest(
                make_bytes_view(std::string_view{"# Plan"})));
  EXPECT_EQ(objects_.get("documents/doc-1/body"),
            make_bytes(std::string_view{"# Plan"}));

  auto completed = events_of_type("documents.create.completed");
  ASSERT_EQ(completed.size(), 1u);
  const auto& result = std::get<command_completed_t>(completed[0].event.data);
  EXPECT_EQ(result.resource_id, "doc-1");
  EXPECT_EQ(result.content, row->content);
}

TEST_F(documents_worker_test, update_replaces_the_body_and_keeps_its_type) {
  create_document("doc-1");
  auto update = document_update_t{};
  update.document_id = "doc-1";
  update.expected_version = 1;
  update.title = "Plan v2";
  update.content = make_bytes(std::string_view{"# Plan\n\nmore"});
  ASSERT_TRUE(submit_update(update).success);

  auto row = chronicle().documents().get("doc-1");
  ASSERT_TRUE(row.has_value());
  EXPECT_EQ(row->title, "Plan v2");
  EXPECT_EQ(row->row_version, 2u);
  EXPECT_EQ(row->content.content_type, "text/markdown");
  EXPECT_EQ(row->content.size, 12u);
  EXPECT_NE(row->content.key, "documents/doc-1/body");
  EXPECT_EQ(objects_.size(), 2u);
  EXPECT_EQ(events_of_type("documents.update.completed").size(), 1u);
}

TEST_F(documents_worker_test, content_type_changes_without_a_new_body) {
  create_document("doc-1");
  auto update = document_update_t{};
  update.document_id = "doc-1";
  update.content_type = "text/plain";
  ASSERT_TRUE(submit_update(update).success);

  auto row = chronicle().documents().get("doc-1");
  ASSERT_TRUE(row.has_value());
  EXPECT_EQ(row->content.content_type, "text/plain");
  EXPECT_EQ(row->content.key, "documents/doc-1/body");
  EXPECT_EQ(objects_.size(), 1u);
}

TEST_F(documents_worker_test, stale_updates_are_rejected_once) {
  create_document("doc-1");
  auto stale = document_update_t{};
  stale.document_id = "doc-1";
  stale.expected_version = 4;
  stale.title = "stale";
  ASSERT_TRUE(submit_update(stale).success);

  auto validated = events_of_type("documents.update.validated");
  ASSERT_EQ(validated.size(), 1u);
  auto failure = failure_of(validated[0]);
  ASSERT_TRUE(failure.has_value());
  EXPECT_EQ(failure->attempts, 1u);
  EXPECT_EQ(chronicle().documents().get("doc-1")->title, "Plan");
  EXPECT_TRUE(events_of_type("documents.update.completed").empty());
}

TEST_F(documents_worker_test, delete_hides_the_row_but_keeps_it) {
  create_document("doc-1");
  ASSERT_EQ(submit("documents.delete.requested",
                   document_delete_t{.document_id = "doc-1"}, "user-1",
                   std::nullopt, source_t::user, "doc-1")
                .code,
            0u);

  auto row = chronicle().documents().get("doc-1");
  ASSERT_TRUE(row.has_value());
  EXPECT_TRUE(row->audit.deleted_at.has_value());
  EXPECT_EQ(row->row_version, 2u);
  auto scope = chronicle::workers::tenant_scope_t{.user_id = "user-1"};
  EXPECT_FALSE(chronicle().documents().find("doc-1", scope).has_value());
  EXPECT_TRUE(chronicle().documents().list_for_user("user-1").empty());
  EXPECT_EQ(events_of_type("documents.delete.completed").size(), 1u);
}

TEST_F(documents_worker_test, personal_documents_are_invisible_to_others) {
  create_document("doc-1");
  auto update = document_update_t{};
  update.document_id = "doc-1";
  update.title = "not yours";
  ASSERT_TRUE(submit_update(update, "user-2").success);

  auto validated = events_of_type("documents.update.validated");
  ASSERT_EQ(validated.size(), 1u);
  EXPECT_TRUE(failure_of(validated[0]).has_value());
  EXPECT_EQ(chronicle().documents().get("doc-1")->title, "Plan");
}

TEST_F(documents_worker_test, workspace_documents_are_shared_with_members) {
  auto workspace_id = create_workspace("owner", true);
  add_member(workspace_id, "owner", "editor", role_t::editor);
  create_document("doc-1", "owner", workspace_id);

  auto update = document_update_t{};
  update.document_id = "doc-1";
  update.title = "edited";
  ASSERT_TRUE(submit_update(update, "editor", workspace_id).success);

  auto row = chronicle().documents().get("doc-1");
  ASSERT_TRUE(row.has_value());
  EXPECT_EQ(row->title, "edited");
  EXPECT_EQ(row->user_id, "owner");
}

TEST_F(documents_worker_test, ids_owned_by_another_user_cannot_be_recreated) {
  create_document("doc-1");
  auto hijack = document_create_t{};
  hijack.document_id = "doc-1";
  hijack.title = "Mine";
  hijack.content = make_bytes(std::string_view{"overwritten"});
  ASSERT_EQ(submit("documents.create.requested", hijack, "user-2").code, 0u);

  auto row = chronicle().documents().get("doc-1");
  ASSERT_TRUE(row.has_value());
  EXPECT_EQ(row->user_id, "user-1");
  EXPECT_EQ(objects_.puts(), 1);
  EXPECT_EQ(objects_.get("documents/doc-1/body"),
            make_bytes(std::string_view{"# Plan"}));

  auto validated = events_of_type("documents.create.validated");
  ASSERT_EQ(validated.size(), 2u);
  auto failure = failure_of(validated[1]);
  ASSERT_TRUE(failure.has_value());
  EXPECT_EQ(failure->attempts, 1u);
  EXPECT_EQ(events_of_type("documents.create.completed").size(), 1u);
}

TEST_F(documents_worker_test, update_replayed_after_row_write_is_not_reapplied) {
  create_document("doc-1");
  auto update = document_update_t{};
  update.document_id = "doc-1";
  update.expected_version = 1;
  update.title = "Plan v2";
  ASSERT_TRUE(submit_update(update).success);
  auto validated = events_of_type("documents.update.validated");
  ASSERT_EQ(validated.size(), 1u);
  forget_steps(validated[0].event.id, {"persist-row", "emit-completed", "notify"});

  auto again = redeliver_to(documents_worker::kName, validated[0]);
  chronicle().wait_idle();
  EXPECT_TRUE(again.success) << again.message;
  EXPECT_EQ(chronicle().documents().get("doc-1")->row_version, 2u);
  EXPECT_EQ(events_of_type("documents.update.completed").size(), 1u);
  EXPECT_FALSE(failure_of(validated[0]).has_value());
}

TEST_F(documents_worker_test, delete_replayed_after_row_write_is_not_reapplied) {
  create_document("doc-1");
  ASSERT_EQ(submit("documents.delete.requested",
                   document_delete_t{.document_id = "doc-1"}, "user-1",
                   std::nullopt, source_t::user, "doc-1")
                .code,
            0u);
  auto validated = events_of_type("documents.delete.validated");
  ASSERT_EQ(validated.size(), 1u);
  forget_steps(validated[0].event.id, {"persist-row", "emit-completed", "notify"});

  auto again = redeliver_to(documents_worker::kName, validated[0]);
  chronicle().wait_idle();
  EXPECT_TRUE(again.success) << again.message;
  EXPECT_EQ(chronicle().documents().get("doc-1")->row_version, 2u);
  EXPECT_EQ(events_of_type("documents.delete.completed").size(), 1u);
}
