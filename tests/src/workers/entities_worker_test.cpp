#include <chronicle/schema/command_completed.hpp>
#include <chronicle/schema/entity_create.hpp>
#include <chronicle/schema/entity_delete.hpp>
#include <chronicle/schema/entity_update.hpp>
#include <chronicle/testing/pipeline_fixture.hpp>
#include <chronicle/workers/entities_worker.hpp>
#include <gtest/gtest.h>

namespace {

using namespace chronicle::schema;
using chronicle::testing::pipeline_fixture;

class entities_worker_test : public pipeline_fixture {
 protected:
  id_t create_entity(const std::string& entity_id,
                     const std::string& entity_type = "note") {
    auto payload = entity_create_t{};
    payload.entity_id = entity_id;
    payload.entity_type = entity_type;
    payload.title = "original";
    payload.content = "first draft";
    auto result = submit("entities.create.requested", payload, "user-1");
    EXPECT_EQ(result.code, 0u) << result.log;
    return entity_id;
  }

  stored_event_t only_validated(const std::string& type) {
    auto validated = events_of_type(type);
    EXPECT_EQ(validated.size(), 1u);
    return validated.front();
  }

  chronicle::dispatch::handler_result redeliver(const stored_event_t& event) {
    return redeliver_to(chronicle::workers::entities_worker::kName, event);
  }
};

}  // namespace

TEST_F(entities_worker_test, redelivery_repeats_no_side_effect) {
  create_entity("entity-1");
  ASSERT_EQ(objects_.puts(), 1);
  auto validated = only_validated("entities.create.validated");

  auto again = redeliver(validated);
  chronicle().wait_idle();
  EXPECT_TRUE(again.success) << again.message;
  EXPECT_EQ(objects_.puts(), 1);
  EXPECT_EQ(chronicle().entities().count(), 1u);
  EXPECT_EQ(events_of_type("entities.create.completed").size(), 1u);
  EXPECT_EQ(chronicle().journal().completed_steps(validated.event.id),
            (std::vector<std::string>{"emit-completed", "notify",
                                      "persist-extension", "persist-row",
                                      "store-content"}));
}

TEST_F(entities_worker_test, uploads_are_stored_with_a_checksum) {
  auto payload = entity_create_t{};
  payload.entity_id = "entity-1";
  payload.entity_type = "file";
  payload.title = "Receipt";
  payload.file = file_upload_t{.file_name = "receipt.pdf",
                               .content_type = "application/pdf",
                               .content = make_bytes(std::string{"%PDF"})};
  ASSERT_EQ(submit("entities.create.requested", payload, "user-1").code, 0u);

  auto row = chronicle().entities().get("entity-1");
  ASSERT_TRUE(row.has_value());
  ASSERT_TRUE(row->content.has_value());
  EXPECT_EQ(row->content->key, "entities/entity-1/receipt.pdf");
  EXPECT_EQ(row->content->size, 4u);
  EXPECT_EQ(row->content->checksum.size(), 64u);
  EXPECT_TRUE(objects_.get("entities/entity-1/receipt.pdf").has_value());

  auto completed = events_of_type("entities.create.completed");
  ASSERT_EQ(completed.size(), 1u);
  EXPECT_EQ(std::get<command_completed_t>(completed[0].event.data).content,
            row->content);
}

TEST_F(entities_worker_test, transient_failures_are_retried) {
  objects_.fail_next(2);
  create_entity("entity-1");
  EXPECT_EQ(objects_.puts(), 3);
  EXPECT_TRUE(chronicle().entities().get("entity-1").has_value());
  EXPECT_TRUE(chronicle().runner().list_failures().empty());
}

TEST_F(entities_worker_test, exhausted_retries_are_recorded) {
  objects_.fail_next(3);
  create_entity("entity-1");
  EXPECT_EQ(objects_.puts(), 3);
  EXPECT_FALSE(chronicle().entities().get("entity-1").has_value());
  EXPECT_TRUE(events_of_type("entities.create.completed").empty());

  auto validated = only_validated("entities.create.validated");
  auto failure = chronicle().runner().failure(
      validated.event.id, chronicle::workers::entities_worker::kName);
  ASSERT_TRUE(failure.has_value());
  EXPECT_EQ(failure->attempts, 3u);
  EXPECT_EQ(failure->last_error, "object store unavailable");
}

TEST_F(entities_worker_test, stale_updates_are_rejected) {
  create_entity("entity-1");
  auto stale = entity_update_t{};
  stale.entity_id = "entity-1";
  stale.expected_version = 5;
  stale.title = "stale";
  ASSERT_EQ(submit("entities.update.requested", stale, "user-1", std::nullopt,
                   source_t::user, "entity-1")
                .code,
            0u);

  EXPECT_TRUE(events_of_type("entities.update.completed").empty());
  auto failure = chronicle().runner().failure(
      only_validated("entities.update.validated").event.id,
      chronicle::workers::entities_worker::kName);
  ASSERT_TRUE(failure.has_value());
  EXPECT_EQ(failure->attempts, 1u);
  EXPECT_EQ(chronicle().entities().get("entity-1")->title, "original");
}

TEST_F(entities_worker_test, updates_merge_and_bump_the_version) {
  create_entity("entity-1");
  auto update = entity_update_t{};
  update.entity_id = "entity-1";
  update.expected_version = 1;
  update.title = "renamed";
  update.content = "second draft";
  update.properties = {property_t{"mood", "calm"}};
  ASSERT_EQ(submit("entities.update.requested", update, "user-1", std::nullopt,
                   source_t::user, "entity-1")
                .code,
            0u);

  auto row = chronicle().entities().get("entity-1");
  ASSERT_TRUE(row.has_value());
  EXPECT_EQ(row->title, "renamed");
  EXPECT_EQ(row->row_version, 2u);
  EXPECT_EQ(find_property(row->properties, "mood"), "calm");
  EXPECT_EQ(objects_.size(), 2u);

  auto completed = events_of_type("entities.update.completed");
  ASSERT_EQ(completed.size(), 1u);
  EXPECT_EQ(std::get<command_completed_t>(completed[0].event.data)
                .resource_version,
            2u);
}

TEST_F(entities_worker_test, missing_entities_cannot_be_updated) {
  auto update = entity_update_t{};
  update.entity_id = "ghost";
  update.title = "boo";
  ASSERT_EQ(submit("entities.update.requested", update, "user-1").code, 0u);
  auto failure = chronicle().runner().failure(
      only_validated("entities.update.validated").event.id,
      chronicle::workers::entities_worker::kName);
  ASSERT_TRUE(failure.has_value());
  EXPECT_EQ(failure->attempts, 1u);
}

TEST_F(entities_worker_test, delete_is_a_soft_delete) {
  create_entity("entity-1");
  ASSERT_EQ(submit("entities.delete.requested",
                   entity_delete_t{.entity_id = "entity-1"}, "user-1",
                   std::nullopt, source_t::user, "entity-1")
                .code,
            0u);

  auto row = chronicle().entities().get("entity-1");
  ASSERT_TRUE(row.has_value());
  EXPECT_TRUE(row->audit.deleted_at.has_value());
  EXPECT_EQ(row->row_version, 2u);
  auto scope = chronicle::workers::tenant_scope_t{.user_id = "user-1"};
  EXPECT_FALSE(chronicle().entities().find("entity-1", scope).has_value());
  EXPECT_TRUE(chronicle().entities().list_for_user("user-1").empty());
  EXPECT_EQ(events_of_type("entities.delete.completed").size(), 1u);
}

TEST_F(entities_worker_test, tasks_get_an_extension_row) {
  auto payload = entity_create_t{};
  payload.entity_id = "task-1";
  payload.entity_type = "task";
  payload.title = "Ship it";
  payload.task = task_fields_t{.status = "done"};
  ASSERT_EQ(submit("entities.create.requested", payload, "user-1").code, 0u);
  create_entity("note-1");

  auto task = chronicle().entities().task("task-1");
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(task->status, "done");
  EXPECT_TRUE(task->completed_at.has_value());
  EXPECT_FALSE(chronicle().entities().task("note-1").has_value());
}

TEST_F(entities_worker_test, notification_failures_do_not_fail_the_job) {
  sink_.set_failing(true);
  create_entity("entity-1");
  auto validated = only_validated("entities.create.validated");
  EXPECT_TRUE(chronicle().journal().completed(validated.event.id, "notify"));
  EXPECT_EQ(events_of_type("entities.create.completed").size(), 1u);
  EXPECT_TRUE(chronicle().runner().list_failures().empty());
  EXPECT_TRUE(sink_.delivered().empty());
}

TEST_F(entities_worker_test, ids_owned_by_another_user_cannot_be_recreated) {
  create_entity("entity-1");
  auto hijack = entity_create_t{};
  hijack.entity_id = "entity-1";
  hijack.entity_type = "note";
  hijack.title = "mine now";
  hijack.content = "overwritten";
  ASSERT_EQ(submit("entities.create.requested", hijack, "user-2").code, 0u);

  auto row = chronicle().entities().get("entity-1");
  ASSERT_TRUE(row.has_value());
  EXPECT_EQ(row->user_id, "user-1");
  EXPECT_EQ(row->title, "original");
  EXPECT_EQ(objects_.puts(), 1);
  EXPECT_EQ(objects_.get("entities/entity-1/content"),
            make_bytes(std::string{"first draft"}));
  EXPECT_EQ(events_of_type("entities.create.completed").size(), 1u);

  auto validated = events_of_type("entities.create.validated");
  ASSERT_EQ(validated.size(), 2u);
  auto failure = chronicle().runner().failure(
      validated[1].event.id, chronicle::workers::entities_worker::kName);
  ASSERT_TRUE(failure.has_value());
  EXPECT_EQ(failure->attempts, 1u);
}

TEST_F(entities_worker_test, soft_deleted_ids_cannot_be_recreated) {
  create_entity("entity-1");
  ASSERT_EQ(submit("entities.delete.requested",
                   entity_delete_t{.entity_id = "entity-1"}, "user-1",
                   std::nullopt, source_t::user, "entity-1")
                .code,
            0u);
  create_entity("entity-1");

  auto row = chronicle().entities().get("entity-1");
  ASSERT_TRUE(row.has_value());
  EXPECT_TRUE(row->audit.deleted_at.has_value());
  EXPECT_EQ(events_of_type("entities.create.completed").size(), 1u);
}

TEST_F(entities_worker_test, update_replayed_after_row_write_is_not_reapplied) {
  create_entity("entity-1");
  auto update = entity_update_t{};
  update.entity_id = "entity-1";
  update.expected_version = 1;
  update.title = "renamed";
  ASSERT_EQ(submit("entities.update.requested", update, "user-1", std::nullopt,
                   source_t::user, "entity-1")
                .code,
            0u);
  auto validated = only_validated("entities.update.validated");
  forget_steps(validated.event.id,
               {"persist-row", "persist-extension", "emit-completed", "notify"});

  auto again = redeliver(validated);
  chronicle().wait_idle();
  EXPECT_TRUE(again.success) << again.message;
  EXPECT_EQ(chronicle().entities().get("entity-1")->row_version, 2u);
  EXPECT_EQ(events_of_type("entities.update.completed").size(), 1u);
  EXPECT_FALSE(chronicle()
                   .runner()
                   .failure(validated.event.id,
                            chronicle::workers::entities_worker::kName)
                   .has_value());
}

TEST_F(entities_worker_test, delete_replayed_after_row_write_is_not_reapplied) {
  create_entity("entity-1");
  ASSERT_EQ(submit("entities.delete.requested",
                   entity_delete_t{.entity_id = "entity-1"}, "user-1",
                   std::nullopt, source_t::user, "entity-1")
                .code,
            0u);
  auto validated = only_validated("entities.delete.validated");
  forget_steps(validated.event.id, {"persist-row", "emit-completed", "notify"});

  auto again = redeliver(validated);
  chronicle().wait_idle();
  EXPECT_TRUE(again.success) << again.message;
  EXPECT_EQ(chronicle().entities().get("entity-1")->row_version, 2u);
  EXPECT_EQ(events_of_type("entities.delete.completed").size(), 1u);
}
