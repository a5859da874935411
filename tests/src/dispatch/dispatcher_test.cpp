#include <chronicle/dispatch/dispatcher.hpp>
#include <chronicle/dispatch/handler_registry.hpp>
#include <chronicle/schema/entity_delete.hpp>
#include <chronicle/testing/common.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>

namespace {

using chronicle::dispatch::handler_registry;
using chronicle::dispatch::handler_result;
using chronicle::dispatch::handler_status;

chronicle::schema::stored_event_t make_stored(const std::string& type) {
  auto payload = chronicle::schema::entity_delete_t{};
  payload.entity_id = "entity-1";
  auto stored = chronicle::schema::stored_event_t{};
  stored.sequence = 1;
  stored.aggregate_version = 1;
  stored.event = chronicle::testing::make_event(type, payload, "entity-1");
  return stored;
}

}  // namespace

TEST(handler_registry, wildcards_match_single_segments) {
  EXPECT_TRUE(handler_registry::matches("*.*.requested",
                                        "entities.create.requested"));
  EXPECT_TRUE(handler_registry::matches("entities.*.validated",
                                        "entities.delete.validated"));
  EXPECT_FALSE(handler_registry::matches("entities.*.validated",
                                         "documents.delete.validated"));
  EXPECT_FALSE(handler_registry::matches("*.*.requested",
                                         "entities.create.validated"));
  EXPECT_TRUE(handler_registry::matches("entities.create.completed",
                                        "entities.create.completed"));
  EXPECT_FALSE(handler_registry::matches("*", "entities.create.completed"));
}

TEST(handler_registry, rejects_malformed_patterns_and_duplicate_names) {
  auto registry = handler_registry{};
  auto noop = [](const chronicle::schema::stored_event_t&) {
    return handler_result{};
  };
  EXPECT_FALSE(registry.add("bad", "entities..validated", noop));
  EXPECT_FALSE(registry.add("bad", "entities.create", noop));
  EXPECT_TRUE(registry.add("worker", "entities.*.validated", noop));
  EXPECT_FALSE(registry.add("worker", "documents.*.validated", noop));
  EXPECT_EQ(registry.size(), 1u);
}

TEST(dispatcher, failures_are_isolated_per_handler) {
  auto registry = handler_registry{};
  auto calls = std::atomic<int>{};
  registry.add("throws", "*.*.validated",
               [](const chronicle::schema::stored_event_t&) -> handler_result {
                 throw std::runtime_error{"boom"};
               });
  registry.add("reports-failure", "entities.*.validated",
               [&](const chronicle::schema::stored_event_t&) {
                 ++calls;
                 return handler_result{.success = false, .message = "nope"};
               });
  registry.add("succeeds", "entities.delete.validated",
               [&](const chronicle::schema::stored_event_t&) {
                 ++calls;
                 return handler_result{};
               });
  registry.add("unrelated", "documents.*.validated",
               [&](const chronicle::schema::stored_event_t&) {
                 ++calls;
                 return handler_result{};
               });

  auto dispatcher = chronicle::dispatch::dispatcher{registry};
  auto summary = dispatcher.dispatch(make_stored("entities.delete.validated"));

  EXPECT_EQ(summary.event_type, "entities.delete.validated");
  EXPECT_EQ(summary.successful, 1u);
  EXPECT_EQ(summary.failed, 2u);
  ASSERT_EQ(summary.outcomes.size(), 3u);
  EXPECT_EQ(summary.outcomes[0].handler, "throws");
  EXPECT_EQ(summary.outcomes[0].status, handler_status::failed);
  EXPECT_EQ(summary.outcomes[0].message, "boom");
  EXPECT_EQ(summary.outcomes[1].message, "nope");
  EXPECT_EQ(summary.outcomes[2].status, handler_status::succeeded);
  EXPECT_EQ(calls.load(), 2);
}

TEST(dispatcher, unmatched_events_produce_an_empty_summary) {
  auto registry = handler_registry{};
  auto dispatcher = chronicle::dispatch::dispatcher{registry};
  auto summary = dispatcher.dispatch(make_stored("entities.delete.denied"));
  EXPECT_EQ(summary.successful, 0u);
  EXPECT_EQ(summary.failed, 0u);
  EXPECT_TRUE(summary.outcomes.empty());
}

TEST(dispatcher, non_standard_exceptions_are_isolated) {
  auto registry = handler_registry{};
  registry.add("throws-int", "entities.*.validated",
               [](const chronicle::schema::stored_event_t&) -> handler_result {
                 throw 42;
               });
  registry.add("succeeds", "entities.delete.validated",
               [](const chronicle::schema::stored_event_t&) {
                 return handler_result{};
               });

  auto dispatcher = chronicle::dispatch::dispatcher{registry};
  auto summary = dispatcher.dispatch(make_stored("entities.delete.validated"));

  EXPECT_EQ(summary.successful, 1u);
  EXPECT_EQ(summary.failed, 1u);
  ASSERT_EQ(summary.outcomes.size(), 2u);
  EXPECT_EQ(summary.outcomes[0].status, handler_status::failed);
  EXPECT_EQ(summary.outcomes[0].message, "unknown exception");
  EXPECT_EQ(summary.outcomes[1].status, handler_status::succeeded);
}
