#pragma once

#include <chronicle/pipeline/pipeline.hpp>
#include <chronicle/schema/event_type.hpp>
#include <chronicle/schema/key/builder.hpp>
#include <chronicle/testing/common.hpp>
#include <gtest/gtest.h>

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace chronicle::testing {

/// Object store double that counts writes.
class memory_object_store final : public chronicle::workers::object_store {
 public:
  chronicle::schema::object_ref_t put(
      const std::string_view key,
      const chronicle::schema::bytes_view_t& content,
      const std::string_view content_type) override {
    auto lock = std::scoped_lock{mutex_};
    ++puts_;
    if (failures_remaining_ > 0) {
      --failures_remaining_;
      throw std::runtime_error{"object store unavailable"};
    }
    objects_.insert_or_assign(std::string{key},
                              chronicle::schema::make_bytes(content));
    return chronicle::workers::make_object_ref(key, content, content_type);
  }

  std::optional<chronicle::schema::bytes_t> get(
      const std::string_view key) const override {
    auto lock = std::scoped_lock{mutex_};
    auto it = objects_.find(std::string{key});
    if (it == std::end(objects_)) {
      return std::nullopt;
    }
    return it->second;
  }

  bool remove(const std::string_view key) override {
    auto lock = std::scoped_lock{mutex_};
    return objects_.erase(std::string{key}) > 0;
  }

  void fail_next(int count) {
    auto lock = std::scoped_lock{mutex_};
    failures_remaining_ = count;
  }

  int puts() const {
    auto lock = std::scoped_lock{mutex_};
    return puts_;
  }

  std::size_t size() const {
    auto lock = std::scoped_lock{mutex_};
    return objects_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::map<std::string, chronicle::schema::bytes_t> objects_;
  int puts_{};
  int failures_remaining_{};
};

/// Notification sink double that records deliveries or fails on demand.
class recording_sink final : public chronicle::workers::notification_sink {
 public:
  void deliver(const chronicle::workers::notification_t& notification) override {
    auto lock = std::scoped_lock{mutex_};
    if (failing_) {
      throw std::runtime_error{"push gateway down"};
    }
    delivered_.push_back(notification);
  }

  void set_failing(bool failing) {
    auto lock = std::scoped_lock{mutex_};
    failing_ = failing;
  }

  std::vector<chronicle::workers::notification_t> delivered() const {
    auto lock = std::scoped_lock{mutex_};
    return delivered_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<chronicle::workers::notification_t> delivered_;
  bool failing_{};
};

/// Full pipeline over a temporary RocksDB with in-memory collaborators.
class pipeline_fixture : public ::testing::Test {
 protected:
  void SetUp() override {
    db_ = std::make_unique<temp_storage>("chronicle_pipeline");
    chronicle_ = std::make_unique<chronicle::pipeline::pipeline>(
        db_->storage, objects_, sink_, options());
  }

  void TearDown() override {
    chronicle_.reset();
    db_.reset();
  }

  virtual chronicle::pipeline::pipeline_options options() const {
    return chronicle::pipeline::pipeline_options{.dispatch_threads = 2,
                                                 .webhook_secret = "s3cret"};
  }

  chronicle::pipeline::pipeline& chronicle() { return *chronicle_; }

  chronicle::ingress::submission_result submit(
      const std::string& type,
      chronicle::schema::payload_t data,
      const std::string& user_id,
      std::optional<chronicle::schema::id_t> workspace_id = std::nullopt,
      chronicle::schema::source_t source = chronicle::schema::source_t::user,
      std::optional<chronicle::schema::id_t> subject_id = std::nullopt) {
    auto command = chronicle::ingress::command_t{};
    command.type = type;
    command.subject_id = std::move(subject_id);
    command.user_id = user_id;
    command.source = source;
    command.scope.workspace_id = std::move(workspace_id);
    command.data = std::move(data);
    auto result = chronicle_->gateway().submit(command);
    chronicle_->wait_idle();
    return result;
  }

  /// Create a workspace owned by `owner_id` and return its id.
  chronicle::schema::id_t create_workspace(const std::string& owner_id,
                                           const bool ai_auto_approve) {
    auto workspace_id = chronicle::common::make_uuid();
    auto result = submit(
        "workspaces.create.requested",
        chronicle::schema::workspace_create_t{.workspace_id = workspace_id,
                                              .name = "Team",
                                              .ai_auto_approve =
                                                  ai_auto_approve},
        owner_id);
    EXPECT_EQ(result.code, 0u) << result.log;
    return workspace_id;
  }

  void add_member(const chronicle::schema::id_t& workspace_id,
                  const std::string& owner_id,
                  const std::string& member_id,
                  const chronicle::schema::role_t role) {
    auto result = submit(
        "workspace_members.create.requested",
        chronicle::schema::member_upsert_t{
            .context_type = chronicle::schema::context_type_t::workspace,
            .context_id = workspace_id,
            .member_id = member_id,
            .role = role},
        owner_id, workspace_id);
    EXPECT_EQ(result.code, 0u) << result.log;
  }

  /// Every appended event whose type equals `type`, in append order.
  std::vector<chronicle::schema::stored_event_t> events_of_type(
      const std::string_view type) {
    auto found = std::vector<chronicle::schema::stored_event_t>{};
    chronicle_->store().for_each_since(
        0, [&](const chronicle::schema::stored_event_t& event) {
          if (event.event.type == type) {
            found.push_back(event);
          }
        });
    return found;
  }

  /// Events caused, directly or transitively, by `origin_id`.
  std::vector<chronicle::schema::stored_event_t> descendants_of(
      const chronicle::schema::id_t& origin_id) {
    auto causes = std::set<chronicle::schema::id_t>{origin_id};
    auto found = std::vector<chronicle::schema::stored_event_t>{};
    chronicle_->store().for_each_since(
        0, [&](const chronicle::schema::stored_event_t& event) {
          const auto& cause = event.event.trace.causation_id;
          if (cause && causes.contains(*cause)) {
            causes.insert(event.event.id);
            found.push_back(event);
          }
        });
    return found;
  }

  /// Hand the same event to one worker again, as a redelivery would.
  chronicle::dispatch::handler_result redeliver_to(
      const std::string_view worker,
      const chronicle::schema::stored_event_t& event) {
    for (const auto& entry : chronicle_->handlers().match(event.event.type)) {
      if (entry.name == worker) {
        return entry.handler(event);
      }
    }
    ADD_FAILURE() << worker << " is not subscribed to " << event.event.type;
    return {.success = false};
  }

  /// Drop the journal memo of each step, as if the process died after the
  /// step's write but before its memo landed.
  void forget_steps(const chronicle::schema::id_t& execution_id,
                    const std::vector<std::string_view>& steps) {
    for (const auto step : steps) {
      auto key = chronicle::schema::key::builder{};
      key.segment("STEP").segment(execution_id);
      key.write(step);
      db_->storage.erase(key.view());
    }
  }

  std::unique_ptr<temp_storage> db_;
  memory_object_store objects_;
  recording_sink sink_;
  std::unique_ptr<chronicle::pipeline::pipeline> chronicle_;
};

}  // namespace chronicle::testing
