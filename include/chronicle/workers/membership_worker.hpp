#pragma once

#include <chronicle/dispatch/handler_registry.hpp>
#include <chronicle/governor/membership_directory.hpp>
#include <chronicle/schema/member_remove.hpp>
#include <chronicle/schema/member_upsert.hpp>
#include <chronicle/schema/workspace_create.hpp>
#include <chronicle/schema/workspace_update.hpp>
#include <chronicle/workers/worker_context.hpp>

#include <array>
#include <string_view>

namespace chronicle::workers {

/// Executes validated workspace and membership commands. Its writes are the
/// memberships and settings the governor decides with.
class membership_worker final {
 public:
  static constexpr auto kName = std::string_view{"membership-worker"};
  static constexpr auto kPatterns = std::array{
      std::string_view{"workspaces.*.validated"},
      std::string_view{"workspace_members.*.validated"},
      std::string_view{"project_members.*.validated"}};

  membership_worker(worker_context context,
                    chronicle::governor::membership_directory& directory);

  chronicle::dispatch::handler_result handle(
      const chronicle::schema::stored_event_t& event);

 private:
  void create_workspace(const chronicle::schema::stored_event_t& event,
                        const chronicle::schema::workspace_create_t& command);
  void update_workspace(const chronicle::schema::stored_event_t& event,
                        const chronicle::schema::workspace_update_t& command);
  void upsert_member(const chronicle::schema::stored_event_t& event,
                     const chronicle::schema::member_upsert_t& command);
  void remove_member(const chronicle::schema::stored_event_t& event,
                     const chronicle::schema::member_remove_t& command);

  void finish(const chronicle::schema::stored_event_t& event,
              chronicle::schema::command_completed_t result);

  worker_context context_;
  chronicle::governor::membership_directory& directory_;
};

}  // namespace chronicle::workers
