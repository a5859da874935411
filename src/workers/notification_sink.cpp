#include <chronicle/common/ids.hpp>
#include <chronicle/workers/notification_sink.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <exception>

namespace chronicle::workers {

uint64_t subscription_hub::subscribe(std::string room,
                                     subscriber_t subscriber) {
  auto lock = std::scoped_lock{mutex_};
  auto token = next_token_++;
  subscriptions_.emplace(
      token, subscription{std::move(room), std::move(subscriber)});
  return token;
}

bool subscription_hub::unsubscribe(uint64_t token) {
  auto lock = std::scoped_lock{mutex_};
  return subscriptions_.erase(token) > 0;
}

void subscription_hub::deliver(const notification_t& notification) {
  auto targets = std::vector<subscriber_t>{};
  {
    auto lock = std::scoped_lock{mutex_};
    for (const auto& [token, entry] : subscriptions_) {
      if (entry.room == notification.room) {
        targets.push_back(entry.subscriber);
      }
    }
  }
  for (const auto& subscriber : targets) {
    try {
      subscriber(notification);
    } catch (const std::exception& ex) {
      spdlog::warn("Subscriber in {} rejected {}: {}", notification.room,
                   notification.event_type, ex.what());
    }
  }
}

std::size_t subscription_hub::subscribers(const std::string_view room) const {
  auto lock = std::scoped_lock{mutex_};
  auto count = std::size_t{0};
  for (const auto& [token, entry] : subscriptions_) {
    if (entry.room == room) {
      ++count;
    }
  }
  return count;
}

std::vector<std::string> rooms_for(const chronicle::schema::event_t& event) {
  auto rooms = std::vector<std::string>{};
  if (event.user_id) {
    rooms.push_back(fmt::format("user:{}", *event.user_id));
  }
  if (event.scope.workspace_id) {
    rooms.push_back(fmt::format("workspace:{}", *event.scope.workspace_id));
  }
  if (event.trace.request_id) {
    rooms.push_back(fmt::format("request:{}", *event.trace.request_id));
  }
  return rooms;
}

bool notify_best_effort(notification_sink& sink,
                        const chronicle::schema::event_t& event,
                        const std::string_view message) {
  auto delivered = true;
  for (auto& room : rooms_for(event)) {
    auto notification = notification_t{.room = std::move(room),
                                       .event_id = event.id,
                                       .event_type = event.type,
                                       .subject_id = event.subject_id,
                                       .message = std::string{message},
                                       .sent_at = chronicle::common::now_ms()};
    try {
      sink.deliver(notification);
    } catch (const std::exception& ex) {
      delivered = false;
      spdlog::warn("Notification of {} to {} dropped: {}", event.type,
                   notification.room, ex.what());
    }
  }
  return delivered;
}

}  // namespace chronicle::workers
