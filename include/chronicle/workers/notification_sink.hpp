#pragma once

#include <chronicle/schema/event.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chronicle::workers {

/// Real-time push of a pipeline outcome to one room. Rooms are
/// `user:{id}`, `workspace:{id}` and `request:{id}`.
struct notification_t final {
  std::string room;
  chronicle::schema::id_t event_id;
  std::string event_type;
  std::optional<chronicle::schema::id_t> subject_id;
  std::string message;
  chronicle::schema::timestamp_milliseconds_t sent_at{};
};

class notification_sink {
 public:
  virtual ~notification_sink() = default;

  /// May throw; callers go through notify_best_effort().
  virtual void deliver(const notification_t& notification) = 0;
};

/// Sink used when real-time delivery is switched off.
class discarding_sink final : public notification_sink {
 public:
  void deliver(const notification_t&) override {}
};

/// In-process fan-out to subscribers by room.
class subscription_hub final : public notification_sink {
 public:
  using subscriber_t = std::function<void(const notification_t&)>;

  /// Returns a token for unsubscribe().
  uint64_t subscribe(std::string room, subscriber_t subscriber);

  bool unsubscribe(uint64_t token);

  void deliver(const notification_t& notification) override;

  std::size_t subscribers(const std::string_view room) const;

 private:
  struct subscription final {
    std::string room;
    subscriber_t subscriber;
  };

  mutable std::mutex mutex_;
  uint64_t next_token_{1};
  std::map<uint64_t, subscription> subscriptions_;
};

std::vector<std::string> rooms_for(const chronicle::schema::event_t& event);

/// Deliver one notification per room of `event`. Failures are logged and
/// reported through the return value, never thrown.
bool notify_best_effort(notification_sink& sink,
                        const chronicle::schema::event_t& event,
                        const std::string_view message);

}  // namespace chronicle::workers
