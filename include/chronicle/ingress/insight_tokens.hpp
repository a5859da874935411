#pragma once

#include <chronicle/ingress/command_gateway.hpp>
#include <chronicle/schema/ai_provenance.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chronicle::ingress {

/// Access grant for one external intelligence request.
struct insight_token_t final {
  std::string token;
  chronicle::schema::id_t request_id;
  chronicle::schema::user_id_t user_id;
  std::optional<chronicle::schema::id_t> workspace_id;
  chronicle::schema::timestamp_milliseconds_t expires_at{};
};

/// Command proposed by the external service; `type` is a requested type.
struct proposed_action_t final {
  std::string type;
  std::optional<chronicle::schema::id_t> subject_id;
  chronicle::schema::payload_t data;
};

struct insight_t final {
  chronicle::schema::id_t correlation_id;
  chronicle::schema::basis_points_t confidence{};
  std::optional<std::string> reasoning;
  /// Provenance to attach to every action; agent and confidence are filled
  /// in from the insight.
  chronicle::schema::ai_provenance_t provenance;
  std::vector<proposed_action_t> actions;
};

struct insight_result final {
  uint32_t code{};
  std::string log;
  std::vector<submission_result> actions;
};

/// Issues tokens for outbound intelligence requests and turns the returned
/// insight into ordinary intelligence-sourced commands. The external service
/// never writes anything itself. A token is spent by the first insight that
/// passes its checks; expired tokens are dropped whenever a new one is issued.
class insight_tokens final {
 public:
  insight_tokens(command_gateway& gateway,
                 std::chrono::milliseconds ttl = std::chrono::minutes{15});

  insight_token_t issue(const std::string_view request_id,
                        const std::string_view user_id,
                        std::optional<chronicle::schema::id_t> workspace_id =
                            std::nullopt,
                        std::string agent = "external-intelligence");

  insight_result submit_insight(const std::string_view token,
                                const insight_t& insight);

  /// Drop expired tokens. Returns how many were removed.
  std::size_t purge_expired();

  /// Tokens issued and neither spent nor purged.
  std::size_t outstanding() const;

 private:
  struct grant final {
    insight_token_t token;
    std::string agent;
  };

  std::size_t purge_expired_locked(
      const chronicle::schema::timestamp_milliseconds_t now);

  command_gateway& gateway_;
  std::chrono::milliseconds ttl_;
  mutable std::mutex mutex_;
  std::map<std::string, grant, std::less<>> grants_;
};

}  // namespace chronicle::ingress
