#include <chronicle/common/ids.hpp>
#include <chronicle/ingress/insight_tokens.hpp>
#include <chronicle/schema/error_code.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace chronicle::ingress {

using namespace chronicle::schema;

insight_tokens::insight_tokens(command_gateway& gateway,
                               std::chrono::milliseconds ttl)
    : gateway_{gateway}, ttl_{ttl} {}

insight_token_t insight_tokens::issue(const std::string_view request_id,
                                      const std::string_view user_id,
                                      std::optional<id_t> workspace_id,
                                      std::string agent) {
  auto token = insight_token_t{
      .token = chronicle::common::make_uuid(),
      .request_id = std::string{request_id},
      .user_id = std::string{user_id},
      .workspace_id = std::move(workspace_id),
      .expires_at = chronicle::common::now_ms() +
                    static_cast<timestamp_milliseconds_t>(ttl_.count())};
  auto lock = std::scoped_lock{mutex_};
  purge_expired_locked(chronicle::common::now_ms());
  grants_.insert_or_assign(token.token, grant{token, std::move(agent)});
  return token;
}

insight_result insight_tokens::submit_insight(const std::string_view token,
                                              const insight_t& insight) {
  auto access = std::optional<grant>{};
  {
    auto lock = std::scoped_lock{mutex_};
    auto it = grants_.find(token);
    if (it != std::end(grants_) &&
        it->second.token.expires_at >= chronicle::common::now_ms()) {
      access = it->second;
    }
  }
  if (!access) {
    return insight_result{.code = to_code(error_code::invalid_token),
                          .log = "unknown or expired insight token"};
  }
  if (insight.correlation_id != access->token.request_id) {
    spdlog::warn("Insight for {} presented a token issued for {}",
                 insight.correlation_id, access->token.request_id);
    return insight_result{
        .code = to_code(error_code::correlation_mismatch),
        .log = fmt::format("correlation id {} does not match the token",
                           insight.correlation_id)};
  }
  if (insight.confidence > kMaxBasisPoints) {
    return insight_result{
        .code = to_code(error_code::confidence_out_of_range),
        .log = fmt::format("confidence {} exceeds {}", insight.confidence,
                           kMaxBasisPoints)};
  }

  {
    auto lock = std::scoped_lock{mutex_};
    if (grants_.erase(std::string{token}) == 0) {
      return insight_result{.code = to_code(error_code::invalid_token),
                            .log = "insight token already used"};
    }
  }

  auto provenance = insight.provenance;
  if (provenance.agent.empty()) {
    provenance.agent = access->agent;
  }
  provenance.confidence =
      confidence_t{.score = insight.confidence, .reasoning = insight.reasoning};

  auto result = insight_result{};
  result.actions.reserve(insight.actions.size());
  for (const auto& action : insight.actions) {
    auto command = command_t{};
    command.type = action.type;
    command.subject_id = action.subject_id;
    command.user_id = access->token.user_id;
    command.source = source_t::intelligence;
    command.request_id = insight.correlation_id;
    command.correlation_id = insight.correlation_id;
    command.scope.workspace_id = access->token.workspace_id;
    command.data = action.data;
    command.metadata.ai = provenance;
    result.actions.push_back(gateway_.submit(command));
  }
  spdlog::info("Insight {} produced {} command(s)", insight.correlation_id,
               result.actions.size());
  return result;
}

std::size_t insight_tokens::purge_expired() {
  auto lock = std::scoped_lock{mutex_};
  return purge_expired_locked(chronicle::common::now_ms());
}

std::size_t insight_tokens::outstanding() const {
  auto lock = std::scoped_lock{mutex_};
  return grants_.size();
}

std::size_t insight_tokens::purge_expired_locked(
    const timestamp_milliseconds_t now) {
  auto removed = std::erase_if(grants_, [now](const auto& entry) {
    return entry.second.token.expires_at < now;
  });
  if (removed > 0) {
    spdlog::debug("Purged {} expired insight token(s)", removed);
  }
  return removed;
}

}  // namespace chronicle::ingress
