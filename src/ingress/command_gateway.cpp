#include <chronicle/crypto/digest.hpp>
#include <chronicle/ingress/command_gateway.hpp>
#include <chronicle/schema/error_code.hpp>
#include <chronicle/schema/event_type.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace chronicle::ingress {

using namespace chronicle::schema;

namespace {

constexpr auto kRequestedStatus = std::string_view{"requested"};

submission_result rejected(const uint32_t code, std::string log) {
  return submission_result{.code = code, .log = std::move(log)};
}

}  // namespace

command_gateway::command_gateway(
    const chronicle::events::schema_registry& registry,
    chronicle::events::publisher& publisher,
    std::string webhook_secret)
    : registry_{registry},
      publisher_{publisher},
      webhook_secret_{std::move(webhook_secret)} {}

submission_result command_gateway::submit(const command_t& command) {
  auto type = parse_event_type(command.type);
  if (!type || type->phase != phase_t::requested) {
    return rejected(to_code(error_code::malformed_event_type),
                    fmt::format("'{}' is not a requested event type",
                                command.type));
  }

  auto input = chronicle::events::event_input_t{};
  input.type = command.type;
  input.subject_id = command.subject_id;
  input.subject_type = command.subject_type ? command.subject_type
                                            : std::optional{type->subject};
  if (!command.user_id.empty()) {
    input.user_id = command.user_id;
  }
  input.source = command.source;
  input.scope = command.scope;
  input.trace.request_id = command.request_id;
  input.trace.correlation_id = command.correlation_id;
  input.data = command.data;
  input.metadata = command.metadata;

  auto created = registry_.create_event(input);
  if (created.code != 0) {
    spdlog::info("Rejected {}: {}", command.type, created.log);
    return rejected(created.code, created.log);
  }
  auto published = publisher_.publish(*created.event);
  if (published.code != 0) {
    return rejected(published.code, published.log);
  }
  return submission_result{.status = std::string{kRequestedStatus},
                           .id = created.event->id};
}

webhook_result command_gateway::ingest_webhook(
    const std::string_view secret,
    const std::string_view user_id,
    const event_scope_t& scope,
    const std::vector<webhook_item_t>& items) {
  if (webhook_secret_.empty()) {
    return webhook_result{.code = to_code(error_code::webhooks_disabled),
                          .log = "webhook ingestion is not configured"};
  }
  if (!chronicle::crypto::secure_equals(secret, webhook_secret_)) {
    spdlog::warn("Webhook rejected: bad shared secret");
    return webhook_result{.code = to_code(error_code::unauthorized),
                          .log = "invalid webhook secret"};
  }

  auto result = webhook_result{};
  result.items.reserve(items.size());
  for (const auto& item : items) {
    auto validated = registry_.validate(item.type, make_bytes_view(item.raw));
    if (validated.code != 0) {
      result.items.push_back(rejected(validated.code, validated.log));
      continue;
    }
    auto command = command_t{};
    command.type = item.type;
    command.subject_id = item.subject_id;
    command.user_id = std::string{user_id};
    command.source = source_t::automation;
    command.scope = scope;
    command.data = std::move(*validated.payload);
    result.items.push_back(submit(command));
  }
  auto accepted = std::ranges::count_if(
      result.items, [](const auto& item) { return item.code == 0; });
  spdlog::info("Webhook accepted {}/{} item(s)", accepted, items.size());
  return result;
}

}  // namespace chronicle::ingress
