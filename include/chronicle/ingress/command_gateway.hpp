#pragma once

#include <chronicle/events/publisher.hpp>
#include <chronicle/events/schema_registry.hpp>
#include <chronicle/schema/event.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chronicle::ingress {

/// Command as handed over by the routing layer. `type` must be a
/// `.requested` type.
struct command_t final {
  std::string type;
  std::optional<chronicle::schema::id_t> subject_id;
  std::optional<std::string> subject_type;
  chronicle::schema::user_id_t user_id;
  chronicle::schema::source_t source{chronicle::schema::source_t::user};
  std::optional<chronicle::schema::id_t> request_id;
  std::optional<chronicle::schema::id_t> correlation_id;
  chronicle::schema::event_scope_t scope;
  chronicle::schema::payload_t data;
  chronicle::schema::event_metadata_t metadata;
};

struct submission_result final {
  uint32_t code{};
  std::string log;
  /// "requested" once the command is in the log.
  std::string status;
  std::optional<chronicle::schema::id_t> id;
};

/// One entry of a webhook body; `raw` is the SCALE encoded payload.
struct webhook_item_t final {
  std::string type;
  std::optional<chronicle::schema::id_t> subject_id;
  chronicle::schema::bytes_t raw;
};

struct webhook_result final {
  uint32_t code{};
  std::string log;
  std::vector<submission_result> items;
};

/// Entry point for commands from callers and external producers. Submission
/// appends the requested event and returns; everything after that happens
/// asynchronously in the pipeline.
class command_gateway final {
 public:
  command_gateway(const chronicle::events::schema_registry& registry,
                  chronicle::events::publisher& publisher,
                  std::string webhook_secret = {});

  submission_result submit(const command_t& command);

  /// Authenticate with the shared secret, then submit each item on its own
  /// as an automation command. An empty configured secret disables the
  /// endpoint.
  webhook_result ingest_webhook(
      const std::string_view secret,
      const std::string_view user_id,
      const chronicle::schema::event_scope_t& scope,
      const std::vector<webhook_item_t>& items);

 private:
  const chronicle::events::schema_registry& registry_;
  chronicle::events::publisher& publisher_;
  std::string webhook_secret_;
};

}  // namespace chronicle::ingress
