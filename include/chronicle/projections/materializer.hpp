#pragma once

#include <chronicle/dispatch/handler_registry.hpp>
#include <chronicle/events/event_store.hpp>
#include <chronicle/schema/event.hpp>
#include <chronicle/schema/projection_rows.hpp>
#include <chronicle/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace chronicle::projections {

struct rebuild_stats final {
  uint64_t processed{};
  uint64_t projected{};
  uint64_t errors{};
};

/// Derives read tables from the AI provenance of completed commands.
///
/// Every row key embeds the id of the event it came from and every write is
/// insert-if-absent, so projecting an event twice (live delivery racing a
/// rebuild, or a redelivery) leaves exactly one copy of each row.
class materializer final {
 public:
  static constexpr auto kName = std::string_view{"projection-materializer"};
  static constexpr auto kPattern = std::string_view{"*.*.completed"};

  explicit materializer(chronicle::storage::rocksdb_storage_t& storage);

  chronicle::dispatch::handler_result handle(
      const chronicle::schema::stored_event_t& event);

  /// Number of rows newly written; 0 for events with nothing to project.
  uint32_t project(const chronicle::schema::stored_event_t& event);

  /// Replay the log, or its tail from `from`, through project().
  rebuild_stats rebuild(
      const chronicle::events::event_store& store,
      std::optional<chronicle::schema::timestamp_milliseconds_t> from =
          std::nullopt);

  std::vector<chronicle::schema::enrichment_row_t> enrichments_for(
      const std::string_view entity_id) const;

  /// Outgoing edges, including the mirrored side of bidirectional ones.
  std::vector<chronicle::schema::relationship_row_t> relationships_from(
      const std::string_view entity_id) const;

  std::vector<chronicle::schema::reasoning_row_t> reasoning_for(
      const std::string_view subject_id) const;

  static bool projectable(const chronicle::schema::event_t& event);

 private:
  chronicle::storage::rocksdb_storage_t& storage_;
};

}  // namespace chronicle::projections
