#pragma once

#include <chronicle/events/schema_registry.hpp>
#include <chronicle/schema/event.hpp>
#include <chronicle/schema/permission_decision.hpp>
#include <chronicle/storage/rocksdb/storage.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chronicle::events {

struct append_result final {
  uint32_t code{};
  std::string log;
  std::optional<chronicle::schema::stored_event_t> stored;
};

struct annotation_result final {
  uint32_t code{};
  std::string log;
  /// False when the annotation was already present.
  bool written{};
};

/// Append-only event log on RocksDB.
///
/// Each append commits the event, its subject stream entry, the global
/// sequence entry and the secondary indexes in one write batch. The core
/// record is never rewritten; metadata annotations live under a separate key
/// and are merged on read.
class event_store final {
 public:
  event_store(chronicle::storage::rocksdb_storage_t& storage,
              const schema_registry& registry);

  /// Validate and append. When `expected_version` is set the subject's
  /// current version must equal it (0 for a subject with no events).
  append_result append(
      const chronicle::schema::event_t& event,
      std::optional<uint64_t> expected_version = std::nullopt);

  /// Independent appends; one result per input, in order.
  std::vector<append_result> append_batch(
      const std::vector<chronicle::schema::event_t>& events);

  std::optional<chronicle::schema::stored_event_t> get(
      const std::string_view event_id) const;

  /// Events of one subject ordered by version, within [from, to].
  std::vector<chronicle::schema::stored_event_t> get_aggregate_stream(
      const std::string_view subject_id,
      uint64_t from_version = 1,
      std::optional<uint64_t> to_version = std::nullopt) const;

  /// Number of events for the subject, or std::nullopt when it has none.
  std::optional<uint64_t> get_aggregate_version(
      const std::string_view subject_id) const;

  /// Most recent events of a user, newest first.
  std::vector<chronicle::schema::stored_event_t> get_user_stream(
      const std::string_view user_id,
      std::size_t limit) const;

  /// Every event sharing a correlation id, in append order.
  std::vector<chronicle::schema::stored_event_t> get_correlated(
      const std::string_view correlation_id) const;

  /// Visit events with timestamp >= from in append order. Returns the number
  /// of events visited.
  uint64_t for_each_since(
      chronicle::schema::timestamp_milliseconds_t from,
      const std::function<void(const chronicle::schema::stored_event_t&)>&
          visitor) const;

  /// Record a governor decision on an event. Recording the same decision
  /// again is a no-op; a different decision never replaces the first.
  annotation_result annotate(const std::string_view event_id,
                             const chronicle::schema::permission_decision_t&
                                 decision);

  /// Add a key/value note to an event's metadata. Duplicate pairs are
  /// ignored.
  annotation_result add_annotation(const std::string_view event_id,
                                   const std::string_view key,
                                   const std::string_view value);

  /// Set `key` unless the event already carries an annotation with that
  /// key, whatever its value.
  annotation_result annotate_once(const std::string_view event_id,
                                  const std::string_view key,
                                  const std::string_view value);

  uint64_t last_sequence() const;

 private:
  std::optional<chronicle::schema::stored_event_t> load(
      const std::string_view event_id) const;
  std::vector<chronicle::schema::stored_event_t> resolve(
      const std::vector<chronicle::storage::key_value_entry_t>& index) const;

  chronicle::storage::rocksdb_storage_t& storage_;
  const schema_registry& registry_;
  std::mutex append_mutex_;
  std::mutex metadata_mutex_;
  std::atomic<uint64_t> sequence_{};
};

}  // namespace chronicle::events
