#include <chronicle/events/event_store.hpp>
#include <chronicle/schema/error_code.hpp>
#include <chronicle/schema/key/builder.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>

namespace chronicle::events {

using namespace chronicle::schema;

namespace {

using encoder_t = chronicle::schema::encoding::scale_encoder_t;

key::builder event_key(const std::string_view event_id) {
  auto key = key::builder{};
  key.segment("EVT").segment("ID").write(event_id);
  return key;
}

key::builder metadata_key(const std::string_view event_id) {
  auto key = key::builder{};
  key.segment("EVT").segment("META").write(event_id);
  return key;
}

key::builder stream_prefix(const std::string_view subject_id) {
  auto key = key::builder{};
  key.segment("EVT").segment("AGG").segment(subject_id);
  return key;
}

key::builder version_key(const std::string_view subject_id) {
  auto key = key::builder{};
  key.segment("EVT").segment("VER").write(subject_id);
  return key;
}

key::builder sequence_prefix() {
  auto key = key::builder{};
  key.segment("EVT").segment("SEQ");
  return key;
}

key::builder head_key() {
  auto key = key::builder{};
  key.segment("EVT").write("HEAD");
  return key;
}

key::builder user_prefix(const std::string_view user_id) {
  auto key = key::builder{};
  key.segment("EVT").segment("USR").segment(user_id);
  return key;
}

key::builder correlation_prefix(const std::string_view correlation_id) {
  auto key = key::builder{};
  key.segment("EVT").segment("COR").segment(correlation_id);
  return key;
}

append_result make_error(const error_code code, std::string log) {
  return append_result{.code = to_code(code), .log = std::move(log)};
}

}  // namespace

event_store::event_store(chronicle::storage::rocksdb_storage_t& storage,
                         const schema_registry& registry)
    : storage_{storage}, registry_{registry} {
  auto encoder = encoder_t{};
  sequence_ =
      storage_.get<encoder_t, uint64_t>(encoder, head_key().view()).value_or(0);
  spdlog::info("Event store ready at sequence {}", sequence_);
}

append_result event_store::append(const event_t& event,
                                  std::optional<uint64_t> expected_version) {
  if (event.id.empty()) {
    return make_error(error_code::schema_validation_failed,
                      "event id is required");
  }
  auto checked = registry_.check(event.type, event.data);
  if (checked.code != 0) {
    spdlog::warn("Rejected event {} of type '{}': {}", event.id, event.type,
                 checked.log);
    return make_error(static_cast<error_code>(checked.code), checked.log);
  }

  auto encoder = encoder_t{};
  auto lock = std::scoped_lock{append_mutex_};
  if (storage_.contains(event_key(event.id).view())) {
    return make_error(error_code::duplicate_event,
                      fmt::format("event {} already appended", event.id));
  }

  auto current = uint64_t{0};
  if (event.subject_id) {
    current = storage_
                  .get<encoder_t, uint64_t>(
                      encoder, version_key(*event.subject_id).view())
                  .value_or(0);
  }
  if (expected_version && *expected_version != current) {
    return make_error(
        error_code::version_conflict,
        fmt::format("expected version {} of {}, found {}", *expected_version,
                    event.subject_id.value_or("<none>"), current));
  }

  auto stored = stored_event_t{};
  stored.sequence = sequence_ + 1;
  stored.aggregate_version = event.subject_id ? current + 1 : 0;
  stored.event = event;
  stored.event.data = std::move(*checked.payload);

  auto batch = chronicle::storage::write_batch{};
  batch.put(encoder, event_key(event.id).view(), stored);
  batch.put(encoder, sequence_prefix().write(stored.sequence).view(),
            event.id);
  batch.put(encoder, head_key().view(), stored.sequence);
  if (event.subject_id) {
    batch.put(encoder,
              stream_prefix(*event.subject_id)
                  .write(stored.aggregate_version)
                  .view(),
              event.id);
    batch.put(encoder, version_key(*event.subject_id).view(),
              stored.aggregate_version);
  }
  if (event.user_id) {
    batch.put(encoder,
              user_prefix(*event.user_id).write(stored.sequence).view(),
              event.id);
  }
  if (event.trace.correlation_id) {
    batch.put(encoder,
              correlation_prefix(*event.trace.correlation_id)
                  .write(stored.sequence)
                  .view(),
              event.id);
  }
  storage_.commit(batch);
  sequence_ = stored.sequence;

  spdlog::debug("Appended {} ({}) seq={} version={}", event.type, event.id,
                stored.sequence, stored.aggregate_version);
  return append_result{.stored = std::move(stored)};
}

std::vector<append_result> event_store::append_batch(
    const std::vector<event_t>& events) {
  auto results = std::vector<append_result>{};
  results.reserve(events.size());
  for (const auto& event : events) {
    results.push_back(append(event));
  }
  return results;
}

std::optional<stored_event_t> event_store::load(
    const std::string_view event_id) const {
  auto encoder = encoder_t{};
  auto stored =
      storage_.get<encoder_t, stored_event_t>(encoder, event_key(event_id).view());
  if (!stored) {
    return std::nullopt;
  }
  auto metadata = storage_.get<encoder_t, event_metadata_t>(
      encoder, metadata_key(event_id).view());
  if (metadata) {
    stored->event.metadata = std::move(*metadata);
  }
  return stored;
}

std::optional<stored_event_t> event_store::get(
    const std::string_view event_id) const {
  return load(event_id);
}

std::vector<stored_event_t> event_store::resolve(
    const std::vector<chronicle::storage::key_value_entry_t>& index) const {
  auto encoder = encoder_t{};
  auto events = std::vector<stored_event_t>{};
  events.reserve(index.size());
  for (const auto& [key, value] : index) {
    auto event_id = encoder.decode<std::string>(make_bytes_view(value));
    auto stored = load(event_id);
    if (!stored) {
      chronicle::common::critical("event index points at a missing event");
    }
    events.push_back(std::move(*stored));
  }
  return events;
}

std::vector<stored_event_t> event_store::get_aggregate_stream(
    const std::string_view subject_id,
    uint64_t from_version,
    std::optional<uint64_t> to_version) const {
  auto events = resolve(storage_.list_by_prefix(stream_prefix(subject_id).view()));
  std::erase_if(events, [&](const stored_event_t& stored) {
    return stored.aggregate_version < from_version ||
           (to_version && stored.aggregate_version > *to_version);
  });
  return events;
}

std::optional<uint64_t> event_store::get_aggregate_version(
    const std::string_view subject_id) const {
  auto encoder = encoder_t{};
  return storage_.get<encoder_t, uint64_t>(encoder,
                                           version_key(subject_id).view());
}

std::vector<stored_event_t> event_store::get_user_stream(
    const std::string_view user_id,
    std::size_t limit) const {
  auto index = storage_.list_by_prefix(user_prefix(user_id).view());
  std::ranges::reverse(index);
  if (index.size() > limit) {
    index.resize(limit);
  }
  return resolve(index);
}

std::vector<stored_event_t> event_store::get_correlated(
    const std::string_view correlation_id) const {
  return resolve(
      storage_.list_by_prefix(correlation_prefix(correlation_id).view()));
}

uint64_t event_store::for_each_since(
    timestamp_milliseconds_t from,
    const std::function<void(const stored_event_t&)>& visitor) const {
  auto encoder = encoder_t{};
  auto visited = uint64_t{0};
  for (const auto& [key, value] :
       storage_.list_by_prefix(sequence_prefix().view())) {
    auto event_id = encoder.decode<std::string>(make_bytes_view(value));
    auto stored = load(event_id);
    if (!stored) {
      chronicle::common::critical("sequence index points at a missing event");
    }
    if (stored->event.timestamp < from) {
      continue;
    }
    visitor(*stored);
    ++visited;
  }
  return visited;
}

annotation_result event_store::annotate(
    const std::string_view event_id,
    const permission_decision_t& decision) {
  auto lock = std::scoped_lock{metadata_mutex_};
  auto stored = load(event_id);
  if (!stored) {
    return annotation_result{
        .code = to_code(error_code::event_not_found),
        .log = fmt::format("event {} not found", event_id)};
  }
  auto& metadata = stored->event.metadata;
  if (metadata.approval) {
    if (*metadata.approval != decision) {
      spdlog::warn("Event {} already carries a different decision ({}); "
                   "keeping the recorded one",
                   event_id, metadata.approval->reason);
      return annotation_result{.log = "a different decision is recorded"};
    }
    return annotation_result{.log = "decision already recorded"};
  }
  metadata.approval = decision;
  auto encoder = encoder_t{};
  storage_.put(encoder, metadata_key(event_id).view(), metadata);
  return annotation_result{.written = true};
}

annotation_result event_store::add_annotation(const std::string_view event_id,
                                              const std::string_view key,
                                              const std::string_view value) {
  auto lock = std::scoped_lock{metadata_mutex_};
  auto stored = load(event_id);
  if (!stored) {
    return annotation_result{
        .code = to_code(error_code::event_not_found),
        .log = fmt::format("event {} not found", event_id)};
  }
  auto& annotations = stored->event.metadata.annotations;
  auto exists = std::ranges::any_of(annotations, [&](const property_t& p) {
    return p.key == key && p.value == value;
  });
  if (exists) {
    return annotation_result{.log = "annotation already present"};
  }
  annotations.push_back(
      property_t{.key = std::string{key}, .value = std::string{value}});
  auto encoder = encoder_t{};
  storage_.put(encoder, metadata_key(event_id).view(),
               stored->event.metadata);
  return annotation_result{.written = true};
}

annotation_result event_store::annotate_once(const std::string_view event_id,
                                             const std::string_view key,
                                             const std::string_view value) {
  auto lock = std::scoped_lock{metadata_mutex_};
  auto stored = load(event_id);
  if (!stored) {
    return annotation_result{
        .code = to_code(error_code::event_not_found),
        .log = fmt::format("event {} not found", event_id)};
  }
  auto& annotations = stored->event.metadata.annotations;
  if (find_property(annotations, key)) {
    return annotation_result{.log = fmt::format("{} already set", key)};
  }
  annotations.push_back(
      property_t{.key = std::string{key}, .value = std::string{value}});
  auto encoder = encoder_t{};
  storage_.put(encoder, metadata_key(event_id).view(),
               stored->event.metadata);
  return annotation_result{.written = true};
}

uint64_t event_store::last_sequence() const {
  return sequence_;
}

}  // namespace chronicle::events
