#include <chronicle/projections/materializer.hpp>
#include <chronicle/schema/event_type.hpp>
#include <chronicle/schema/key/builder.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <utility>

namespace chronicle::projections {

using namespace chronicle::schema;

namespace {

using encoder_t = chronicle::schema::encoding::scale_encoder_t;

key::builder enrichment_key(const std::string_view entity_id,
                            const std::string_view event_id,
                            const std::string_view kind) {
  auto key = key::builder{};
  key.segment("ENR").segment(entity_id).segment(event_id).write(kind);
  return key;
}

key::builder relationship_key(const relationship_row_t& row) {
  auto key = key::builder{};
  key.segment("REL")
      .segment(row.source_entity_id)
      .segment(row.target_entity_id)
      .segment(to_string(row.type))
      .write(row.source_event_id);
  return key;
}

key::builder reasoning_key(const std::string_view subject_id,
                           const std::string_view event_id) {
  auto key = key::builder{};
  key.segment("RSN").segment(subject_id).write(event_id);
  return key;
}

std::optional<basis_points_t> overall_confidence(const ai_provenance_t& ai) {
  if (!ai.confidence) {
    return std::nullopt;
  }
  return ai.confidence->score;
}

std::vector<enrichment_row_t> enrichments(const event_t& event,
                                          const ai_provenance_t& ai) {
  const auto& entity_id = *event.subject_id;
  auto rows = std::vector<enrichment_row_t>{};
  auto make_row = [&](std::string kind) {
    auto row = enrichment_row_t{};
    row.entity_id = entity_id;
    row.source_event_id = event.id;
    row.kind = std::move(kind);
    row.agent = ai.agent;
    row.confidence = overall_confidence(ai);
    row.created_at = event.timestamp;
    return row;
  };

  if (ai.extraction) {
    auto row = make_row("extraction");
    const auto& source = ai.extraction->extracted_from;
    row.summary = fmt::format("{} extraction from message {}",
                              to_string(ai.extraction->method),
                              source.message_id);
    row.properties.push_back({"thread_id", source.thread_id});
    row.properties.push_back({"message_id", source.message_id});
    if (source.content) {
      row.properties.push_back({"content", *source.content});
    }
    rows.push_back(std::move(row));
  }
  if (ai.classification) {
    auto row = make_row("classification");
    row.summary = fmt::format("{} classification",
                              to_string(ai.classification->method));
    for (const auto& category : ai.classification->categories) {
      row.properties.push_back(
          {"category", fmt::format("{}:{}", category.name, category.confidence)});
    }
    for (const auto& tag : ai.classification->tags) {
      row.properties.push_back({"tag", tag});
    }
    rows.push_back(std::move(row));
  }
  if (!ai.inferred_properties.empty()) {
    auto row = make_row("inferred_properties");
    row.summary = fmt::format("{} inferred propert{}",
                              ai.inferred_properties.size(),
                              ai.inferred_properties.size() == 1 ? "y" : "ies");
    row.properties = ai.inferred_properties;
    rows.push_back(std::move(row));
  }
  return rows;
}

std::vector<relationship_row_t> relationships(const event_t& event,
                                              const ai_provenance_t& ai) {
  auto rows = std::vector<relationship_row_t>{};
  for (const auto& relationship : ai.relationships) {
    auto row = relationship_row_t{};
    row.source_entity_id = *event.subject_id;
    row.target_entity_id = relationship.target_entity_id;
    row.type = relationship.type;
    row.confidence = relationship.confidence;
    row.agent = ai.agent;
    row.source_event_id = event.id;
    row.created_at = event.timestamp;
    rows.push_back(row);
    if (relationship.bidirectional) {
      std::swap(row.source_entity_id, row.target_entity_id);
      row.reverse = true;
      rows.push_back(std::move(row));
    }
  }
  return rows;
}

}  // namespace

materializer::materializer(chronicle::storage::rocksdb_storage_t& storage)
    : storage_{storage} {}

bool materializer::projectable(const event_t& event) {
  auto type = parse_event_type(event.type);
  return type && type->phase == phase_t::completed && event.metadata.ai &&
         event.subject_id && !event.subject_id->empty();
}

chronicle::dispatch::handler_result materializer::handle(
    const stored_event_t& event) {
  auto written = project(event);
  return {.success = true,
          .message = fmt::format("{} row(s) projected", written)};
}

uint32_t materializer::project(const stored_event_t& stored) {
  const auto& event = stored.event;
  if (!projectable(event)) {
    return 0;
  }
  const auto& ai = *event.metadata.ai;
  auto encoder = encoder_t{};
  auto written = uint32_t{0};

  for (const auto& row : enrichments(event, ai)) {
    written += storage_.put_if_absent(
        encoder, enrichment_key(row.entity_id, row.source_event_id, row.kind)
                     .view(),
        row);
  }
  for (const auto& row : relationships(event, ai)) {
    written += storage_.put_if_absent(encoder, relationship_key(row).view(), row);
  }
  if (ai.reasoning) {
    auto row = reasoning_row_t{};
    row.subject_id = *event.subject_id;
    row.source_event_id = event.id;
    row.agent = ai.agent;
    row.steps = ai.reasoning->steps;
    row.outcome = ai.reasoning->outcome;
    row.duration_ms = ai.reasoning->duration_ms;
    row.token_count = ai.reasoning->token_count;
    row.created_at = event.timestamp;
    written += storage_.put_if_absent(
        encoder, reasoning_key(row.subject_id, row.source_event_id).view(), row);
  }
  if (written > 0) {
    spdlog::debug("Projected {} row(s) from {}", written, event.id);
  }
  return written;
}

rebuild_stats materializer::rebuild(
    const chronicle::events::event_store& store,
    std::optional<timestamp_milliseconds_t> from) {
  auto stats = rebuild_stats{};
  spdlog::info("Rebuilding projections from {}",
               from ? fmt::format("{} ms", *from) : std::string{"the beginning"});
  store.for_each_since(from.value_or(0), [&](const stored_event_t& event) {
    ++stats.processed;
    try {
      if (projectable(event.event)) {
        project(event);
        ++stats.projected;
      }
    } catch (const std::exception& ex) {
      ++stats.errors;
      spdlog::error("Projection of {} failed: {}", event.event.id, ex.what());
    }
  });
  spdlog::info("Rebuild finished: {} processed, {} projected, {} error(s)",
               stats.processed, stats.projected, stats.errors);
  return stats;
}

std::vector<enrichment_row_t> materializer::enrichments_for(
    const std::string_view entity_id) const {
  auto encoder = encoder_t{};
  auto prefix = key::builder{};
  prefix.segment("ENR").segment(entity_id);
  return storage_.scan<encoder_t, enrichment_row_t>(encoder, prefix.view());
}

std::vector<relationship_row_t> materializer::relationships_from(
    const std::string_view entity_id) const {
  auto encoder = encoder_t{};
  auto prefix = key::builder{};
  prefix.segment("REL").segment(entity_id);
  return storage_.scan<encoder_t, relationship_row_t>(encoder, prefix.view());
}

std::vector<reasoning_row_t> materializer::reasoning_for(
    const std::string_view subject_id) const {
  auto encoder = encoder_t{};
  auto prefix = key::builder{};
  prefix.segment("RSN").segment(subject_id);
  return storage_.scan<encoder_t, reasoning_row_t>(encoder, prefix.view());
}

}  // namespace chronicle::projections
