#pragma once

#include <chronicle/schema/classification_method.hpp>
#include <chronicle/schema/extraction_method.hpp>
#include <chronicle/schema/primitives.hpp>
#include <chronicle/schema/reasoning_step_type.hpp>
#include <chronicle/schema/relationship_type.hpp>

#include <optional>
#include <string>
#include <vector>

// Schema type: AI provenance attached to event metadata.
// Describes how an AI agent arrived at a command; the projection
// materializer derives its read tables from these sections.
namespace chronicle::schema {

struct confidence_t final {
  basis_points_t score{};
  std::optional<std::string> reasoning;
};

struct extraction_source_t final {
  id_t message_id;
  id_t thread_id;
  std::optional<std::string> content;
};

struct extraction_t final {
  extraction_source_t extracted_from;
  extraction_method_t method{extraction_method_t::explicit_request};
};

struct category_t final {
  std::string name;
  basis_points_t confidence{};
};

struct classification_t final {
  std::vector<category_t> categories;
  std::vector<std::string> tags;
  classification_method_t method{classification_method_t::llm_analysis};
};

struct relationship_t final {
  id_t target_entity_id;
  relationship_type_t type{relationship_type_t::related_to};
  basis_points_t confidence{};
  bool bidirectional{};
};

struct reasoning_step_t final {
  reasoning_step_type_t type{reasoning_step_type_t::thinking};
  std::string content;
  std::optional<timestamp_milliseconds_t> timestamp;
};

struct reasoning_outcome_t final {
  std::string action;
  basis_points_t confidence{};
  std::vector<std::string> alternatives;
};

struct reasoning_trace_t final {
  std::vector<reasoning_step_t> steps;
  std::optional<reasoning_outcome_t> outcome;
  std::optional<duration_milliseconds_t> duration_ms;
  std::optional<uint64_t> token_count;
};

struct ai_provenance_t final {
  std::string agent;
  std::optional<confidence_t> confidence;
  std::optional<extraction_t> extraction;
  std::optional<classification_t> classification;
  std::vector<relationship_t> relationships;
  std::optional<reasoning_trace_t> reasoning;
  std::vector<property_t> inferred_properties;
};

}  // namespace chronicle::schema
