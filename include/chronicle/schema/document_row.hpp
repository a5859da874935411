#pragma once

#include <chronicle/schema/object_ref.hpp>
#include <chronicle/schema/primitives.hpp>
#include <chronicle/schema/row_audit.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chronicle::schema {

template <uint16_t Version>
struct document_row;

template <>
struct document_row<1> final {
  uint16_t version{1};
  id_t id;
  user_id_t user_id;
  std::optional<id_t> workspace_id;
  std::string title;
  object_ref_t content;
  std::vector<property_t> properties;
  uint64_t row_version{1};
  row_audit_t audit;
};

using document_row_t = document_row<1>;

}  // namespace chronicle::schema
