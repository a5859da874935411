#pragma once

#include <chronicle/schema/primitives.hpp>

#include <cstdint>
#include <optional>

namespace chronicle::schema {

template <uint16_t Version>
struct document_delete;

template <>
struct document_delete<1> final {
  uint16_t version{1};
  id_t document_id;
  std::optional<uint64_t> expected_version;
};

using document_delete_t = document_delete<1>;

}  // namespace chronicle::schema
