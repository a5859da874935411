#pragma once

#include <chronicle/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace chronicle::schema {

template <uint16_t Version>
struct document_update;

template <>
struct document_update<1> final {
  uint16_t version{1};
  id_t document_id;
  std::optional<uint64_t> expected_version;
  std::optional<std::string> title;
  std::optional<std::string> content_type;
  std::optional<bytes_t> content;
};

using document_update_t = document_update<1>;

}  // namespace chronicle::schema
