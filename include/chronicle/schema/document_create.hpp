#pragma once

#include <chronicle/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chronicle::schema {

template <uint16_t Version>
struct document_create;

template <>
struct document_create<1> final {
  uint16_t version{1};
  std::optional<id_t> document_id;
  std::string title;
  std::string content_type{"text/markdown"};
  bytes_t content;
  std::vector<property_t> properties;
};

using document_create_t = document_create<1>;

}  // namespace chronicle::schema
