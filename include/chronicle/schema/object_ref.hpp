#pragma once

#include <chronicle/schema/primitives.hpp>

#include <cstdint>
#include <string>

namespace chronicle::schema {

/// Location and checksum of content written to the object store.
struct object_ref_t final {
  std::string key;
  std::string checksum;
  uint64_t size{};
  std::string content_type;

  bool operator==(const object_ref_t&) const = default;
};

/// Binary upload carried inline with a command.
struct file_upload_t final {
  std::string file_name;
  std::string content_type;
  bytes_t content;
};

}  // namespace chronicle::schema
