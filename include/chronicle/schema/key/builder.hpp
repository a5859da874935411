#pragma once

#include <chronicle/schema/primitives.hpp>

#include <boost/endian/conversion.hpp>

#include <array>
#include <concepts>
#include <cstdint>
#include <cstring>
#include <string_view>

namespace chronicle::schema::key {

/// RocksDB key under construction: a table name and parts, each written by
/// segment() behind its big-endian length, then an optional raw leaf from
/// write(). Length-prefixed parts keep one id's prefix from matching another
/// id that merely starts with it. Integers go in big-endian so that scans over
/// versions, sequences and message positions come back in numeric order.
struct builder final {
  chronicle::schema::bytes_t data;

  builder& segment(const std::string_view& part);

  builder& write(const std::string_view& leaf);
  builder& write(const chronicle::schema::bytes_view_t& leaf);

  template <std::integral T>
  builder& write(const T value) {
    auto raw = std::array<uint8_t, sizeof(T)>{};
    auto big = boost::endian::native_to_big(value);
    std::memcpy(raw.data(), &big, sizeof(T));
    return write(chronicle::schema::bytes_view_t{raw});
  }

  chronicle::schema::bytes_view_t view() const;
};

}  // namespace chronicle::schema::key
