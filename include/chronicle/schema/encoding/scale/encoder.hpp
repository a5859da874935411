#pragma once

#include <chronicle/common/critical.hpp>
#include <chronicle/schema/primitives.hpp>

#include <scale/scale.hpp>

#include <optional>

namespace chronicle::schema::encoding {

/// SCALE codec for every record chronicle persists and for raw command
/// payloads. Schema structs are plain aggregates, so the library walks their
/// fields directly; optionals, vectors and the payload variant are encoded
/// natively.
struct scale_encoder_t final {
  template <typename T>
  chronicle::schema::bytes_t encode(const T& value) const {
    auto encoded = ::scale::impl::memory::encode(value);
    if (!encoded) {
      chronicle::common::critical("encoding", "SCALE encode failed");
    }
    return std::move(encoded.value());
  }

  /// For bytes this process wrote itself; a failure means the store is
  /// corrupt.
  template <typename T>
  T decode(const chronicle::schema::bytes_view_t& bytes) const {
    auto decoded = try_decode<T>(bytes);
    if (!decoded) {
      chronicle::common::critical("encoding", "stored record does not decode");
    }
    return std::move(*decoded);
  }

  /// For untrusted bytes such as webhook bodies.
  template <typename T>
  std::optional<T> try_decode(const chronicle::schema::bytes_view_t& bytes) const {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      return std::nullopt;
    }
    return std::move(decoded.value());
  }
};

}  // namespace chronicle::schema::encoding
