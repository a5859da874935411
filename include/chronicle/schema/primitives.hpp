#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chronicle::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;

/// UUID text form; every event, row and thread id uses it.
using id_t = std::string;
using user_id_t = std::string;

/// Confidence scores are carried as basis points (0..10000 == 0.0..1.0).
using basis_points_t = uint16_t;
inline constexpr auto kMaxBasisPoints = basis_points_t{10000};

/// Free-form key/value annotation. Ordered vectors of these stand in for
/// string maps so that encodings stay deterministic.
struct property_t final {
  std::string key;
  std::string value;
};

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& text);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string_view& text);

std::string make_string(const bytes_view_t& bytes);

/// Lowercase hex, two characters per byte.
std::string to_hex(const bytes_view_t& bytes);

/// Value of the first property named `key`.
std::optional<std::string> find_property(
    const std::vector<property_t>& properties,
    const std::string_view key);

}  // namespace chronicle::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
