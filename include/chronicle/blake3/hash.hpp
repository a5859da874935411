#pragma once
#include <chronicle/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace chronicle::blake3 {

chronicle::schema::hash32_t hash(const std::string_view& str);
chronicle::schema::hash32_t hash(const chronicle::schema::bytes_view_t& bytes);

/// Lowercase hex of hash(bytes); the content checksum format.
std::string hex_digest(const chronicle::schema::bytes_view_t& bytes);

}  // namespace chronicle::blake3
