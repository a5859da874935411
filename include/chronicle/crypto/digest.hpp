#pragma once

#include <chronicle/schema/primitives.hpp>

#include <initializer_list>
#include <string>
#include <string_view>

namespace chronicle::crypto {

/// Lowercase hex SHA-256 of the concatenation of `parts`.
std::string sha256_hex(std::initializer_list<std::string_view> parts);

/// Constant-time equality; lengths are compared first.
bool secure_equals(const std::string_view lhs, const std::string_view rhs);

}  // namespace chronicle::crypto
