#include <chronicle/schema/primitives.hpp>

#include <algorithm>
#include <iterator>

namespace chronicle::schema {

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t(bytes.begin(), bytes.end());
}

bytes_t make_bytes(const std::string_view& text) {
  return make_bytes(make_bytes_view(text));
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes.data(), bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& text) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(text.data()),
                      text.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  auto text = std::string{};
  text.reserve(bytes.size());
  std::ranges::transform(bytes, std::back_inserter(text),
                         [](const uint8_t b) { return static_cast<char>(b); });
  return text;
}

std::string to_hex(const bytes_view_t& bytes) {
  constexpr auto kDigits = std::string_view{"0123456789abcdef"};
  auto hex = std::string{};
  hex.reserve(bytes.size() * 2);
  for (const auto b : bytes) {
    hex.push_back(kDigits[b >> 4u]);
    hex.push_back(kDigits[b & 0x0Fu]);
  }
  return hex;
}

std::optional<std::string> find_property(
    const std::vector<property_t>& properties,
    const std::string_view key) {
  auto it = std::ranges::find(properties, key, &property_t::key);
  if (it == std::end(properties)) {
    return std::nullopt;
  }
  return it->value;
}

}  // namespace chronicle::schema
