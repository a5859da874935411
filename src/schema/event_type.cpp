#include <chronicle/schema/event_type.hpp>

#include <spdlog/fmt/fmt.h>

#include <array>

namespace chronicle::schema {

std::optional<event_type_t> parse_event_type(const std::string_view type) {
  auto segments = std::array<std::string_view, 3>{};
  auto remaining = type;
  for (auto i = size_t{0}; i < segments.size(); ++i) {
    auto dot = remaining.find('.');
    if (i + 1 < segments.size()) {
      if (dot == std::string_view::npos) {
        return std::nullopt;
      }
      segments[i] = remaining.substr(0, dot);
      remaining.remove_prefix(dot + 1);
    } else {
      if (dot != std::string_view::npos) {
        return std::nullopt;
      }
      segments[i] = remaining;
    }
    if (segments[i].empty()) {
      return std::nullopt;
    }
  }
  auto phase = try_from_string<phase_t>(segments[2]);
  if (!phase) {
    return std::nullopt;
  }
  return event_type_t{.subject = std::string{segments[0]},
                      .action = std::string{segments[1]},
                      .phase = *phase};
}

std::string to_string(const event_type_t& type) {
  return make_event_type(type.subject, type.action, type.phase);
}

std::string make_event_type(const std::string_view subject,
                            const std::string_view action,
                            const phase_t phase) {
  return fmt::format("{}.{}.{}", subject, action, to_string(phase));
}

std::string with_phase(const event_type_t& type, const phase_t phase) {
  return make_event_type(type.subject, type.action, phase);
}

}  // namespace chronicle::schema
