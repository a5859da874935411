#pragma once

#include <chronicle/schema/phase.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace chronicle::schema {

/// Parsed form of `{subject}.{action}.{phase}`.
struct event_type_t final {
  std::string subject;
  std::string action;
  phase_t phase{phase_t::requested};

  bool operator==(const event_type_t&) const = default;
};

/// Exactly three non-empty dot separated segments with a known phase.
std::optional<event_type_t> parse_event_type(const std::string_view type);

std::string to_string(const event_type_t& type);

std::string make_event_type(const std::string_view subject,
                            const std::string_view action,
                            const phase_t phase);

/// Same subject and action, different phase.
std::string with_phase(const event_type_t& type, const phase_t phase);

}  // namespace chronicle::schema
