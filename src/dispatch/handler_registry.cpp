#include <chronicle/dispatch/handler_registry.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <optional>

namespace chronicle::dispatch {

namespace {

std::optional<std::array<std::string_view, 3>> split(
    const std::string_view value) {
  auto segments = std::array<std::string_view, 3>{};
  auto remaining = value;
  for (auto i = size_t{0}; i < segments.size(); ++i) {
    auto dot = remaining.find('.');
    auto last = i + 1 == segments.size();
    if (last != (dot == std::string_view::npos)) {
      return std::nullopt;
    }
    segments[i] = last ? remaining : remaining.substr(0, dot);
    if (segments[i].empty()) {
      return std::nullopt;
    }
    if (!last) {
      remaining.remove_prefix(dot + 1);
    }
  }
  return segments;
}

}  // namespace

bool handler_registry::valid_pattern(const std::string_view pattern) {
  return split(pattern).has_value();
}

bool handler_registry::matches(const std::string_view pattern,
                               const std::string_view type) {
  auto wanted = split(pattern);
  auto actual = split(type);
  if (!wanted || !actual) {
    return false;
  }
  for (auto i = size_t{0}; i < wanted->size(); ++i) {
    if ((*wanted)[i] != "*" && (*wanted)[i] != (*actual)[i]) {
      return false;
    }
  }
  return true;
}

bool handler_registry::add(std::string name,
                           std::string pattern,
                           handler_t handler) {
  if (!valid_pattern(pattern) || !handler) {
    spdlog::error("Rejecting handler '{}' with pattern '{}'", name, pattern);
    return false;
  }
  auto lock = std::scoped_lock{mutex_};
  auto duplicate = std::ranges::any_of(
      handlers_, [&](const registered_handler& h) { return h.name == name; });
  if (duplicate) {
    spdlog::error("Handler '{}' is already registered", name);
    return false;
  }
  spdlog::debug("Registered handler '{}' for '{}'", name, pattern);
  handlers_.push_back(registered_handler{.name = std::move(name),
                                         .pattern = std::move(pattern),
                                         .handler = std::move(handler)});
  return true;
}

std::vector<registered_handler> handler_registry::match(
    const std::string_view type) const {
  auto lock = std::scoped_lock{mutex_};
  auto matched = std::vector<registered_handler>{};
  for (const auto& entry : handlers_) {
    if (matches(entry.pattern, type)) {
      matched.push_back(entry);
    }
  }
  return matched;
}

std::size_t handler_registry::size() const {
  auto lock = std::scoped_lock{mutex_};
  return handlers_.size();
}

}  // namespace chronicle::dispatch
