#include <chronicle/common/ids.hpp>

#include <boost/uuid/name_generator_sha1.hpp>
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <chrono>
#include <stdexcept>

namespace chronicle::common {

namespace {

// Fixed namespace for every deterministic id chronicle derives.
const auto kChronicleNamespace =
    boost::uuids::string_generator{}("6f1c2a4e-8d3b-5e7f-9a10-c2b4d6e8f0a1");

}  // namespace

std::string make_uuid() {
  thread_local auto generator = boost::uuids::random_generator{};
  return boost::uuids::to_string(generator());
}

std::string make_deterministic_uuid(const std::string_view scope,
                                    const std::string_view name) {
  auto scoped = boost::uuids::name_generator_sha1{kChronicleNamespace}(
      scope.data(), scope.size());
  auto generator = boost::uuids::name_generator_sha1{scoped};
  return boost::uuids::to_string(generator(name.data(), name.size()));
}

bool is_uuid(const std::string_view value) {
  if (value.size() != 36) {
    return false;
  }
  try {
    static_cast<void>(boost::uuids::string_generator{}(std::string{value}));
    return true;
  } catch (const std::runtime_error&) {
    return false;
  }
}

chronicle::schema::timestamp_milliseconds_t now_ms() {
  return static_cast<chronicle::schema::timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

}  // namespace chronicle::common
