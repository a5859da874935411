#include <chronicle/blake3/hash.hpp>
#include <chronicle/workers/object_store.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace chronicle::workers {

chronicle::schema::object_ref_t make_object_ref(
    const std::string_view key,
    const chronicle::schema::bytes_view_t& content,
    const std::string_view content_type) {
  return chronicle::schema::object_ref_t{
      .key = std::string{key},
      .checksum = chronicle::blake3::hex_digest(content),
      .size = content.size(),
      .content_type = std::string{content_type}};
}

filesystem_object_store::filesystem_object_store(std::filesystem::path root)
    : root_{std::move(root)} {
  auto error = std::error_code{};
  std::filesystem::create_directories(root_, error);
  if (error) {
    throw std::runtime_error{fmt::format("cannot create object store at {}: {}",
                                         root_.string(), error.message())};
  }
}

std::filesystem::path filesystem_object_store::resolve(
    const std::string_view key) const {
  auto relative = std::filesystem::path{key}.lexically_normal();
  if (key.empty() || relative.is_absolute() ||
      relative.string().starts_with("..")) {
    throw std::invalid_argument{fmt::format("invalid object key '{}'", key)};
  }
  return root_ / relative;
}

chronicle::schema::object_ref_t filesystem_object_store::put(
    const std::string_view key,
    const chronicle::schema::bytes_view_t& content,
    const std::string_view content_type) {
  auto path = resolve(key);
  auto error = std::error_code{};
  std::filesystem::create_directories(path.parent_path(), error);
  if (error) {
    throw std::runtime_error{fmt::format("cannot create {}: {}",
                                         path.parent_path().string(),
                                         error.message())};
  }

  // Write beside the target and rename so readers never see a torn object.
  auto staging = path;
  staging += ".partial";
  {
    auto out = std::ofstream{staging, std::ios::binary | std::ios::trunc};
    out.write(reinterpret_cast<const char*>(content.data()),
              static_cast<std::streamsize>(content.size()));
    if (!out) {
      throw std::runtime_error{
          fmt::format("failed writing object {}", path.string())};
    }
  }
  std::filesystem::rename(staging, path, error);
  if (error) {
    throw std::runtime_error{fmt::format("failed publishing object {}: {}",
                                         path.string(), error.message())};
  }
  spdlog::debug("Stored object {} ({} bytes)", key, content.size());
  return make_object_ref(key, content, content_type);
}

std::optional<chronicle::schema::bytes_t> filesystem_object_store::get(
    const std::string_view key) const {
  auto path = resolve(key);
  auto in = std::ifstream{path, std::ios::binary};
  if (!in) {
    return std::nullopt;
  }
  return chronicle::schema::bytes_t{std::istreambuf_iterator<char>{in},
                                    std::istreambuf_iterator<char>{}};
}

bool filesystem_object_store::remove(const std::string_view key) {
  auto error = std::error_code{};
  auto removed = std::filesystem::remove(resolve(key), error);
  if (error) {
    throw std::runtime_error{fmt::format("failed removing object {}: {}", key,
                                         error.message())};
  }
  return removed;
}

}  // namespace chronicle::workers
