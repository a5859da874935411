#pragma once

#include <chronicle/schema/object_ref.hpp>
#include <chronicle/schema/primitives.hpp>

#include <filesystem>
#include <optional>
#include <string_view>

namespace chronicle::workers {

/// Blob storage for command content. Writes are keyed by the caller so a
/// retried step overwrites the same object instead of leaving a second one.
class object_store {
 public:
  virtual ~object_store() = default;

  /// Store bytes under key and return where they went, with a BLAKE3
  /// checksum of the content.
  virtual chronicle::schema::object_ref_t put(
      const std::string_view key,
      const chronicle::schema::bytes_view_t& content,
      const std::string_view content_type) = 0;

  virtual std::optional<chronicle::schema::bytes_t> get(
      const std::string_view key) const = 0;

  /// Returns false when nothing was stored under key.
  virtual bool remove(const std::string_view key) = 0;
};

class filesystem_object_store final : public object_store {
 public:
  explicit filesystem_object_store(std::filesystem::path root);

  chronicle::schema::object_ref_t put(
      const std::string_view key,
      const chronicle::schema::bytes_view_t& content,
      const std::string_view content_type) override;

  std::optional<chronicle::schema::bytes_t> get(
      const std::string_view key) const override;

  bool remove(const std::string_view key) override;

  const std::filesystem::path& root() const { return root_; }

 private:
  std::filesystem::path resolve(const std::string_view key) const;

  std::filesystem::path root_;
};

chronicle::schema::object_ref_t make_object_ref(
    const std::string_view key,
    const chronicle::schema::bytes_view_t& content,
    const std::string_view content_type);

}  // namespace chronicle::workers
