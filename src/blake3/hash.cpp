#include <blake3.h>
#include <chronicle/blake3/hash.hpp>

namespace chronicle::blake3 {

namespace {

chronicle::schema::hash32_t digest(const void* data, const size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  auto output = chronicle::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

chronicle::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

chronicle::schema::hash32_t hash(
    const chronicle::schema::bytes_view_t& bytes) {
  return digest(bytes.data(), bytes.size());
}

std::string hex_digest(const chronicle::schema::bytes_view_t& bytes) {
  auto out = hash(bytes);
  return chronicle::schema::to_hex(
      chronicle::schema::bytes_view_t{out.data(), out.size()});
}

}  // namespace chronicle::blake3
