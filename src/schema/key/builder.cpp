#include <chronicle/schema/key/builder.hpp>

#include <iterator>

namespace chronicle::schema::key {

builder& builder::segment(const std::string_view& part) {
  write(static_cast<uint32_t>(part.size()));
  return write(part);
}

builder& builder::write(const std::string_view& leaf) {
  return write(make_bytes_view(leaf));
}

builder& builder::write(const chronicle::schema::bytes_view_t& leaf) {
  data.insert(std::end(data), leaf.begin(), leaf.end());
  return *this;
}

chronicle::schema::bytes_view_t builder::view() const {
  return make_bytes_view(data);
}

}  // namespace chronicle::schema::key
