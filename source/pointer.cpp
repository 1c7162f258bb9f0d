#include <pakdb/pointer.hpp>

#include <fmt/format.h>
#include <xxhash.h>

namespace pakdb {

std::string Pointer::to_string() const {
  return fmt::format("{{offset={}, length={}, type={:016x}}}", offset, length, type_tag);
}

uint64_t type_tag_for(std::string_view type_name) {
  return static_cast<uint64_t>(XXH64(type_name.data(), type_name.size(), 0));
}

} // namespace pakdb
