#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace pakdb {

// Handle to a record: a byte range inside the data segment (offset is
// relative to the segment start) plus the tag of the type stored there.
struct Pointer {
  uint64_t offset   = 0;
  uint64_t length   = 0;
  uint64_t type_tag = 0;

  uint64_t end() const { return offset + length; }

  std::string to_string() const;
};

inline bool operator==(const Pointer& a, const Pointer& b) {
  return a.offset == b.offset && a.length == b.length && a.type_tag == b.type_tag;
}
inline bool operator!=(const Pointer& a, const Pointer& b) { return !(a == b); }

// Offset order; length and tag only break ties between zero-length records.
inline bool operator<(const Pointer& a, const Pointer& b) {
  return std::tie(a.offset, a.length, a.type_tag) < std::tie(b.offset, b.length, b.type_tag);
}

// Query result: ascending by operator<, no duplicates.
using PointerSet = std::vector<Pointer>;

// XXH64 of the type name, seed 0.
uint64_t type_tag_for(std::string_view type_name);

} // namespace pakdb
