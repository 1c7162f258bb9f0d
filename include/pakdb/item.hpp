#pragma once
#include <pakdb/pointer.hpp>
#include <pakdb/value.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace pakdb {

// One (key, value) pair a searchable record exposes to the indices.
struct IndexField {
  std::string key;
  Value value;
};

// Serialization capability. A record type T is storable once it provides
//
//   template <> struct pakdb::codec<T> {
//     static constexpr const char* type_name = "...";   // stable across builds
//     static std::string encode(const T&);              // throws on failure
//     static T decode(std::string_view bytes);          // throws on failure
//   };
//
// ByteWriter / ByteReader from wire.hpp are the intended building blocks.
template <typename T>
struct codec;

// Optional search capability:
//
//   template <> struct pakdb::searchable<T> {
//     static constexpr bool enabled = true;
//     static std::vector<IndexField> extract(const T&);
//   };
template <typename T>
struct searchable {
  static constexpr bool enabled = false;
};

template <typename T>
uint64_t type_tag() {
  static const uint64_t tag = type_tag_for(codec<T>::type_name);
  return tag;
}

template <>
struct codec<std::string> {
  static constexpr const char* type_name = "std::string";
  static std::string encode(const std::string& s) { return s; }
  static std::string decode(std::string_view bytes) { return std::string(bytes); }
};

} // namespace pakdb
