#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace pakdb {

// Canonical type of an indexed value. The numeric value is also the first
// byte of every canonical encoding.
enum class ValueKind : uint8_t {
  Boolean = 0x01,
  Number  = 0x02,
  String  = 0x03,
};

const char* kind_name(ValueKind k);

// An indexable value. Every C++ integer and floating point type is a Number;
// numbers compare by value, so Value(1) == Value(1.0).
class Value {
public:
  Value(bool v) : data_(v) {}

  template <typename T,
            std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
  Value(T v) {
    if constexpr (std::is_signed_v<T>)
      data_ = static_cast<int64_t>(v);
    else
      data_ = static_cast<uint64_t>(v);
  }

  template <typename T, std::enable_if_t<std::is_floating_point_v<T>, int> = 0>
  Value(T v) : data_(static_cast<double>(v)) {}

  Value(const char* v) : data_(std::string(v)) {}
  Value(std::string v) : data_(std::move(v)) {}
  Value(std::string_view v) : data_(std::string(v)) {}

  ValueKind kind() const;

  std::optional<bool> as_bool() const;
  std::optional<int64_t> as_i64() const;
  std::optional<uint64_t> as_u64() const;
  // Any number, rounded to the nearest double.
  std::optional<double> as_f64() const;
  std::optional<std::string> as_string() const;

  // Order-preserving byte encoding: within one kind, memcmp order of the
  // encodings equals the value order.
  std::string encode() const;

  // Inverse of encode() up to numeric equality: an integral number decodes
  // as an integer. Throws DecodeError on malformed input.
  static Value decode(std::string_view encoded);

  // Human readable form; strings are quoted.
  std::string to_string() const;

  friend bool operator==(const Value& a, const Value& b) { return a.encode() == b.encode(); }
  friend bool operator!=(const Value& a, const Value& b) { return !(a == b); }

private:
  std::variant<bool, int64_t, uint64_t, double, std::string> data_;
};

// Kind of an already encoded value. Throws DecodeError when unknown.
ValueKind encoded_kind(std::string_view encoded);

} // namespace pakdb
