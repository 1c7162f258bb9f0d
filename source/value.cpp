#include <pakdb/value.hpp>
#include <pakdb/error.hpp>

#include <fmt/format.h>

#include <cmath>
#include <cstring>
#include <limits>

namespace pakdb {

namespace {

constexpr uint64_t kSignBit = 0x8000000000000000ull;
constexpr uint64_t kCanonicalNaN = 0x7FF8000000000000ull;

constexpr double kTwo63 = 9223372036854775808.0;
constexpr double kTwo64 = 18446744073709551616.0;

// Gap between adjacent doubles below 2^64 is at most 2^11.
constexpr uint64_t kMaxRemainder = 2048;

void put_be64(std::string& out, uint64_t v) {
  for (int i = 7; i >= 0; --i) out.push_back(static_cast<char>((v >> (8 * i)) & 0xFF));
}

uint64_t get_be64(std::string_view in) {
  uint64_t v = 0;
  for (size_t i = 0; i < 8; ++i) v = (v << 8) | static_cast<uint8_t>(in[i]);
  return v;
}

uint64_t float_key(double d) {
  if (std::isnan(d)) return kCanonicalNaN | kSignBit;
  if (d == 0.0) d = 0.0;  // -0.0 == +0.0
  uint64_t bits = 0;
  std::memcpy(&bits, &d, sizeof(bits));
  return (bits & kSignBit) ? ~bits : (bits | kSignBit);
}

double float_from_key(uint64_t key) {
  const uint64_t bits = (key & kSignBit) ? (key & ~kSignBit) : ~key;
  double d = 0;
  std::memcpy(&d, &bits, sizeof(d));
  return d;
}

// A number as (largest double not above it, exact integer distance to it).
struct NumberKey {
  double floor;
  uint64_t remainder;
};

NumberKey split(int64_t v) {
  double d = static_cast<double>(v);
  if (d >= kTwo63) d = std::nextafter(d, 0.0);
  int64_t base = static_cast<int64_t>(d);
  if (base > v) {
    d = std::nextafter(d, -std::numeric_limits<double>::infinity());
    base = static_cast<int64_t>(d);
  }
  return {d, static_cast<uint64_t>(v) - static_cast<uint64_t>(base)};
}

NumberKey split(uint64_t v) {
  double d = static_cast<double>(v);
  if (d >= kTwo64) d = std::nextafter(d, 0.0);
  uint64_t base = static_cast<uint64_t>(d);
  if (base > v) {
    d = std::nextafter(d, 0.0);
    base = static_cast<uint64_t>(d);
  }
  return {d, v - base};
}

bool is_integral(double d) { return std::isfinite(d) && std::trunc(d) == d; }

Value number_from_key(double d, uint64_t rem) {
  if (rem == 0 && !(is_integral(d) && d >= -kTwo63 && d < kTwo64)) return Value(d);
  if (rem >= kMaxRemainder || !is_integral(d) || d < -kTwo63 || d >= kTwo64)
    throw DecodeError("malformed number encoding");

  if (d >= kTwo63) return Value(static_cast<uint64_t>(d) + rem);
  const int64_t base = static_cast<int64_t>(d);
  if (base < 0) return Value(base + static_cast<int64_t>(rem));
  const uint64_t u = static_cast<uint64_t>(base) + rem;
  if (u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
    return Value(static_cast<int64_t>(u));
  return Value(u);
}

} // namespace

const char* kind_name(ValueKind k) {
  switch (k) {
  case ValueKind::Boolean: return "bool";
  case ValueKind::Number:  return "number";
  case ValueKind::String:  return "string";
  }
  return "unknown";
}

ValueKind Value::kind() const {
  switch (data_.index()) {
  case 0: return ValueKind::Boolean;
  case 1:
  case 2:
  case 3: return ValueKind::Number;
  default: return ValueKind::String;
  }
}

std::optional<bool> Value::as_bool() const {
  if (auto* b = std::get_if<bool>(&data_)) return *b;
  return std::nullopt;
}

std::optional<int64_t> Value::as_i64() const {
  if (auto* i = std::get_if<int64_t>(&data_)) return *i;
  if (auto* u = std::get_if<uint64_t>(&data_)) {
    if (*u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
      return static_cast<int64_t>(*u);
  }
  return std::nullopt;
}

std::optional<uint64_t> Value::as_u64() const {
  if (auto* u = std::get_if<uint64_t>(&data_)) return *u;
  if (auto* i = std::get_if<int64_t>(&data_)) {
    if (*i >= 0) return static_cast<uint64_t>(*i);
  }
  return std::nullopt;
}

std::optional<double> Value::as_f64() const {
  if (auto* d = std::get_if<double>(&data_)) return *d;
  if (auto* i = std::get_if<int64_t>(&data_)) return static_cast<double>(*i);
  if (auto* u = std::get_if<uint64_t>(&data_)) return static_cast<double>(*u);
  return std::nullopt;
}

std::optional<std::string> Value::as_string() const {
  if (auto* s = std::get_if<std::string>(&data_)) return *s;
  return std::nullopt;
}

std::string Value::encode() const {
  std::string out;
  out.push_back(static_cast<char>(kind()));
  NumberKey n{};
  switch (data_.index()) {
  case 0:
    out.push_back(std::get<bool>(data_) ? 1 : 0);
    return out;
  case 1:
    n = split(std::get<int64_t>(data_));
    break;
  case 2:
    n = split(std::get<uint64_t>(data_));
    break;
  case 3:
    n = NumberKey{std::get<double>(data_), 0};
    break;
  default:
    out += std::get<std::string>(data_);
    return out;
  }
  put_be64(out, float_key(n.floor));
  put_be64(out, n.remainder);
  return out;
}

Value Value::decode(std::string_view encoded) {
  const ValueKind k = encoded_kind(encoded);
  const std::string_view payload = encoded.substr(1);
  switch (k) {
  case ValueKind::Boolean:
    if (payload.size() != 1 || static_cast<uint8_t>(payload[0]) > 1)
      throw DecodeError("malformed bool encoding");
    return Value(payload[0] == 1);
  case ValueKind::Number:
    if (payload.size() != 16) throw DecodeError("malformed number encoding");
    return number_from_key(float_from_key(get_be64(payload)), get_be64(payload.substr(8)));
  case ValueKind::String:
    return Value(payload);
  }
  throw DecodeError("unknown value kind");
}

std::string Value::to_string() const {
  switch (data_.index()) {
  case 0: return std::get<bool>(data_) ? "true" : "false";
  case 1: return fmt::format("{}", std::get<int64_t>(data_));
  case 2: return fmt::format("{}", std::get<uint64_t>(data_));
  case 3: return fmt::format("{}", std::get<double>(data_));
  default: return fmt::format("\"{}\"", std::get<std::string>(data_));
  }
}

ValueKind encoded_kind(std::string_view encoded) {
  if (encoded.empty()) throw DecodeError("empty value encoding");
  const uint8_t k = static_cast<uint8_t>(encoded[0]);
  if (k < static_cast<uint8_t>(ValueKind::Boolean) || k > static_cast<uint8_t>(ValueKind::String))
    throw DecodeError(fmt::format("unknown value kind byte {:#04x}", k));
  return static_cast<ValueKind>(k);
}

} // namespace pakdb
