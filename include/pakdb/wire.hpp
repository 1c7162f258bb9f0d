#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace pakdb {

// Little-endian append-only encoder. Used for the artifact layout and
// available to record codecs.
class ByteWriter {
public:
  ByteWriter() = default;

  void put_u8(uint8_t v) { buf_.push_back(static_cast<char>(v)); }
  void put_u32(uint32_t v);
  void put_u64(uint64_t v);
  void put_i64(int64_t v) { put_u64(static_cast<uint64_t>(v)); }
  void put_f64(double v);
  void put_bool(bool v) { put_u8(v ? 1 : 0); }

  // u32 length prefix followed by the bytes
  void put_bytes(std::string_view v);
  void put_string(std::string_view v) { put_bytes(v); }

  void put_raw(std::string_view v) { buf_.append(v.data(), v.size()); }

  size_t size() const { return buf_.size(); }
  const std::string& buffer() const { return buf_; }
  std::string take() { return std::move(buf_); }

private:
  std::string buf_;
};

// Bounds-checked little-endian decoder over a borrowed buffer.
// Throws DecodeError when the input runs out.
class ByteReader {
public:
  explicit ByteReader(std::string_view in) : in_(in) {}

  uint8_t  get_u8();
  uint32_t get_u32();
  uint64_t get_u64();
  int64_t  get_i64() { return static_cast<int64_t>(get_u64()); }
  double   get_f64();
  bool     get_bool();

  std::string_view get_bytes();
  std::string get_string() { return std::string(get_bytes()); }
  std::string_view get_raw(size_t n);

  void skip(size_t n) { (void)get_raw(n); }

  size_t position() const { return pos_; }
  size_t remaining() const { return in_.size() - pos_; }
  bool empty() const { return pos_ == in_.size(); }

private:
  void need(size_t n) const;

  std::string_view in_;
  size_t pos_ = 0;
};

} // namespace pakdb
