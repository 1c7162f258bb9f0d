#include <pakdb/wire.hpp>
#include <pakdb/error.hpp>

#include <fmt/format.h>

#include <cstring>
#include <limits>

namespace pakdb {

void ByteWriter::put_u32(uint32_t v) {
  char b[4];
  for (int i = 0; i < 4; ++i) b[i] = static_cast<char>((v >> (8 * i)) & 0xFF);
  buf_.append(b, sizeof(b));
}

void ByteWriter::put_u64(uint64_t v) {
  char b[8];
  for (int i = 0; i < 8; ++i) b[i] = static_cast<char>((v >> (8 * i)) & 0xFF);
  buf_.append(b, sizeof(b));
}

void ByteWriter::put_f64(double v) {
  uint64_t bits = 0;
  std::memcpy(&bits, &v, sizeof(bits));
  put_u64(bits);
}

void ByteWriter::put_bytes(std::string_view v) {
  if (v.size() > std::numeric_limits<uint32_t>::max())
    throw EncodeError(fmt::format("byte string too long: {} bytes", v.size()));
  put_u32(static_cast<uint32_t>(v.size()));
  put_raw(v);
}

void ByteReader::need(size_t n) const {
  if (n > remaining())
    throw DecodeError(fmt::format("truncated input: need {} bytes at offset {}, have {}",
                                  n, pos_, remaining()));
}

uint8_t ByteReader::get_u8() {
  need(1);
  return static_cast<uint8_t>(in_[pos_++]);
}

uint32_t ByteReader::get_u32() {
  need(4);
  uint32_t v = 0;
  for (int i = 0; i < 4; ++i)
    v |= static_cast<uint32_t>(static_cast<uint8_t>(in_[pos_ + i])) << (8 * i);
  pos_ += 4;
  return v;
}

uint64_t ByteReader::get_u64() {
  need(8);
  uint64_t v = 0;
  for (int i = 0; i < 8; ++i)
    v |= static_cast<uint64_t>(static_cast<uint8_t>(in_[pos_ + i])) << (8 * i);
  pos_ += 8;
  return v;
}

double ByteReader::get_f64() {
  const uint64_t bits = get_u64();
  double v = 0;
  std::memcpy(&v, &bits, sizeof(v));
  return v;
}

bool ByteReader::get_bool() {
  const uint8_t b = get_u8();
  if (b > 1) throw DecodeError(fmt::format("invalid bool byte {:#04x}", b));
  return b == 1;
}

std::string_view ByteReader::get_bytes() {
  const uint32_t n = get_u32();
  return get_raw(n);
}

std::string_view ByteReader::get_raw(size_t n) {
  need(n);
  auto out = in_.substr(pos_, n);
  pos_ += n;
  return out;
}

} // namespace pakdb
