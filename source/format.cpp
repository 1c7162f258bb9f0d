// source/format.cpp
#include <pakdb/format.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <xxhash.h>

#include <cstring>
#include <limits>

namespace pakdb {

FormatError format_error(std::string_view what) {
  spdlog::error("pak format: {}", what);
  return FormatError(std::string(what));
}

uint64_t artifact_checksum(std::string_view bytes) {
  return static_cast<uint64_t>(XXH64(bytes.data(), bytes.size(), 0));
}

void write_header(ByteWriter& w) {
  w.put_raw(std::string_view(kPakMagic, sizeof(kPakMagic)));
  w.put_u32(kFormatVersion);
  w.put_u32(0);
}

void write_index_entry(ByteWriter& w, const IndexEntry& e) {
  w.put_bytes(e.encoded_value);
  w.put_u64(e.pointer.offset);
  w.put_u64(e.pointer.length);
  w.put_u64(e.pointer.type_tag);
}

void write_directory(ByteWriter& w, const std::vector<DirectoryEntry>& dir) {
  w.put_u32(static_cast<uint32_t>(dir.size()));
  for (const auto& d : dir) {
    w.put_string(d.key);
    w.put_u64(d.location.offset);
    w.put_u64(d.location.length);
    w.put_u64(d.location.entry_count);
  }
}

void write_metadata(ByteWriter& w, const Metadata& meta) {
  w.put_string(meta.name);
  w.put_string(meta.version);
  w.put_string(meta.description);
  w.put_string(meta.author);
}

void write_footer(ByteWriter& w, const PakFooter& f) {
  w.put_u64(f.data_offset);
  w.put_u64(f.data_length);
  w.put_u64(f.index_offset);
  w.put_u64(f.directory_offset);
  w.put_u64(f.meta_offset);
  w.put_u64(f.record_count);
  w.put_u64(f.checksum);
  w.put_u32(f.version);
  w.put_u32(f.key_count);
  w.put_raw(std::string_view(kPakMagic, sizeof(kPakMagic)));
}

uint32_t read_header(std::string_view file) {
  if (file.size() < kHeaderSize)
    throw format_error(fmt::format("truncated artifact: {} bytes, header needs {}", file.size(),
                                   kHeaderSize));
  if (std::memcmp(file.data(), kPakMagic, sizeof(kPakMagic)) != 0)
    throw format_error("bad header magic");

  ByteReader r(file.substr(sizeof(kPakMagic), kHeaderSize - sizeof(kPakMagic)));
  const uint32_t version = r.get_u32();
  if (version != kFormatVersion)
    throw format_error(fmt::format("unsupported format version {} (expected {})", version,
                                   kFormatVersion));
  return version;
}

PakFooter read_footer(std::string_view file) {
  if (file.size() < kHeaderSize + kFooterSize)
    throw format_error(fmt::format("truncated artifact: {} bytes, minimum is {}", file.size(),
                                   kHeaderSize + kFooterSize));
  const std::string_view raw = file.substr(file.size() - kFooterSize);

  ByteReader r(raw);
  PakFooter f;
  f.data_offset      = r.get_u64();
  f.data_length      = r.get_u64();
  f.index_offset     = r.get_u64();
  f.directory_offset = r.get_u64();
  f.meta_offset      = r.get_u64();
  f.record_count     = r.get_u64();
  f.checksum         = r.get_u64();
  f.version          = r.get_u32();
  f.key_count        = r.get_u32();
  const std::string_view magic = r.get_raw(sizeof(kPakMagic));

  if (std::memcmp(magic.data(), kPakMagic, sizeof(kPakMagic)) != 0)
    throw format_error("bad footer magic (truncated or corrupt artifact)");
  if (f.version != kFormatVersion)
    throw format_error(fmt::format("footer format version {} does not match {}", f.version,
                                   kFormatVersion));
  return f;
}

std::vector<DirectoryEntry> read_directory(std::string_view bytes, uint32_t expected_keys) {
  std::vector<DirectoryEntry> out;
  try {
    ByteReader r(bytes);
    const uint32_t n = r.get_u32();
    if (n != expected_keys)
      throw format_error(fmt::format("directory has {} keys, footer says {}", n, expected_keys));
    out.reserve(n);
    for (uint32_t i = 0; i < n; ++i) {
      DirectoryEntry d;
      d.key = r.get_string();
      d.location.offset = r.get_u64();
      d.location.length = r.get_u64();
      d.location.entry_count = r.get_u64();
      out.push_back(std::move(d));
    }
    if (!r.empty())
      throw format_error(fmt::format("{} trailing bytes after directory", r.remaining()));
  } catch (const DecodeError& e) {
    throw format_error(fmt::format("corrupt directory: {}", e.what()));
  }
  return out;
}

Metadata read_metadata(std::string_view bytes) {
  Metadata m;
  try {
    ByteReader r(bytes);
    m.name = r.get_string();
    m.version = r.get_string();
    m.description = r.get_string();
    m.author = r.get_string();
    if (!r.empty())
      throw format_error(fmt::format("{} trailing bytes after metadata", r.remaining()));
  } catch (const DecodeError& e) {
    throw format_error(fmt::format("corrupt metadata: {}", e.what()));
  }
  return m;
}

std::vector<IndexEntry> read_index_entries(std::string_view bytes, uint64_t expected_count,
                                           uint64_t data_length) {
  // every entry takes at least 4 + 1 + 24 bytes
  if (expected_count > bytes.size() / 29)
    throw format_error(fmt::format("index claims {} entries in {} bytes", expected_count,
                                   bytes.size()));

  std::vector<IndexEntry> out;
  out.reserve(static_cast<size_t>(expected_count));
  try {
    ByteReader r(bytes);
    for (uint64_t i = 0; i < expected_count; ++i) {
      IndexEntry e;
      e.encoded_value = std::string(r.get_bytes());
      e.pointer.offset = r.get_u64();
      e.pointer.length = r.get_u64();
      e.pointer.type_tag = r.get_u64();

      const ValueKind k = encoded_kind(e.encoded_value);
      if (!out.empty() && encoded_kind(out.front().encoded_value) != k)
        throw format_error("index mixes value kinds");
      if (e.pointer.offset > data_length || e.pointer.length > data_length - e.pointer.offset)
        throw format_error(fmt::format("index entry points outside data segment: {}",
                                       e.pointer.to_string()));
      if (!out.empty() && entry_less(e, out.back()))
        throw format_error("index entries out of order");
      out.push_back(std::move(e));
    }
    if (!r.empty())
      throw format_error(fmt::format("{} trailing bytes after index entries", r.remaining()));
  } catch (const DecodeError& e) {
    throw format_error(fmt::format("corrupt index: {}", e.what()));
  }
  return out;
}

} // namespace pakdb
