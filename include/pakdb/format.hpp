// include/pakdb/format.hpp
#pragma once
#include <pakdb/error.hpp>
#include <pakdb/index.hpp>
#include <pakdb/wire.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace pakdb {

// ---- On-disk layout (little-endian) ----
// [Header 16B]    magic[8] "PAKDBIX", format_version u32, reserved u32
// [Data]          records back to back, insertion order
// [Indices]       per key: (value_len u32, value, offset u64, length u64, tag u64)*
// [Directory]     key_count u32, (key_len u32, key, offset u64, length u64, entries u64)*
// [Metadata]      name, version, description, author (len u32 + bytes each)
// [Footer 72B]    see PakFooter; ends with the magic again

inline constexpr char     kPakMagic[8]      = {'P', 'A', 'K', 'D', 'B', 'I', 'X', '\0'};
inline constexpr uint32_t kFormatVersion    = 1;
inline constexpr uint64_t kHeaderSize       = 16;
inline constexpr uint64_t kFooterSize       = 72;

struct PakFooter {
  uint64_t data_offset      = kHeaderSize;
  uint64_t data_length      = 0;
  uint64_t index_offset     = 0;  // start of the index segment
  uint64_t directory_offset = 0;
  uint64_t meta_offset      = 0;
  uint64_t record_count     = 0;
  uint64_t checksum         = 0;  // XXH64 of every byte before the footer
  uint32_t version          = kFormatVersion;
  uint32_t key_count        = 0;
};

struct IndexLocation {
  uint64_t offset      = 0;  // absolute
  uint64_t length      = 0;
  uint64_t entry_count = 0;
};

struct DirectoryEntry {
  std::string key;
  IndexLocation location;
};

struct Metadata {
  std::string name;
  std::string version = "1.0";
  std::string description;
  std::string author;
};

// Logs at error level and returns the exception for the caller to throw.
FormatError format_error(std::string_view what);

uint64_t artifact_checksum(std::string_view bytes);

void write_header(ByteWriter& w);
void write_index_entry(ByteWriter& w, const IndexEntry& e);
void write_directory(ByteWriter& w, const std::vector<DirectoryEntry>& dir);
void write_metadata(ByteWriter& w, const Metadata& meta);
void write_footer(ByteWriter& w, const PakFooter& f);

// Readers validate their own structure and throw FormatError.
uint32_t read_header(std::string_view file);
PakFooter read_footer(std::string_view file);
std::vector<DirectoryEntry> read_directory(std::string_view bytes, uint32_t expected_keys);
Metadata read_metadata(std::string_view bytes);
std::vector<IndexEntry> read_index_entries(std::string_view bytes, uint64_t expected_count,
                                           uint64_t data_length);

} // namespace pakdb
