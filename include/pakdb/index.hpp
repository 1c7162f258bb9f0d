#pragma once
#include <pakdb/pointer.hpp>
#include <pakdb/value.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pakdb {

enum class Op : uint8_t {
  Equal,
  LessThan,
  LessOrEqual,
  GreaterThan,
  GreaterOrEqual,
};

const char* op_symbol(Op op);

struct IndexEntry {
  std::string encoded_value;
  Pointer pointer;
};

// Canonical index order: encoded value ascending, then pointer.
bool entry_less(const IndexEntry& a, const IndexEntry& b);

// Sorted (value, pointer) list for one key. Immutable once built.
class Index {
public:
  // entries must already be in canonical order and share one value kind;
  // the builder and the reader check that before constructing.
  Index(std::string key, std::vector<IndexEntry> entries);

  const std::string& key() const { return key_; }
  // nullopt only for an index without entries
  std::optional<ValueKind> kind() const { return kind_; }
  size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }
  const std::vector<IndexEntry>& entries() const { return entries_; }

  PointerSet lookup_eq(const Value& value) const;
  PointerSet lookup_range(Op op, const Value& value) const;
  PointerSet lookup(Op op, const Value& value) const;

  // Sort into canonical order and drop exact duplicates.
  static void normalize(std::vector<IndexEntry>& entries);

private:
  std::string encode_checked(const Value& value) const;

  std::string key_;
  std::vector<IndexEntry> entries_;
  std::optional<ValueKind> kind_;
};

} // namespace pakdb
