#include <pakdb/index.hpp>
#include <pakdb/error.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace pakdb {

namespace {

struct ValueLess {
  bool operator()(const IndexEntry& e, const std::string& v) const { return e.encoded_value < v; }
  bool operator()(const std::string& v, const IndexEntry& e) const { return v < e.encoded_value; }
};

using Iter = std::vector<IndexEntry>::const_iterator;

PointerSet collect_sorted(Iter first, Iter last) {
  PointerSet out;
  out.reserve(static_cast<size_t>(std::distance(first, last)));
  for (auto it = first; it != last; ++it) out.push_back(it->pointer);
  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

} // namespace

const char* op_symbol(Op op) {
  switch (op) {
  case Op::Equal:          return "==";
  case Op::LessThan:       return "<";
  case Op::LessOrEqual:    return "<=";
  case Op::GreaterThan:    return ">";
  case Op::GreaterOrEqual: return ">=";
  }
  return "?";
}

bool entry_less(const IndexEntry& a, const IndexEntry& b) {
  if (a.encoded_value != b.encoded_value) return a.encoded_value < b.encoded_value;
  return a.pointer < b.pointer;
}

Index::Index(std::string key, std::vector<IndexEntry> entries)
    : key_(std::move(key)), entries_(std::move(entries)) {
  if (!entries_.empty()) kind_ = encoded_kind(entries_.front().encoded_value);
}

void Index::normalize(std::vector<IndexEntry>& entries) {
  std::sort(entries.begin(), entries.end(), entry_less);
  auto same = [](const IndexEntry& a, const IndexEntry& b) {
    return a.encoded_value == b.encoded_value && a.pointer == b.pointer;
  };
  entries.erase(std::unique(entries.begin(), entries.end(), same), entries.end());
}

std::string Index::encode_checked(const Value& value) const {
  if (kind_ && *kind_ != value.kind()) {
    throw TypeMismatchError(fmt::format("index '{}' holds {} values, got {} value {}", key_,
                                        kind_name(*kind_), kind_name(value.kind()),
                                        value.to_string()));
  }
  return value.encode();
}

PointerSet Index::lookup_eq(const Value& value) const {
  const std::string v = encode_checked(value);
  auto [lo, hi] = std::equal_range(entries_.cbegin(), entries_.cend(), v, ValueLess{});
  return collect_sorted(lo, hi);
}

PointerSet Index::lookup_range(Op op, const Value& value) const {
  const std::string v = encode_checked(value);
  const auto first = entries_.cbegin();
  const auto last = entries_.cend();
  switch (op) {
  case Op::Equal:
    return lookup_eq(value);
  case Op::LessThan:
    return collect_sorted(first, std::lower_bound(first, last, v, ValueLess{}));
  case Op::LessOrEqual:
    return collect_sorted(first, std::upper_bound(first, last, v, ValueLess{}));
  case Op::GreaterThan:
    return collect_sorted(std::upper_bound(first, last, v, ValueLess{}), last);
  case Op::GreaterOrEqual:
    return collect_sorted(std::lower_bound(first, last, v, ValueLess{}), last);
  }
  return {};
}

PointerSet Index::lookup(Op op, const Value& value) const {
  return op == Op::Equal ? lookup_eq(value) : lookup_range(op, value);
}

} // namespace pakdb
