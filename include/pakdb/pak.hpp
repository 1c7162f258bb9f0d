// include/pakdb/pak.hpp
#pragma once
#include <pakdb/error.hpp>
#include <pakdb/evaluator.hpp>
#include <pakdb/format.hpp>
#include <pakdb/item.hpp>
#include <pakdb/query.hpp>
#include <pakdb/storage.hpp>

#include <cstdint>
#include <exception>
#include <memory>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace pakdb {

struct OpenOptions {
  // hash the whole artifact on open (reads every page of a mapped file)
  bool verify_checksum = false;
};

// A finalized, read-only artifact. The directory and metadata are loaded on
// open; index entry lists on the first lookup of their key. Safe to share
// between threads.
class Pak : public IndexSource {
public:
  static Pak open(const std::string& path, const OpenOptions& opts = {});
  static Pak from_bytes(std::string bytes, const OpenOptions& opts = {});

  Pak(Pak&&) noexcept;
  Pak& operator=(Pak&&) noexcept;
  ~Pak() override;

  Pak(const Pak&) = delete;
  Pak& operator=(const Pak&) = delete;

  // Decode the record p points to. FormatError if p is out of range,
  // TypeMismatchError if p does not hold a T, DecodeError if the bytes are bad.
  template <typename T>
  T get(const Pointer& p) const;

  // All records matching q, in pointer order. Every match must be a T.
  template <typename T>
  std::vector<T> query(const Query& q) const;

  // Matches split by record type; matches of other types are skipped.
  template <typename... Ts>
  std::tuple<std::vector<Ts>...> query_group(const Query& q) const;

  PointerSet query_pointers(const Query& q) const;

  // Owned copy of the raw record bytes.
  std::string read_bytes(const Pointer& p) const;

  std::vector<DirectoryEntry> keys() const;
  bool has_key(std::string_view key) const;
  std::shared_ptr<const Index> index(std::string_view key) const;
  std::shared_ptr<const Index> find_index(std::string_view key) const override { return index(key); }

  uint64_t record_count() const;
  uint64_t size() const;
  uint64_t data_size() const;
  const Metadata& metadata() const;
  std::string source() const;

  // Recompute the artifact checksum; FormatError on mismatch.
  void verify() const;

private:
  struct Impl;
  explicit Pak(std::unique_ptr<Impl> impl);
  static Pak load(std::unique_ptr<Storage> storage, const OpenOptions& opts);

  std::string_view checked_bytes(const Pointer& p) const;
  void check_tag(const Pointer& p, uint64_t expected, const char* type_name) const;
  static DecodeError decode_failure(const char* type_name, const Pointer& p, const char* what);

  template <typename T>
  void append_if_tagged(const Pointer& p, std::vector<T>& out) const {
    if (p.type_tag == type_tag<T>()) out.push_back(get<T>(p));
  }

  std::unique_ptr<Impl> p_;
};

template <typename T>
T Pak::get(const Pointer& p) const {
  const std::string_view bytes = checked_bytes(p);
  check_tag(p, type_tag<T>(), codec<T>::type_name);
  try {
    return codec<T>::decode(bytes);
  } catch (const DecodeError&) {
    throw;
  } catch (const std::exception& e) {
    throw decode_failure(codec<T>::type_name, p, e.what());
  }
}

template <typename T>
std::vector<T> Pak::query(const Query& q) const {
  const PointerSet ptrs = query_pointers(q);
  std::vector<T> out;
  out.reserve(ptrs.size());
  for (const auto& p : ptrs) out.push_back(get<T>(p));
  return out;
}

template <typename... Ts>
std::tuple<std::vector<Ts>...> Pak::query_group(const Query& q) const {
  std::tuple<std::vector<Ts>...> out;
  for (const auto& p : query_pointers(q)) {
    (append_if_tagged<Ts>(p, std::get<std::vector<Ts>>(out)), ...);
  }
  return out;
}

} // namespace pakdb
