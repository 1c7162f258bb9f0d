// include/pakdb/builder.hpp
#pragma once
#include <pakdb/error.hpp>
#include <pakdb/format.hpp>
#include <pakdb/index.hpp>
#include <pakdb/item.hpp>
#include <pakdb/pak.hpp>

#include <cstdint>
#include <exception>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace pakdb {

struct BuildOptions {
  std::string name;
  std::string version = "1.0";
  std::string description;
  std::string author;

  // fsync the artifact and its directory when publishing a file
  bool sync = true;
};

// Accumulates records and index entries for one artifact. Single owner,
// single use: every finalize_* call consumes the builder.
//
//   Builder b({.name = "people"});
//   auto p = b.pak(person);
//   Pak pak = std::move(b).finalize_to_memory();
class Builder {
public:
  explicit Builder(BuildOptions opts = {});

  Builder(Builder&&) = default;
  Builder& operator=(Builder&&) = default;
  Builder(const Builder&) = delete;
  Builder& operator=(const Builder&) = delete;

  // Store item and index it if searchable<T> is enabled. On failure the
  // builder is left as it was.
  template <typename T>
  Pointer pak(const T& item);

  // Store item without index entries.
  template <typename T>
  Pointer pak_no_search(const T& item);

  uint64_t size() const { return data_.size(); }
  size_t len() const { return static_cast<size_t>(records_); }
  size_t index_count() const { return indices_.size(); }

  void set_name(std::string v) { meta_.name = std::move(v); }
  void set_version(std::string v) { meta_.version = std::move(v); }
  void set_description(std::string v) { meta_.description = std::move(v); }
  void set_author(std::string v) { meta_.author = std::move(v); }
  const Metadata& metadata() const { return meta_; }

  // Raw artifact bytes. Identical input sequences give identical bytes.
  std::string finalize_to_bytes() &&;
  Pak finalize_to_memory() &&;
  // Stage to <path>.tmp, then rename over path.
  Pak finalize_to_file(const std::string& path) &&;

private:
  template <typename T>
  static std::string encode_item(const T& item);

  void ensure_open() const;
  Pointer append(uint64_t tag, std::string bytes, const std::vector<IndexField>& fields);

  std::string data_;
  uint64_t records_ = 0;
  std::map<std::string, std::vector<IndexEntry>> indices_;
  Metadata meta_;
  bool sync_ = true;
  bool finalized_ = false;
};

template <typename T>
std::string Builder::encode_item(const T& item) {
  try {
    return codec<T>::encode(item);
  } catch (const EncodeError&) {
    throw;
  } catch (const std::exception& e) {
    throw EncodeError(std::string("cannot encode ") + codec<T>::type_name + ": " + e.what());
  }
}

template <typename T>
Pointer Builder::pak(const T& item) {
  ensure_open();
  std::vector<IndexField> fields;
  if constexpr (searchable<T>::enabled) {
    try {
      fields = searchable<T>::extract(item);
    } catch (const IndexExtractionError&) {
      throw;
    } catch (const std::exception& e) {
      throw IndexExtractionError(std::string("cannot extract indices from ") + codec<T>::type_name +
                                 ": " + e.what());
    }
  }
  return append(type_tag<T>(), encode_item(item), fields);
}

template <typename T>
Pointer Builder::pak_no_search(const T& item) {
  ensure_open();
  return append(type_tag<T>(), encode_item(item), {});
}

} // namespace pakdb
