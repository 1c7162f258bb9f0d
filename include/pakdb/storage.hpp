#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace pakdb {

// Immutable backing bytes of an opened artifact.
class Storage {
public:
  virtual ~Storage() = default;
  virtual std::string_view bytes() const = 0;
  virtual std::string describe() const = 0;
};

class MemoryStorage : public Storage {
public:
  explicit MemoryStorage(std::string data) : data_(std::move(data)) {}

  std::string_view bytes() const override { return data_; }
  std::string describe() const override { return "<memory>"; }

private:
  std::string data_;
};

// Whole file mapped read-only. Throws FormatError if the file cannot be
// opened or mapped (an empty file counts as truncated).
class MappedFile : public Storage {
public:
  explicit MappedFile(const std::string& path);
  ~MappedFile() override;

  MappedFile(const MappedFile&) = delete;
  MappedFile& operator=(const MappedFile&) = delete;

  std::string_view bytes() const override {
    return {static_cast<const char*>(map_base_), map_len_};
  }
  std::string describe() const override { return path_; }

private:
  void close();

  std::string path_;
  void*  map_base_ = nullptr;
  size_t map_len_  = 0;
};

} // namespace pakdb
