// source/builder.cpp
#include <pakdb/builder.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <limits>
#include <unistd.h>

namespace pakdb {

namespace {

void fsync_dir_path(const std::string& dir) {
  int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (dfd >= 0) {
    (void)::fsync(dfd);
    ::close(dfd);
  }
}

// write to <path>.tmp, fsync, rename over path
void publish_atomic(const std::string& path, std::string_view bytes, bool sync) {
  const std::string tmp = path + ".tmp";

  int fd = ::open(tmp.c_str(), O_CREAT | O_TRUNC | O_WRONLY, 0644);
  if (fd < 0)
    throw BuildError(fmt::format("cannot create {}: {}", tmp, std::strerror(errno)));

  const char* ptr = bytes.data();
  size_t left = bytes.size();
  while (left > 0) {
    ssize_t w = ::write(fd, ptr, left);
    if (w < 0) {
      if (errno == EINTR) continue;
      const int err = errno;
      ::close(fd);
      ::unlink(tmp.c_str());
      throw BuildError(fmt::format("write {} failed: {}", tmp, std::strerror(err)));
    }
    ptr  += w;
    left -= static_cast<size_t>(w);
  }

  if (sync && ::fsync(fd) != 0) {
    const int err = errno;
    ::close(fd);
    ::unlink(tmp.c_str());
    throw BuildError(fmt::format("fsync {} failed: {}", tmp, std::strerror(err)));
  }
  if (::close(fd) != 0) {
    const int err = errno;
    ::unlink(tmp.c_str());
    throw BuildError(fmt::format("close {} failed: {}", tmp, std::strerror(err)));
  }

  if (::rename(tmp.c_str(), path.c_str()) != 0) {
    const int err = errno;
    ::unlink(tmp.c_str());
    throw BuildError(fmt::format("rename {} -> {} failed: {}", tmp, path, std::strerror(err)));
  }

  if (sync) {
    auto parent = std::filesystem::path(path).parent_path();
    fsync_dir_path(parent.empty() ? std::string(".") : parent.string());
  }
}

} // namespace

Builder::Builder(BuildOptions opts) : sync_(opts.sync) {
  meta_.name = std::move(opts.name);
  meta_.version = std::move(opts.version);
  meta_.description = std::move(opts.description);
  meta_.author = std::move(opts.author);
}

void Builder::ensure_open() const {
  if (finalized_) throw BuildError("builder already finalized");
}

Pointer Builder::append(uint64_t tag, std::string bytes, const std::vector<IndexField>& fields) {
  // encode every index value first so a bad field leaves the builder untouched
  std::vector<std::string> encoded;
  encoded.reserve(fields.size());
  for (const auto& f : fields) {
    if (f.key.empty()) throw IndexExtractionError("empty index key name");
    if (f.key.size() > std::numeric_limits<uint32_t>::max())
      throw IndexExtractionError("index key name too long");
    encoded.push_back(f.value.encode());
    if (encoded.back().size() > std::numeric_limits<uint32_t>::max())
      throw IndexExtractionError(fmt::format("value for key '{}' too long", f.key));
  }

  Pointer p{static_cast<uint64_t>(data_.size()), static_cast<uint64_t>(bytes.size()), tag};
  data_ += bytes;
  ++records_;

  for (size_t i = 0; i < fields.size(); ++i) {
    indices_[fields[i].key].push_back(IndexEntry{std::move(encoded[i]), p});
  }
  return p;
}

std::string Builder::finalize_to_bytes() && {
  ensure_open();
  finalized_ = true;

  if (indices_.size() > std::numeric_limits<uint32_t>::max())
    throw BuildError("too many index keys");

  for (auto& [key, entries] : indices_) {
    Index::normalize(entries);
    const ValueKind k = encoded_kind(entries.front().encoded_value);
    for (const auto& e : entries) {
      const ValueKind other = encoded_kind(e.encoded_value);
      if (other != k)
        throw TypeMismatchError(fmt::format("key '{}' mixes {} and {} values", key, kind_name(k),
                                            kind_name(other)));
    }
  }

  ByteWriter w;
  PakFooter f;

  write_header(w);
  f.data_offset = w.size();
  w.put_raw(data_);
  f.data_length = data_.size();
  std::string().swap(data_);

  f.index_offset = w.size();
  std::vector<DirectoryEntry> dir;
  dir.reserve(indices_.size());
  for (const auto& [key, entries] : indices_) {
    DirectoryEntry d;
    d.key = key;
    d.location.offset = w.size();
    for (const auto& e : entries) write_index_entry(w, e);
    d.location.length = w.size() - d.location.offset;
    d.location.entry_count = entries.size();
    dir.push_back(std::move(d));
  }

  f.directory_offset = w.size();
  write_directory(w, dir);

  f.meta_offset = w.size();
  write_metadata(w, meta_);

  f.record_count = records_;
  f.key_count = static_cast<uint32_t>(dir.size());
  f.checksum = artifact_checksum(w.buffer());
  write_footer(w, f);

  spdlog::debug("pak finalized: {} records, {} data bytes, {} keys, {} bytes total",
                f.record_count, f.data_length, f.key_count, w.size());
  return w.take();
}

Pak Builder::finalize_to_memory() && {
  return Pak::from_bytes(std::move(*this).finalize_to_bytes());
}

Pak Builder::finalize_to_file(const std::string& path) && {
  const bool sync = sync_;
  const std::string bytes = std::move(*this).finalize_to_bytes();
  publish_atomic(path, bytes, sync);
  spdlog::info("pak written: {} ({} bytes)", path, bytes.size());
  return Pak::open(path);
}

} // namespace pakdb
