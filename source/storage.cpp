#include <pakdb/storage.hpp>
#include <pakdb/format.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace pakdb {

MappedFile::MappedFile(const std::string& path) : path_(path) {
  int fd = ::open(path_.c_str(), O_RDONLY);
  if (fd < 0)
    throw format_error(fmt::format("cannot open {}: {}", path_, std::strerror(errno)));

  struct stat st {};
  if (::fstat(fd, &st) != 0) {
    const int err = errno;
    ::close(fd);
    throw format_error(fmt::format("cannot stat {}: {}", path_, std::strerror(err)));
  }
  if (st.st_size <= 0) {
    ::close(fd);
    throw format_error(fmt::format("truncated artifact: {} is empty", path_));
  }

  const size_t len = static_cast<size_t>(st.st_size);
  void* p = ::mmap(nullptr, len, PROT_READ, MAP_SHARED, fd, 0);
  const int err = errno;
  // the mapping stays valid after close
  ::close(fd);
  if (p == MAP_FAILED)
    throw format_error(fmt::format("mmap {} failed: {}", path_, std::strerror(err)));

  map_base_ = p;
  map_len_  = len;
  spdlog::debug("mapped {} ({} bytes)", path_, map_len_);
}

MappedFile::~MappedFile() { close(); }

void MappedFile::close() {
  if (map_base_) {
    ::munmap(map_base_, map_len_);
  }
  map_base_ = nullptr;
  map_len_  = 0;
}

} // namespace pakdb
