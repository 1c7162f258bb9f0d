// source/pak.cpp
#include <pakdb/pak.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <functional>
#include <map>
#include <mutex>
#include <unordered_map>

namespace pakdb {

struct Pak::Impl {
  std::unique_ptr<Storage> storage;
  PakFooter footer;
  Metadata  meta;
  std::map<std::string, IndexLocation, std::less<>> directory;

  // lazily parsed indices; published entries are never modified
  mutable std::mutex mu;
  mutable std::unordered_map<std::string, std::shared_ptr<const Index>> loaded;

  std::string_view file() const { return storage->bytes(); }
  uint64_t footer_start() const { return file().size() - kFooterSize; }
};

Pak::Pak(std::unique_ptr<Impl> impl) : p_(std::move(impl)) {}
Pak::Pak(Pak&&) noexcept = default;
Pak& Pak::operator=(Pak&&) noexcept = default;
Pak::~Pak() = default;

Pak Pak::open(const std::string& path, const OpenOptions& opts) {
  return load(std::make_unique<MappedFile>(path), opts);
}

Pak Pak::from_bytes(std::string bytes, const OpenOptions& opts) {
  return load(std::make_unique<MemoryStorage>(std::move(bytes)), opts);
}

Pak Pak::load(std::unique_ptr<Storage> storage, const OpenOptions& opts) {
  auto impl = std::make_unique<Impl>();
  impl->storage = std::move(storage);
  const std::string_view file = impl->file();

  (void)read_header(file);
  const PakFooter f = read_footer(file);
  const uint64_t footer_start = file.size() - kFooterSize;

  // segments must be contiguous and in layout order
  if (f.data_offset != kHeaderSize)
    throw format_error(fmt::format("data segment starts at {}, expected {}", f.data_offset, kHeaderSize));
  if (f.data_length > footer_start - f.data_offset)
    throw format_error(fmt::format("data segment of {} bytes overruns artifact", f.data_length));
  if (f.index_offset != f.data_offset + f.data_length)
    throw format_error(fmt::format("index segment at {} does not follow data segment", f.index_offset));
  if (f.directory_offset < f.index_offset || f.meta_offset < f.directory_offset ||
      f.meta_offset > footer_start)
    throw format_error("footer offsets out of order");

  auto dir = read_directory(file.substr(f.directory_offset, f.meta_offset - f.directory_offset),
                            f.key_count);
  for (auto& d : dir) {
    const IndexLocation& loc = d.location;
    if (loc.offset < f.index_offset || loc.offset > f.directory_offset ||
        loc.length > f.directory_offset - loc.offset)
      throw format_error(fmt::format("index '{}' lies outside the index segment", d.key));
    if (!impl->directory.emplace(std::move(d.key), loc).second)
      throw format_error("duplicate key in index directory");
  }

  impl->meta = read_metadata(file.substr(f.meta_offset, footer_start - f.meta_offset));
  impl->footer = f;

  Pak pak(std::move(impl));
  if (opts.verify_checksum) pak.verify();

  spdlog::debug("opened pak {}: {} records, {} keys, {} bytes", pak.source(), f.record_count,
                f.key_count, file.size());
  return pak;
}

void Pak::verify() const {
  const uint64_t actual = artifact_checksum(p_->file().substr(0, p_->footer_start()));
  if (actual != p_->footer.checksum)
    throw format_error(fmt::format("checksum mismatch in {}: stored {:016x}, computed {:016x}",
                                   source(), p_->footer.checksum, actual));
}

std::shared_ptr<const Index> Pak::index(std::string_view key) const {
  auto it = p_->directory.find(key);
  if (it == p_->directory.end()) return nullptr;

  {
    std::lock_guard<std::mutex> lk(p_->mu);
    auto hit = p_->loaded.find(it->first);
    if (hit != p_->loaded.end()) return hit->second;
  }

  // parse outside the lock; if two threads race, the first insert wins
  const IndexLocation& loc = it->second;
  auto entries = read_index_entries(p_->file().substr(loc.offset, loc.length), loc.entry_count,
                                    p_->footer.data_length);
  auto idx = std::make_shared<const Index>(it->first, std::move(entries));
  spdlog::debug("loaded index '{}' ({} entries)", it->first, idx->size());

  std::lock_guard<std::mutex> lk(p_->mu);
  return p_->loaded.emplace(it->first, std::move(idx)).first->second;
}

PointerSet Pak::query_pointers(const Query& q) const {
  return evaluate(q, *this);
}

std::string_view Pak::checked_bytes(const Pointer& p) const {
  const uint64_t data_len = p_->footer.data_length;
  if (p.offset > data_len || p.length > data_len - p.offset)
    throw format_error(fmt::format("pointer {} outside data segment of {} bytes", p.to_string(),
                                   data_len));
  return p_->file().substr(p_->footer.data_offset + p.offset, p.length);
}

void Pak::check_tag(const Pointer& p, uint64_t expected, const char* type_name) const {
  if (p.type_tag != expected)
    throw TypeMismatchError(fmt::format("pointer {} does not hold a {} (tag {:016x})", p.to_string(),
                                        type_name, expected));
}

DecodeError Pak::decode_failure(const char* type_name, const Pointer& p, const char* what) {
  return DecodeError(fmt::format("cannot decode {} at {}: {}", type_name, p.to_string(), what));
}

std::string Pak::read_bytes(const Pointer& p) const {
  return std::string(checked_bytes(p));
}

std::vector<DirectoryEntry> Pak::keys() const {
  std::vector<DirectoryEntry> out;
  out.reserve(p_->directory.size());
  for (const auto& [k, loc] : p_->directory) out.push_back(DirectoryEntry{k, loc});
  return out;
}

bool Pak::has_key(std::string_view key) const {
  return p_->directory.find(key) != p_->directory.end();
}

uint64_t Pak::record_count() const { return p_->footer.record_count; }
uint64_t Pak::size() const { return p_->file().size(); }
uint64_t Pak::data_size() const { return p_->footer.data_length; }
const Metadata& Pak::metadata() const { return p_->meta; }
std::string Pak::source() const { return p_->storage->describe(); }

} // namespace pakdb
