#pragma once

#include <cstdint>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "progress.hpp"
#include "session.hpp"

namespace fliprpc {

struct DirEntry {
  enum class Kind { File, Dir };

  Kind kind = Kind::File;
  std::string name;
  uint32_t size = 0;               // Dir entries report 0
  std::optional<std::string> md5;  // only when the listing asked for it

  bool is_dir() const { return kind == Kind::Dir; }
};

// Entries of one directory, consumed once in device order.
class DirListing {
 public:
  class iterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = DirEntry;
    using difference_type = std::ptrdiff_t;
    using pointer = const DirEntry*;
    using reference = const DirEntry&;

    iterator() = default;
    explicit iterator(DirListing* listing) : listing_(listing) { advance(); }

    reference operator*() const { return *current_; }
    pointer operator->() const { return &*current_; }
    iterator& operator++() {
      advance();
      return *this;
    }
    bool operator==(const iterator& other) const {
      return listing_ == other.listing_;
    }
    bool operator!=(const iterator& other) const { return !(*this == other); }

   private:
    void advance() {
      current_ = listing_ ? listing_->next() : std::nullopt;
      if (!current_) listing_ = nullptr;
    }

    DirListing* listing_ = nullptr;
    std::optional<DirEntry> current_;
  };

  DirListing() = default;
  explicit DirListing(std::vector<DirEntry> entries)
      : entries_(std::move(entries)) {}

  DirListing(DirListing&&) = default;
  DirListing& operator=(DirListing&&) = default;
  DirListing(const DirListing&) = delete;
  DirListing& operator=(const DirListing&) = delete;

  std::optional<DirEntry> next() {
    if (pos_ >= entries_.size()) return std::nullopt;
    return std::move(entries_[pos_++]);
  }

  size_t remaining() const { return entries_.size() - pos_; }

  iterator begin() { return iterator(this); }
  iterator end() { return iterator(); }

 private:
  std::vector<DirEntry> entries_;
  size_t pos_ = 0;
};

// File operations on the device's storage. Every call is one or more
// exchanges on the borrowed session.
class Storage {
 public:
  explicit Storage(Session& session) : session_(session) {}

  // Reads the whole file. With prefetch_metadata the size is queried
  // first so the buffer is reserved and progress carries a total.
  Result<std::vector<uint8_t>> read(
      const std::string& path,
      std::shared_ptr<ProgressChannel> progress = nullptr);

  // read() as UTF-8 text. Throws InvalidData when the file is not valid
  // UTF-8; the session stays usable.
  Result<std::string> read_string(const std::string& path);

  // read() as UTF-8 text with each invalid sequence replaced by U+FFFD.
  Result<std::string> read_string_lossy(const std::string& path);

  // Writes `data` in chunk_size pieces under a single command id, then
  // checks the device's MD5 of the file against the local one.
  Status write(const std::string& path, const std::vector<uint8_t>& data,
               std::shared_ptr<ProgressChannel> progress = nullptr);

  Result<DirListing> list(const std::string& path, bool include_md5 = true);

  Status remove(const std::string& path, bool recursive = false);

  // Succeeds when the directory already exists.
  Status mkdir(const std::string& path);

  // Size of the file in bytes.
  Result<uint32_t> metadata(const std::string& path);

  // MD5 of the file as computed by the device.
  Result<std::string> md5sum(const std::string& path);

  Status rename(const std::string& old_path, const std::string& new_path);

  // Unpacks a tar archive already on the device into `out_path`.
  Status tar_extract(const std::string& tar_path, const std::string& out_path);

  // Keep-alive pings injected by write() on this object.
  size_t keepalives_sent() const { return keepalives_sent_; }

 private:
  void keepalive_if_due();
  Status simple_exchange(Envelope request);

  Session& session_;
  size_t keepalives_sent_ = 0;
};

}  // namespace fliprpc
