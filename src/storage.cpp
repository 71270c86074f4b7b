#include "fliprpc/storage.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

#include "fliprpc/md5.hpp"

namespace fliprpc {

namespace {

std::string file_name_of(const std::string& path) {
  size_t slash = path.find_last_of('/');
  std::string name =
      slash == std::string::npos ? path : path.substr(slash + 1);
  if (name.empty()) {
    throw Error(ErrorKind::InvalidArgument,
                "path '" + path + "' does not name a file");
  }
  return name;
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

// Empty content is what the device sends for an empty directory or file.
bool carries(const Envelope& frame, Envelope::ContentCase expected) {
  return frame.content_case() == expected ||
         frame.content_case() == Envelope::CONTENT_NOT_SET ||
         frame.content_case() == Envelope::kEmpty;
}

// Length of the UTF-8 sequence at the start of `data`, or 0 when it is
// invalid. Then `skip` is the length of the maximal invalid subpart, which is
// what a replacement character stands for.
size_t utf8_sequence(const uint8_t* data, size_t len, size_t& skip) {
  uint8_t lead = data[0];
  if (lead < 0x80) {
    return 1;
  }

  size_t follow = 0;
  uint8_t lo = 0x80;
  uint8_t hi = 0xBF;
  if (lead >= 0xC2 && lead <= 0xDF) {
    follow = 1;
  } else if (lead == 0xE0) {
    follow = 2;
    lo = 0xA0;  // overlong
  } else if (lead == 0xED) {
    follow = 2;
    hi = 0x9F;  // surrogates
  } else if (lead >= 0xE1 && lead <= 0xEF) {
    follow = 2;
  } else if (lead == 0xF0) {
    follow = 3;
    lo = 0x90;  // overlong
  } else if (lead >= 0xF1 && lead <= 0xF3) {
    follow = 3;
  } else if (lead == 0xF4) {
    follow = 3;
    hi = 0x8F;  // above U+10FFFF
  } else {
    skip = 1;
    return 0;
  }

  for (size_t i = 1; i <= follow; ++i) {
    if (i >= len || data[i] < lo || data[i] > hi) {
      skip = i;
      return 0;
    }
    lo = 0x80;
    hi = 0xBF;
  }
  return follow + 1;
}

}  // namespace

Result<std::vector<uint8_t>> Storage::read(
    const std::string& path, std::shared_ptr<ProgressChannel> progress) {
  using ReadResult = Result<std::vector<uint8_t>>;

  ProgressReporter reporter(std::move(progress));
  std::optional<size_t> total;
  std::vector<uint8_t> data;

  if (session_.options().prefetch_metadata) {
    auto size = metadata(path);
    if (!size.ok()) {
      return ReadResult::failure(size.status);
    }
    total = *size.value;
    data.reserve(*total);
    reporter.report(0, total);
  }

  bool unexpected = false;
  Status status =
      session_.exchange(storage_read_request(path), [&](const Envelope& frame) {
        if (!carries(frame, Envelope::kStorageReadResponse)) {
          unexpected = true;
          return;
        }
        if (!frame.has_storage_read_response()) {
          return;
        }
        const std::string& chunk = frame.storage_read_response().file().data();
        data.insert(data.end(), chunk.begin(), chunk.end());
        reporter.report(data.size(), total);
      });

  if (!status.is_ok()) {
    return ReadResult::failure(status);
  }
  if (unexpected) {
    throw Error(ErrorKind::UnexpectedResponse,
                "read of '" + path + "' returned other content");
  }
  return ReadResult::success(std::move(data));
}

Result<std::string> Storage::read_string(const std::string& path) {
  auto bytes = read(path);
  if (!bytes.ok()) {
    return Result<std::string>::failure(bytes.status);
  }
  const auto& data = *bytes.value;
  for (size_t pos = 0; pos < data.size();) {
    size_t skip = 0;
    size_t n = utf8_sequence(data.data() + pos, data.size() - pos, skip);
    if (n == 0) {
      throw Error(ErrorKind::InvalidData, "'" + path +
                                              "' is not valid UTF-8 at byte " +
                                              std::to_string(pos));
    }
    pos += n;
  }
  return Result<std::string>::success(std::string(data.begin(), data.end()));
}

Result<std::string> Storage::read_string_lossy(const std::string& path) {
  auto bytes = read(path);
  if (!bytes.ok()) {
    return Result<std::string>::failure(bytes.status);
  }

  const auto& data = *bytes.value;
  std::string text;
  text.reserve(data.size());
  for (size_t pos = 0; pos < data.size();) {
    size_t skip = 0;
    size_t n = utf8_sequence(data.data() + pos, data.size() - pos, skip);
    if (n == 0) {
      text += "\xEF\xBF\xBD";
      pos += skip;
    } else {
      text.append(data.begin() + pos, data.begin() + pos + n);
      pos += n;
    }
  }
  return Result<std::string>::success(std::move(text));
}

void Storage::keepalive_if_due() {
  const auto& options = session_.options();
  if (!options.keepalive) {
    return;
  }
  auto idle = std::chrono::steady_clock::now() - session_.last_receive();
  if (idle < options.keepalive_interval) {
    return;
  }

  auto response = session_.exchange(ping_request({}));
  ++keepalives_sent_;

  if (!response.ok()) {
    if (options.verbose) {
      std::cerr << "keep-alive ping failed: " << response.status.to_string()
                << "\n";
    }
    return;
  }
  if (response.frames.back().content_case() !=
      Envelope::kSystemPingResponse) {
    throw Error(ErrorKind::UnexpectedResponse,
                "keep-alive answered with " +
                    content_name(response.frames.back()));
  }
  if (options.verbose) {
    std::cerr << "keep-alive ping " << response.command_id << " ok\n";
  }
}

Status Storage::write(const std::string& path,
                      const std::vector<uint8_t>& data,
                      std::shared_ptr<ProgressChannel> progress) {
  const std::string name = file_name_of(path);
  const size_t chunk_size = std::max<size_t>(1, session_.options().chunk_size);
  const size_t total = data.size();
  const size_t chunks =
      total == 0 ? 1 : (total + chunk_size - 1) / chunk_size;

  ProgressReporter reporter(std::move(progress));
  reporter.report(0, total);

  if (session_.options().verbose) {
    std::cerr << "Writing " << total << " bytes to " << path << " in "
              << chunks << " chunk(s)\n";
  }

  Md5 whole;
  uint32_t id = session_.begin_exchange();
  Status status;

  for (size_t i = 0; i < chunks; ++i) {
    const size_t offset = i * chunk_size;
    const size_t len = std::min(chunk_size, total - offset);
    const uint8_t* chunk = data.data() + offset;
    const bool has_next = i + 1 < chunks;

    whole.update(chunk, len);
    session_.send(
        storage_write_request(path, name, chunk, len, Md5::hex(chunk, len)),
        id, has_next);

    if (has_next) {
      reporter.report(offset + len, total);
      keepalive_if_due();
    } else {
      status = session_.receive_chain(id, nullptr);
      if (status.is_ok()) {
        reporter.report(total, total);
      }
    }
  }

  if (!status.is_ok()) {
    return status;
  }

  const std::string expected = whole.hex_digest();
  auto remote = md5sum(path);
  if (!remote.ok()) {
    return remote.status;
  }
  const std::string actual = to_lower(*remote.value);
  if (actual != expected) {
    return Status::verification_mismatch(expected, actual);
  }
  return Status::ok();
}

Result<DirListing> Storage::list(const std::string& path, bool include_md5) {
  std::vector<DirEntry> entries;
  bool unexpected = false;

  Status status = session_.exchange(
      storage_list_request(path, include_md5), [&](const Envelope& frame) {
        if (!carries(frame, Envelope::kStorageListResponse)) {
          unexpected = true;
          return;
        }
        for (const auto& file : frame.storage_list_response().file()) {
          DirEntry entry;
          entry.name = file.name();
          if (file.type() == PB_Storage::File::DIR) {
            entry.kind = DirEntry::Kind::Dir;
          } else {
            entry.size = file.size();
            if (!file.md5sum().empty()) {
              entry.md5 = file.md5sum();
            }
          }
          entries.push_back(std::move(entry));
        }
      });

  if (!status.is_ok()) {
    return Result<DirListing>::failure(status);
  }
  if (unexpected) {
    throw Error(ErrorKind::UnexpectedResponse,
                "listing of '" + path + "' returned other content");
  }
  return Result<DirListing>::success(DirListing(std::move(entries)));
}

Status Storage::simple_exchange(Envelope request) {
  return session_.exchange(std::move(request)).status;
}

Status Storage::remove(const std::string& path, bool recursive) {
  return simple_exchange(storage_delete_request(path, recursive));
}

Status Storage::mkdir(const std::string& path) {
  Status status = simple_exchange(storage_mkdir_request(path));
  if (status.code() == Status::Code::DeviceError &&
      status.command_status() == PB::ERROR_STORAGE_EXIST) {
    return Status::ok();
  }
  return status;
}

Result<uint32_t> Storage::metadata(const std::string& path) {
  auto response = session_.exchange(storage_stat_request(path));
  if (!response.ok()) {
    return Result<uint32_t>::failure(response.status);
  }

  const auto& frame = response.frames.back();
  if (!frame.has_storage_stat_response() ||
      !frame.storage_stat_response().has_file()) {
    throw Error(ErrorKind::UnexpectedResponse,
                "stat of '" + path + "' carried no file, received " +
                    content_name(frame));
  }
  return Result<uint32_t>::success(frame.storage_stat_response().file().size());
}

Result<std::string> Storage::md5sum(const std::string& path) {
  auto response = session_.exchange(storage_md5sum_request(path));
  if (!response.ok()) {
    return Result<std::string>::failure(response.status);
  }

  const auto& frame = response.frames.back();
  if (!frame.has_storage_md5sum_response()) {
    throw Error(ErrorKind::UnexpectedResponse,
                "expected md5sum response, received " + content_name(frame));
  }
  return Result<std::string>::success(
      frame.storage_md5sum_response().md5sum());
}

Status Storage::rename(const std::string& old_path,
                       const std::string& new_path) {
  return simple_exchange(storage_rename_request(old_path, new_path));
}

Status Storage::tar_extract(const std::string& tar_path,
                            const std::string& out_path) {
  return simple_exchange(storage_tar_extract_request(tar_path, out_path));
}

}  // namespace fliprpc
