#include "fliprpc/reader.hpp"

#include <algorithm>
#include <array>

#include "fliprpc/error.hpp"

namespace fliprpc {

StreamReader::StreamReader(std::unique_ptr<ByteStream> stream,
                           std::chrono::milliseconds timeout)
    : stream_(std::move(stream)), timeout_(timeout) {
  read_ahead_.reserve(READ_AHEAD_LIMIT);
}

size_t StreamReader::take_buffered(uint8_t* buf, size_t len) {
  size_t n = std::min(len, read_ahead_.size());
  std::copy(read_ahead_.begin(), read_ahead_.begin() + n, buf);
  read_ahead_.erase(read_ahead_.begin(), read_ahead_.begin() + n);
  return n;
}

size_t StreamReader::read_some(uint8_t* buf, size_t len) {
  if (len == 0) {
    return 0;
  }
  if (!read_ahead_.empty()) {
    return take_buffered(buf, len);
  }

  size_t n = stream_->read_some(buf, len, timeout_);
  if (n == 0) {
    throw Error(ErrorKind::Timeout,
                "no data within " + std::to_string(timeout_.count()) + " ms");
  }
  return n;
}

void StreamReader::read_exact(uint8_t* buf, size_t len) {
  size_t got = 0;
  while (got < len) {
    got += read_some(buf + got, len - got);
  }
}

std::vector<uint8_t> StreamReader::read_exact(size_t len) {
  std::vector<uint8_t> out(len);
  read_exact(out.data(), len);
  return out;
}

void StreamReader::drain_until(const std::string& marker) {
  scan_until(marker, nullptr);
}

std::string StreamReader::read_until(const std::string& marker) {
  std::string text;
  scan_until(marker, &text);
  return text;
}

void StreamReader::scan_until(const std::string& marker,
                              std::string* collected) {
  if (marker.empty() || marker.size() > DRAIN_CHUNK) {
    throw Error(ErrorKind::InvalidArgument,
                "drain marker must be 1.." + std::to_string(DRAIN_CHUNK) +
                    " bytes");
  }

  // Window = tail of the previous chunk (marker.size() - 1 bytes) followed by
  // the newest chunk, so a marker split across two reads is still found.
  std::string window;
  window.reserve(DRAIN_CHUNK + marker.size());

  std::array<uint8_t, DRAIN_CHUNK> chunk;
  auto deadline = std::chrono::steady_clock::now() + timeout_;

  while (true) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      break;
    }

    size_t n = 0;
    if (!read_ahead_.empty()) {
      n = take_buffered(chunk.data(), chunk.size());
    } else {
      auto remaining =
          std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
      n = stream_->read_some(chunk.data(), chunk.size(), remaining);
    }
    if (n == 0) {
      continue;
    }

    window.append(chunk.begin(), chunk.begin() + n);

    size_t pos = window.find(marker);
    if (pos != std::string::npos) {
      if (collected) {
        collected->append(window, 0, pos);
      }
      size_t end = pos + marker.size();
      if (end < window.size()) {
        std::vector<uint8_t> rest(window.begin() + end, window.end());
        unread(rest.data(), rest.size());
      }
      return;
    }

    size_t keep = std::min(window.size(), marker.size() - 1);
    if (collected) {
      collected->append(window, 0, window.size() - keep);
      if (collected->size() > COLLECT_LIMIT) {
        throw Error(ErrorKind::Io, "more than " +
                                       std::to_string(COLLECT_LIMIT) +
                                       " bytes before '" + marker + "'");
      }
    }
    window.erase(0, window.size() - keep);
  }

  throw Error(ErrorKind::Timeout, "timeout searching for '" + marker + "'");
}

void StreamReader::unread(const uint8_t* data, size_t len) {
  if (len == 0) {
    return;
  }
  if (read_ahead_.size() + len > READ_AHEAD_LIMIT) {
    throw Error(ErrorKind::Io, "read-ahead overflow");
  }
  read_ahead_.insert(read_ahead_.begin(), data, data + len);
}

void StreamReader::write_all(const uint8_t* data, size_t len) {
  stream_->write_all(data, len);
}

void StreamReader::write_all(const std::string& text) {
  std::vector<uint8_t> data(text.begin(), text.end());
  write_all(data.data(), data.size());
}

}  // namespace fliprpc
