#include "fliprpc/stream.hpp"

#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <string>

#include "fliprpc/error.hpp"

namespace fliprpc {

namespace {

constexpr int kWriteTimeoutMs = 10000;

std::string errno_message(const char* what) {
  return std::string(what) + ": " + strerror(errno);
}

}  // namespace

FdStream::FdStream(int fd) : fd_(fd) {}

FdStream::~FdStream() {
  close();
}

void FdStream::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

size_t FdStream::read_some(uint8_t* buf, size_t len,
                           std::chrono::milliseconds timeout) {
  if (fd_ < 0) {
    throw Error(ErrorKind::Io, "stream is closed");
  }
  if (len == 0) {
    return 0;
  }

  struct pollfd pfd;
  pfd.fd = fd_;
  pfd.events = POLLIN;

  auto deadline = std::chrono::steady_clock::now() + timeout;

  while (true) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                         deadline - std::chrono::steady_clock::now())
                         .count();
    if (remaining < 0) {
      remaining = 0;
    }

    pfd.revents = 0;
    int ret = poll(&pfd, 1, static_cast<int>(remaining));

    if (ret < 0) {
      if (errno == EINTR) continue;
      throw Error(ErrorKind::Io, errno_message("poll failed"));
    }
    if (ret == 0) {
      return 0;
    }

    if (pfd.revents & POLLIN) {
      ssize_t n = read(fd_, buf, len);
      if (n > 0) {
        return static_cast<size_t>(n);
      }
      if (n == 0) {
        throw Error(ErrorKind::Io, "stream closed by peer");
      }
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
        continue;
      }
      throw Error(ErrorKind::Io, errno_message("read failed"));
    }

    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
      throw Error(ErrorKind::Io, "stream hung up");
    }
  }
}

void FdStream::write_all(const uint8_t* data, size_t len) {
  if (fd_ < 0) {
    throw Error(ErrorKind::Io, "stream is closed");
  }

  size_t written = 0;
  while (written < len) {
    ssize_t n = write(fd_, data + written, len - written);
    if (n > 0) {
      written += static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      struct pollfd pfd;
      pfd.fd = fd_;
      pfd.events = POLLOUT;
      pfd.revents = 0;
      int ret = poll(&pfd, 1, kWriteTimeoutMs);
      if (ret == 0) {
        throw Error(ErrorKind::Timeout, "write stalled");
      }
      if (ret < 0 && errno != EINTR) {
        throw Error(ErrorKind::Io, errno_message("poll failed"));
      }
      continue;
    }
    throw Error(ErrorKind::Io, errno_message("write failed"));
  }
}

}  // namespace fliprpc
