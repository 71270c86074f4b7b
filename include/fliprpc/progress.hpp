#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace fliprpc {

struct ProgressEvent {
  size_t transferred = 0;
  std::optional<size_t> total;
};

// Bounded single-producer channel for transfer progress. The producer never
// blocks: when the queue is full the newest event replaces the last queued
// one, so a slow consumer sees fewer but current events.
class ProgressChannel {
 public:
  static constexpr size_t DEFAULT_CAPACITY = 64;

  explicit ProgressChannel(size_t capacity = DEFAULT_CAPACITY);

  ProgressChannel(const ProgressChannel&) = delete;
  ProgressChannel& operator=(const ProgressChannel&) = delete;

  // Returns false if the event was coalesced or the channel is closed.
  bool try_send(const ProgressEvent& event);

  // Blocks until an event is available or the channel is closed and empty.
  std::optional<ProgressEvent> receive();

  // Like receive() but gives up after `timeout`.
  std::optional<ProgressEvent> receive_for(std::chrono::milliseconds timeout);

  void close();
  bool closed() const;

  size_t coalesced() const;

 private:
  std::optional<ProgressEvent> pop_locked();

  const size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<ProgressEvent> events_;
  bool closed_ = false;
  size_t coalesced_ = 0;
};

// Producer side held by a transfer. Closes the channel when the transfer
// ends, on success or error.
class ProgressReporter {
 public:
  explicit ProgressReporter(std::shared_ptr<ProgressChannel> channel)
      : channel_(std::move(channel)) {}
  ~ProgressReporter() {
    if (channel_) channel_->close();
  }

  ProgressReporter(const ProgressReporter&) = delete;
  ProgressReporter& operator=(const ProgressReporter&) = delete;

  void report(size_t transferred, std::optional<size_t> total) {
    if (channel_) channel_->try_send(ProgressEvent{transferred, total});
  }

 private:
  std::shared_ptr<ProgressChannel> channel_;
};

}  // namespace fliprpc
