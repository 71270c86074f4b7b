#include "fliprpc/progress.hpp"

namespace fliprpc {

ProgressChannel::ProgressChannel(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

bool ProgressChannel::try_send(const ProgressEvent& event) {
  bool queued = true;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return false;
    }
    if (events_.size() >= capacity_) {
      events_.back() = event;
      ++coalesced_;
      queued = false;
    } else {
      events_.push_back(event);
    }
  }
  cv_.notify_one();
  return queued;
}

std::optional<ProgressEvent> ProgressChannel::pop_locked() {
  if (events_.empty()) {
    return std::nullopt;
  }
  ProgressEvent event = events_.front();
  events_.pop_front();
  return event;
}

std::optional<ProgressEvent> ProgressChannel::receive() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return closed_ || !events_.empty(); });
  return pop_locked();
}

std::optional<ProgressEvent> ProgressChannel::receive_for(
    std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this] { return closed_ || !events_.empty(); });
  return pop_locked();
}

void ProgressChannel::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool ProgressChannel::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

size_t ProgressChannel::coalesced() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return coalesced_;
}

}  // namespace fliprpc
