#include "soundmaster/control_queue.h"

#include <chrono>

namespace soundmaster {

ControlQueue::ControlQueue(audiokit::Logger &logger) : logger_(logger) {
}

bool ControlQueue::push(const ControlItem &item) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return false;
    }
    if (queue_.full()) {
      logger_.warn("Control queue full, dropping item");
      return false;
    }
    queue_.push(item);
  }
  not_empty_.notify_one();
  return true;
}

bool ControlQueue::pop(ControlItem &item, uint32_t timeout_ms) {
  std::unique_lock<std::mutex> lock(mutex_);
  not_empty_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                      [this] { return !queue_.empty() || closed_; });
  if (queue_.empty()) {
    return false;
  }
  item = queue_.front();
  queue_.pop();
  return true;
}

void ControlQueue::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  not_empty_.notify_all();
}

bool ControlQueue::is_closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

size_t ControlQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

} // namespace soundmaster
