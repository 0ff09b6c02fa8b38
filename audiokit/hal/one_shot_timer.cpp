#include "one_shot_timer.h"

namespace audiokit::hal {

OneShotTimer::OneShotTimer(Callback callback) : callback_(callback) {
  thread_ = std::thread(&OneShotTimer::run, this);
}

OneShotTimer::~OneShotTimer() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
    deadline_.reset();
  }
  wake_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void OneShotTimer::schedule(uint32_t delay_ms) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    deadline_ = Clock::now() + std::chrono::milliseconds(delay_ms);
  }
  wake_.notify_all();
}

void OneShotTimer::cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    deadline_.reset();
  }
  wake_.notify_all();
}

bool OneShotTimer::is_pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return deadline_.has_value();
}

void OneShotTimer::run() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stopping_) {
    if (!deadline_.has_value()) {
      wake_.wait(lock);
      continue;
    }
    const Clock::time_point deadline = *deadline_;
    if (Clock::now() < deadline) {
      // Re-evaluated after every wake-up: the deadline may have moved.
      wake_.wait_until(lock, deadline);
      continue;
    }

    deadline_.reset();
    lock.unlock();
    if (callback_.is_valid()) {
      callback_();
    }
    lock.lock();
  }
}

} // namespace audiokit::hal
