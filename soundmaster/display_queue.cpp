#include "soundmaster/display_queue.h"

#include <chrono>

namespace soundmaster {

DisplayQueue::DisplayQueue(audiokit::ui::TextDisplay &display, audiokit::Logger &logger,
                           uint32_t auto_clear_ms, uint32_t pop_timeout_ms)
    : display_(display), logger_(logger), auto_clear_ms_(auto_clear_ms),
      pop_timeout_ms_(pop_timeout_ms),
      auto_clear_timer_(
          audiokit::hal::OneShotTimer::Callback::create<DisplayQueue, &DisplayQueue::on_auto_clear>(
              *this)) {
}

DisplayQueue::~DisplayQueue() {
  stop();
}

void DisplayQueue::start() {
  if (running_.exchange(true)) {
    return;
  }
  worker_ = std::thread(&DisplayQueue::run, this);
}

void DisplayQueue::stop() {
  running_.store(false);
  auto_clear_timer_.cancel();
  not_empty_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

bool DisplayQueue::show_text(etl::string_view text, bool persistent) {
  Request request{Request::Kind::SHOW_TEXT, {}, persistent};
  request.text.assign(text.begin(), text.end());
  return enqueue(request);
}

bool DisplayQueue::clear() {
  if (muted_.load()) {
    return false;
  }
  return enqueue(Request{Request::Kind::CLEAR, {}, false});
}

void DisplayQueue::set_muted(bool muted) {
  muted_.store(muted);
  if (muted) {
    auto_clear_timer_.cancel();
  }
}

bool DisplayQueue::wait_until_idle(uint32_t timeout_ms) {
  std::unique_lock<std::mutex> lock(mutex_);
  return idle_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                        [this] { return queue_.empty() && !busy_; });
}

bool DisplayQueue::enqueue(const Request &request) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.full()) {
      logger_.warn("Display queue full, dropping request");
      return false;
    }
    queue_.push(request);
  }
  not_empty_.notify_one();
  return true;
}

void DisplayQueue::run() {
  while (running_.load()) {
    Request request;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      not_empty_.wait_for(lock, std::chrono::milliseconds(pop_timeout_ms_),
                          [this] { return !queue_.empty() || !running_.load(); });
      if (queue_.empty()) {
        continue;
      }
      request = queue_.front();
      queue_.pop();
      busy_ = true;
    }

    render(request);

    {
      std::lock_guard<std::mutex> lock(mutex_);
      busy_ = false;
    }
    idle_.notify_all();
  }
}

void DisplayQueue::render(const Request &request) {
  switch (request.kind) {
  case Request::Kind::SHOW_TEXT:
    if (!display_.show_text(etl::string_view(request.text.data(), request.text.size()))) {
      logger_.debug("Display: text not shown", etl::string_view(request.text.c_str()));
      return;
    }
    if (!request.persistent && !muted_.load()) {
      auto_clear_timer_.schedule(auto_clear_ms_);
    } else {
      auto_clear_timer_.cancel();
    }
    break;
  case Request::Kind::CLEAR:
    if (!display_.clear()) {
      logger_.debug("Display: clear failed");
    }
    break;
  }
}

void DisplayQueue::on_auto_clear() {
  clear();
}

} // namespace soundmaster
