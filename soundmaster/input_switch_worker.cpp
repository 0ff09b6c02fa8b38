#include "soundmaster/input_switch_worker.h"

namespace soundmaster {

InputSwitchWorker::InputSwitchWorker(audiokit::ui::InputSelector &selector,
                                     audiokit::hal::DigitalOutput &switch_output,
                                     audiokit::hal::TimeSource &time_source,
                                     audiokit::Logger &logger)
    : selector_(selector), switch_output_(switch_output), time_source_(time_source),
      logger_(logger) {
}

InputSwitchWorker::~InputSwitchWorker() {
  stop();
}

void InputSwitchWorker::start() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
      return;
    }
    running_ = true;
  }
  cancel_.store(false);
  thread_ = std::thread(&InputSwitchWorker::run, this);
}

void InputSwitchWorker::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
    pending_.reset();
  }
  cancel_.store(true);
  wake_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void InputSwitchWorker::request(Source target) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_.has_value()) {
      logger_.debug("Input switch: replacing pending target", to_label(*pending_));
    }
    pending_ = target;
  }
  wake_.notify_all();
}

bool InputSwitchWorker::is_idle() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return !pending_.has_value() && !busy_;
}

void InputSwitchWorker::run() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    wake_.wait(lock, [this] { return pending_.has_value() || !running_; });
    if (!running_) {
      break;
    }

    const Source target = *pending_;
    pending_.reset();
    busy_ = true;
    lock.unlock();

    logger_.info("Switching input to", to_label(target));
    const bool switched = selector_.request_selection(to_selection(target), switch_output_,
                                                      time_source_, &cancel_);
    if (!switched) {
      if (cancel_.load()) {
        logger_.info("Input switch cancelled", to_label(target));
      } else {
        logger_.error("Input switch did not reach", to_label(target));
      }
    }

    lock.lock();
    busy_ = false;
  }
}

} // namespace soundmaster
