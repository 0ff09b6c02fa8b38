#include "soundmaster/audio_status_monitor.h"

#include <chrono>
#include <cstdio>
#include <cstring>

namespace soundmaster {

namespace {
constexpr const char *CLOSED_STATUS = "closed\n";
} // namespace

AudioStatusMonitor::AudioStatusMonitor(const char *status_path, ControlQueue &control_queue,
                                       audiokit::Logger &logger, uint32_t poll_interval_ms)
    : status_path_(status_path), control_queue_(control_queue), logger_(logger),
      poll_interval_ms_(poll_interval_ms) {
}

AudioStatusMonitor::~AudioStatusMonitor() {
  stop();
}

void AudioStatusMonitor::start() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
      return;
    }
    running_ = true;
  }
  logger_.debug("Audio status monitoring started", etl::string_view(status_path_.c_str()));
  thread_ = std::thread(&AudioStatusMonitor::run, this);
}

void AudioStatusMonitor::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  wake_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool AudioStatusMonitor::read_playing(const char *status_path) {
  FILE *file = fopen(status_path, "r");
  if (!file) {
    return true;
  }

  // One byte more than the closed text, so longer content never matches.
  char buffer[16] = {};
  const size_t length = fread(buffer, 1, std::strlen(CLOSED_STATUS) + 1, file);
  fclose(file);

  return !(length == std::strlen(CLOSED_STATUS) &&
           std::memcmp(buffer, CLOSED_STATUS, length) == 0);
}

void AudioStatusMonitor::poll_once() {
  const bool playing = read_playing(status_path_.c_str());
  if (last_playing_.has_value() && *last_playing_ == playing) {
    return;
  }
  // Only a delivered change counts; a full queue retries on the next poll.
  if (control_queue_.push_event(Event(Events::AudioStatusChangedEvent{playing}))) {
    last_playing_ = playing;
  }
}

void AudioStatusMonitor::run() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (running_) {
    lock.unlock();
    poll_once();
    lock.lock();
    wake_.wait_for(lock, std::chrono::milliseconds(poll_interval_ms_),
                   [this] { return !running_; });
  }
}

} // namespace soundmaster
