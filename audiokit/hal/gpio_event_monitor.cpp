#include "gpio_event_monitor.h"

#include <cerrno>
#include <cstring>

extern "C" {
#include <poll.h>
}

namespace audiokit::hal {

GpioEventMonitor::GpioEventMonitor(Logger &logger) : logger_(logger) {
}

GpioEventMonitor::~GpioEventMonitor() {
  stop();
}

bool GpioEventMonitor::watch(GpioLines &lines, Callback callback) {
  if (running_.load() || watches_.full() || !lines.is_open() || !callback.is_valid()) {
    return false;
  }
  watches_.push_back(Watch{&lines, callback});
  return true;
}

bool GpioEventMonitor::start() {
  if (running_.load()) {
    return true;
  }
  if (watches_.empty()) {
    logger_.warn("GPIO monitor started without lines");
    return false;
  }
  running_ = true;
  thread_ = std::thread(&GpioEventMonitor::run, this);
  return true;
}

void GpioEventMonitor::stop() {
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
  }
}

void GpioEventMonitor::run() {
  logger_.debug("GPIO monitor started", static_cast<uint32_t>(watches_.size()));

  pollfd fds[MAX_WATCHES];
  for (size_t i = 0; i < watches_.size(); ++i) {
    fds[i].fd = watches_[i].lines->fd();
    fds[i].events = POLLIN;
    fds[i].revents = 0;
  }

  while (running_.load()) {
    const int ready = ::poll(fds, static_cast<nfds_t>(watches_.size()), POLL_TIMEOUT_MS);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      logger_.error("GPIO poll failed", etl::string_view(std::strerror(errno)));
      break;
    }
    if (ready == 0) {
      continue;
    }

    for (size_t i = 0; i < watches_.size(); ++i) {
      if ((fds[i].revents & POLLIN) == 0) {
        continue;
      }
      Watch &watch = watches_[i];
      watch.lines->drain_events();
      const auto levels = watch.lines->read();
      if (levels.has_value()) {
        watch.callback(*levels);
      }
    }
  }

  logger_.debug("GPIO monitor stopped");
}

} // namespace audiokit::hal
