#include "soundmaster/console_control_source.h"

#include "soundmaster/control_messages.h"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace soundmaster {

ConsoleControlSource::ConsoleControlSource(int fd, ControlQueue &control_queue,
                                           audiokit::Logger &logger)
    : fd_(fd), control_queue_(control_queue), logger_(logger) {
}

ConsoleControlSource::~ConsoleControlSource() {
  stop();
}

void ConsoleControlSource::start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&ConsoleControlSource::run, this);
}

void ConsoleControlSource::stop() {
  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool ConsoleControlSource::handle_line(etl::string_view line) {
  while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
    line.remove_suffix(1);
  }
  while (!line.empty() && line.front() == ' ') {
    line.remove_prefix(1);
  }
  if (line.empty()) {
    return false;
  }

  const size_t separator = line.find(' ');
  const etl::string_view topic =
      separator == etl::string_view::npos ? line : line.substr(0, separator);
  const etl::string_view payload =
      separator == etl::string_view::npos ? etl::string_view() : line.substr(separator + 1);

  const std::optional<Event> event = decode_control_message(topic, payload, logger_);
  if (!event.has_value()) {
    return false;
  }
  return control_queue_.push_event(*event);
}

void ConsoleControlSource::run() {
  logger_.debug("Console control source started");
  char buffer[64];

  while (running_.load()) {
    pollfd descriptor{fd_, POLLIN, 0};
    const int ready = poll(&descriptor, 1, POLL_TIMEOUT_MS);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      logger_.error("Console: poll failed", etl::string_view(std::strerror(errno)));
      break;
    }
    if (ready == 0) {
      continue;
    }

    const ssize_t count = read(fd_, buffer, sizeof(buffer));
    if (count < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      logger_.error("Console: read failed", etl::string_view(std::strerror(errno)));
      break;
    }
    if (count == 0) {
      logger_.info("Console: end of input");
      break;
    }
    consume(buffer, static_cast<size_t>(count));
  }

  running_.store(false);
}

void ConsoleControlSource::consume(const char *data, size_t length) {
  for (size_t i = 0; i < length; ++i) {
    const char c = data[i];
    if (c == '\n') {
      if (line_overflowed_) {
        logger_.warn("Console: line too long, ignored");
      } else {
        handle_line(etl::string_view(line_.data(), line_.size()));
      }
      line_.clear();
      line_overflowed_ = false;
      continue;
    }
    if (line_.full()) {
      line_overflowed_ = true;
      continue;
    }
    line_.push_back(c);
  }
}

} // namespace soundmaster
