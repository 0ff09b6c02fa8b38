#include "gpio.h"

#include <cerrno>
#include <cstring>

extern "C" {
#include <fcntl.h>
#include <linux/gpio.h>
#include <sys/ioctl.h>
#include <unistd.h>
}

namespace audiokit::hal {

namespace {

uint64_t line_flags(const GpioLinesConfig &config) {
  uint64_t flags = 0;
  if (config.direction == GpioDirection::OUT) {
    flags |= GPIO_V2_LINE_FLAG_OUTPUT;
  } else {
    flags |= GPIO_V2_LINE_FLAG_INPUT;
    if (config.edge_events) {
      flags |= GPIO_V2_LINE_FLAG_EDGE_RISING | GPIO_V2_LINE_FLAG_EDGE_FALLING;
    }
  }

  switch (config.bias) {
  case GpioBias::PULL_UP:
    flags |= GPIO_V2_LINE_FLAG_BIAS_PULL_UP;
    break;
  case GpioBias::PULL_DOWN:
    flags |= GPIO_V2_LINE_FLAG_BIAS_PULL_DOWN;
    break;
  case GpioBias::NONE:
    break;
  }
  return flags;
}

uint64_t all_lines_mask(size_t num_lines) {
  return (uint64_t{1} << num_lines) - 1;
}

} // namespace

GpioLines::GpioLines(const char *chip_path, etl::span<const uint32_t> offsets,
                     const GpioLinesConfig &config, const char *consumer, Logger &logger)
    : logger_(logger) {
  if (offsets.empty() || offsets.size() > MAX_LINES) {
    logger_.error("Invalid GPIO line count", static_cast<uint32_t>(offsets.size()));
    return;
  }

  int chip_fd = ::open(chip_path, O_RDWR | O_CLOEXEC);
  if (chip_fd < 0) {
    logger_.error("Failed to open GPIO chip", etl::string_view(chip_path));
    logger_.error("open() failed", etl::string_view(std::strerror(errno)));
    return;
  }

  gpio_v2_line_request request{};
  for (size_t i = 0; i < offsets.size(); ++i) {
    request.offsets[i] = offsets[i];
  }
  request.num_lines = static_cast<__u32>(offsets.size());
  std::strncpy(request.consumer, consumer, sizeof(request.consumer) - 1);
  request.config.flags = line_flags(config);

  if (config.direction == GpioDirection::OUT) {
    // Outputs start low
    auto &attr = request.config.attrs[request.config.num_attrs++];
    attr.attr.id = GPIO_V2_LINE_ATTR_ID_OUTPUT_VALUES;
    attr.attr.values = 0;
    attr.mask = all_lines_mask(offsets.size());
  } else if (config.edge_events && config.debounce_us > 0) {
    auto &attr = request.config.attrs[request.config.num_attrs++];
    attr.attr.id = GPIO_V2_LINE_ATTR_ID_DEBOUNCE;
    attr.attr.debounce_period_us = config.debounce_us;
    attr.mask = all_lines_mask(offsets.size());
  }

  if (::ioctl(chip_fd, GPIO_V2_GET_LINE_IOCTL, &request) < 0) {
    logger_.error("GPIO line request failed", etl::string_view(std::strerror(errno)));
    ::close(chip_fd);
    return;
  }
  ::close(chip_fd);

  request_fd_ = request.fd;
  num_lines_ = offsets.size();

  const int fd_flags = ::fcntl(request_fd_, F_GETFL);
  if (fd_flags >= 0) {
    ::fcntl(request_fd_, F_SETFL, fd_flags | O_NONBLOCK);
  }
  logger_.debug("GPIO lines requested", etl::string_view(consumer));
}

GpioLines::~GpioLines() {
  if (request_fd_ >= 0) {
    ::close(request_fd_);
  }
}

std::optional<uint32_t> GpioLines::read() const {
  if (request_fd_ < 0) {
    return std::nullopt;
  }
  gpio_v2_line_values values{};
  values.mask = all_lines_mask(num_lines_);
  if (::ioctl(request_fd_, GPIO_V2_LINE_GET_VALUES_IOCTL, &values) < 0) {
    logger_.warn("GPIO read failed", etl::string_view(std::strerror(errno)));
    return std::nullopt;
  }
  return static_cast<uint32_t>(values.bits & values.mask);
}

bool GpioLines::write(bool value) {
  if (request_fd_ < 0) {
    return false;
  }
  gpio_v2_line_values values{};
  values.mask = all_lines_mask(num_lines_);
  values.bits = value ? values.mask : 0;
  if (::ioctl(request_fd_, GPIO_V2_LINE_SET_VALUES_IOCTL, &values) < 0) {
    logger_.warn("GPIO write failed", etl::string_view(std::strerror(errno)));
    return false;
  }
  return true;
}

size_t GpioLines::drain_events() {
  if (request_fd_ < 0) {
    return 0;
  }
  size_t total = 0;
  gpio_v2_line_event events[16];
  while (true) {
    const ssize_t bytes = ::read(request_fd_, events, sizeof(events));
    if (bytes <= 0) {
      break;
    }
    total += static_cast<size_t>(bytes) / sizeof(gpio_v2_line_event);
  }
  return total;
}

} // namespace audiokit::hal
