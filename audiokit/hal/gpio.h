#ifndef AUDIOKIT_HAL_GPIO_H
#define AUDIOKIT_HAL_GPIO_H

#include "audiokit/hal/logger.h"
#include "etl/span.h"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace audiokit::hal {

enum class GpioDirection : bool {
  IN = false,
  OUT = true
};

enum class GpioBias : uint8_t {
  NONE,
  PULL_UP,
  PULL_DOWN
};

struct GpioLinesConfig {
  GpioDirection direction = GpioDirection::IN;
  GpioBias bias = GpioBias::NONE;
  bool edge_events = false;     // Report both edges on the request fd
  uint32_t debounce_us = 0;     // Kernel debounce, 0 to disable
};

/**
 * @brief A single-level output such as a relay or an emulated button.
 */
class DigitalOutput {
public:
  virtual ~DigitalOutput() = default;
  virtual bool write(bool value) = 0;
};

/**
 * @brief A group of lines on one Linux GPIO chip, requested together
 * through the v2 character device ABI.
 *
 * All lines share one configuration. Levels are reported as a bitmask where
 * bit i is the line at offsets[i]. With edge events enabled, fd() becomes
 * readable whenever any line in the group changes.
 */
class GpioLines : public DigitalOutput {
public:
  static constexpr size_t MAX_LINES = 8;

  GpioLines(const char *chip_path, etl::span<const uint32_t> offsets,
            const GpioLinesConfig &config, const char *consumer, Logger &logger);
  ~GpioLines() override;

  // Owns the request fd
  GpioLines(const GpioLines &) = delete;
  GpioLines &operator=(const GpioLines &) = delete;
  GpioLines(GpioLines &&) = delete;
  GpioLines &operator=(GpioLines &&) = delete;

  bool is_open() const {
    return request_fd_ >= 0;
  }

  int fd() const {
    return request_fd_;
  }

  size_t size() const {
    return num_lines_;
  }

  std::optional<uint32_t> read() const;

  /** @brief Drive every line in the group to the same level. */
  bool write(bool value) override;

  /**
   * @brief Consume pending edge events.
   * @return Number of events read.
   */
  size_t drain_events();

private:
  int request_fd_ = -1;
  size_t num_lines_ = 0;
  Logger &logger_;
};

} // namespace audiokit::hal

#endif // AUDIOKIT_HAL_GPIO_H
