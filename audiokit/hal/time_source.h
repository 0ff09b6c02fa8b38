#ifndef AUDIOKIT_HAL_TIME_SOURCE_H
#define AUDIOKIT_HAL_TIME_SOURCE_H

#include <cstdint>

namespace audiokit::hal {

/**
 * @brief Abstract time source for dependency injection.
 *
 * Timestamps are milliseconds on a monotonic clock with an arbitrary epoch.
 */
class TimeSource {
public:
  virtual ~TimeSource() = default;
  virtual uint32_t get_time_ms() const = 0;
  virtual void sleep_ms(uint32_t duration_ms) = 0;
};

/**
 * @brief Time source backed by std::chrono::steady_clock.
 */
class SteadyTimeSource : public TimeSource {
public:
  uint32_t get_time_ms() const override;
  void sleep_ms(uint32_t duration_ms) override;
};

} // namespace audiokit::hal

#endif // AUDIOKIT_HAL_TIME_SOURCE_H
