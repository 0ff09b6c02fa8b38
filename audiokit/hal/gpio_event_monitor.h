#ifndef AUDIOKIT_HAL_GPIO_EVENT_MONITOR_H
#define AUDIOKIT_HAL_GPIO_EVENT_MONITOR_H

#include "audiokit/hal/gpio.h"
#include "audiokit/hal/logger.h"
#include "etl/delegate.h"
#include "etl/vector.h"

#include <atomic>
#include <cstdint>
#include <thread>

namespace audiokit::hal {

/**
 * @brief Waits for edge events on GPIO line groups and reports the sampled
 * levels of the whole group.
 *
 * Callbacks run on the monitor thread and must only hand the sample off
 * (e.g. push it onto a queue).
 */
class GpioEventMonitor {
public:
  using Callback = etl::delegate<void(uint32_t levels)>;
  static constexpr size_t MAX_WATCHES = 4;
  static constexpr int POLL_TIMEOUT_MS = 200;

  explicit GpioEventMonitor(Logger &logger);
  ~GpioEventMonitor();

  GpioEventMonitor(const GpioEventMonitor &) = delete;
  GpioEventMonitor &operator=(const GpioEventMonitor &) = delete;

  /**
   * @brief Register a group of edge-reporting lines. Only valid before start().
   * @return false if the group is not open, the monitor is running or full.
   */
  bool watch(GpioLines &lines, Callback callback);

  bool start();
  void stop();

  bool is_running() const {
    return running_.load();
  }

private:
  struct Watch {
    GpioLines *lines;
    Callback callback;
  };

  void run();

  etl::vector<Watch, MAX_WATCHES> watches_;
  std::atomic<bool> running_{false};
  std::thread thread_;
  Logger &logger_;
};

} // namespace audiokit::hal

#endif // AUDIOKIT_HAL_GPIO_EVENT_MONITOR_H
