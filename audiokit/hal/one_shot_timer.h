#ifndef AUDIOKIT_HAL_ONE_SHOT_TIMER_H
#define AUDIOKIT_HAL_ONE_SHOT_TIMER_H

#include "etl/delegate.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>

namespace audiokit::hal {

/**
 * @brief Runs a fixed callback once after a delay, on its own thread.
 *
 * There is a single pending slot: schedule() cancels whatever is pending and
 * starts a new countdown, so a burst of schedule() calls fires once, timed
 * from the last call. The callback runs without the timer lock held and may
 * call schedule() or cancel().
 */
class OneShotTimer {
public:
  using Callback = etl::delegate<void()>;

  explicit OneShotTimer(Callback callback);
  ~OneShotTimer();

  OneShotTimer(const OneShotTimer &) = delete;
  OneShotTimer &operator=(const OneShotTimer &) = delete;

  void schedule(uint32_t delay_ms);
  void cancel();
  bool is_pending() const;

private:
  using Clock = std::chrono::steady_clock;

  void run();

  Callback callback_;
  mutable std::mutex mutex_;
  std::condition_variable wake_;
  std::optional<Clock::time_point> deadline_;
  bool stopping_ = false;
  std::thread thread_;
};

} // namespace audiokit::hal

#endif // AUDIOKIT_HAL_ONE_SHOT_TIMER_H
