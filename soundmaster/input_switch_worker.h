#ifndef SOUNDMASTER_INPUT_SWITCH_WORKER_H
#define SOUNDMASTER_INPUT_SWITCH_WORKER_H

#include "audiokit/hal/gpio.h"
#include "audiokit/hal/logger.h"
#include "audiokit/hal/time_source.h"
#include "audiokit/ui/input_selector.h"
#include "soundmaster/source.h"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>

namespace soundmaster {

/**
 * @brief Runs the input selector's pulse cycle off the control thread.
 *
 * Holds one pending target; a request made while a cycle is running
 * replaces any target still waiting. stop() cancels a running cycle before
 * its next pulse.
 */
class InputSwitchWorker {
public:
  InputSwitchWorker(audiokit::ui::InputSelector &selector,
                    audiokit::hal::DigitalOutput &switch_output,
                    audiokit::hal::TimeSource &time_source, audiokit::Logger &logger);
  ~InputSwitchWorker();

  InputSwitchWorker(const InputSwitchWorker &) = delete;
  InputSwitchWorker &operator=(const InputSwitchWorker &) = delete;

  void start();
  void stop();

  void request(Source target);

  /** @return true once no target is waiting and no cycle is running. */
  bool is_idle() const;

private:
  void run();

  audiokit::ui::InputSelector &selector_;
  audiokit::hal::DigitalOutput &switch_output_;
  audiokit::hal::TimeSource &time_source_;
  audiokit::Logger &logger_;

  mutable std::mutex mutex_;
  std::condition_variable wake_;
  std::optional<Source> pending_;
  bool busy_ = false;
  bool running_ = false;
  std::atomic<bool> cancel_{false};
  std::thread thread_;
};

} // namespace soundmaster

#endif // SOUNDMASTER_INPUT_SWITCH_WORKER_H
