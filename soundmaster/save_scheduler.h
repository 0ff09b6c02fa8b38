#ifndef SOUNDMASTER_SAVE_SCHEDULER_H
#define SOUNDMASTER_SAVE_SCHEDULER_H

#include "audiokit/hal/logger.h"
#include "audiokit/hal/one_shot_timer.h"
#include "soundmaster/audio_settings.h"
#include "soundmaster/config.h"
#include "soundmaster/control_queue.h"
#include "soundmaster/settings_persister.h"
#include "etl/string.h"

#include <cstdint>
#include <mutex>

namespace soundmaster {

/**
 * @brief Coalesces settings changes into one delayed write.
 *
 * Every request_save() replaces the pending snapshot and restarts the delay,
 * so a burst of changes produces one write timed from the last request.
 * After a successful write a StateSavedEvent is queued for the control
 * thread. A path SettingsPersister cannot use is refused up front and every
 * write then fails.
 */
class SaveScheduler {
public:
  SaveScheduler(const char *filepath, SettingsPersister &persister, ControlQueue &control_queue,
                audiokit::Logger &logger,
                uint32_t save_delay_ms = config::persistence::SAVE_DELAY_MS);

  SaveScheduler(const SaveScheduler &) = delete;
  SaveScheduler &operator=(const SaveScheduler &) = delete;

  void request_save(const AudioSettings &settings);

  /**
   * @brief Write a pending snapshot now, if there is one.
   * @return false only if a write was attempted and failed.
   */
  bool flush();

  bool has_pending_save() const;

  uint32_t save_count() const;

private:
  enum class WriteResult {
    NOTHING_PENDING,
    WRITTEN,
    FAILED
  };

  void on_timer();
  WriteResult write_pending();

  etl::string<config::persistence::MAX_PATH_LENGTH> filepath_;
  const bool filepath_valid_;
  SettingsPersister &persister_;
  ControlQueue &control_queue_;
  audiokit::Logger &logger_;
  const uint32_t save_delay_ms_;

  mutable std::mutex mutex_;
  AudioSettings pending_settings_;
  bool has_pending_ = false;
  uint32_t save_count_ = 0;

  std::mutex write_mutex_;

  // Last member: its thread must stop before the state above goes away.
  audiokit::hal::OneShotTimer timer_;
};

} // namespace soundmaster

#endif // SOUNDMASTER_SAVE_SCHEDULER_H
