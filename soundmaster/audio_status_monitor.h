#ifndef SOUNDMASTER_AUDIO_STATUS_MONITOR_H
#define SOUNDMASTER_AUDIO_STATUS_MONITOR_H

#include "audiokit/hal/logger.h"
#include "soundmaster/config.h"
#include "soundmaster/control_queue.h"
#include "etl/string.h"

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>

namespace soundmaster {

/**
 * @brief Polls the ALSA PCM status file and reports playback on/off changes.
 *
 * The file reads exactly "closed\n" while no stream is open; any other
 * content, including a read failure, counts as playing. The first poll
 * always reports.
 */
class AudioStatusMonitor {
public:
  AudioStatusMonitor(const char *status_path, ControlQueue &control_queue,
                     audiokit::Logger &logger,
                     uint32_t poll_interval_ms = config::audio_status::POLL_INTERVAL_MS);
  ~AudioStatusMonitor();

  AudioStatusMonitor(const AudioStatusMonitor &) = delete;
  AudioStatusMonitor &operator=(const AudioStatusMonitor &) = delete;

  void start();
  void stop();

  /** @brief Read the status file once. */
  static bool read_playing(const char *status_path);

  /** @brief Poll once; queue an event if the status changed. */
  void poll_once();

private:
  void run();

  etl::string<config::persistence::MAX_PATH_LENGTH> status_path_;
  ControlQueue &control_queue_;
  audiokit::Logger &logger_;
  const uint32_t poll_interval_ms_;

  std::optional<bool> last_playing_;

  std::mutex mutex_;
  std::condition_variable wake_;
  bool running_ = false;
  std::thread thread_;
};

} // namespace soundmaster

#endif // SOUNDMASTER_AUDIO_STATUS_MONITOR_H
