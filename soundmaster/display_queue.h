#ifndef SOUNDMASTER_DISPLAY_QUEUE_H
#define SOUNDMASTER_DISPLAY_QUEUE_H

#include "audiokit/hal/logger.h"
#include "audiokit/hal/one_shot_timer.h"
#include "audiokit/ui/text_display.h"
#include "soundmaster/config.h"
#include "etl/queue.h"
#include "etl/string.h"
#include "etl/string_view.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace soundmaster {

/**
 * @brief Serialises render requests onto one display worker thread.
 *
 * A non-persistent text is cleared automatically after the auto-clear
 * delay. While muted, auto-clear is suppressed and clear requests are
 * ignored, so the persistent "Muted" text stays up until unmuted.
 */
class DisplayQueue {
public:
  DisplayQueue(audiokit::ui::TextDisplay &display, audiokit::Logger &logger,
               uint32_t auto_clear_ms = config::display::AUTO_CLEAR_MS,
               uint32_t pop_timeout_ms = config::display::POP_TIMEOUT_MS);
  ~DisplayQueue();

  DisplayQueue(const DisplayQueue &) = delete;
  DisplayQueue &operator=(const DisplayQueue &) = delete;

  void start();
  void stop();

  bool is_running() const {
    return running_.load();
  }

  bool show_text(etl::string_view text, bool persistent = false);
  bool clear();

  /** @brief Entering mute also cancels a pending auto-clear. */
  void set_muted(bool muted);

  bool is_muted() const {
    return muted_.load();
  }

  bool is_auto_clear_pending() const {
    return auto_clear_timer_.is_pending();
  }

  /**
   * @brief Block until every queued request has been rendered.
   * @return false if the queue was still busy after timeout_ms.
   */
  bool wait_until_idle(uint32_t timeout_ms);

private:
  struct Request {
    enum class Kind : uint8_t {
      SHOW_TEXT,
      CLEAR
    };

    Kind kind;
    etl::string<config::display::MAX_TEXT_LENGTH> text;
    bool persistent;
  };

  bool enqueue(const Request &request);
  void run();
  void render(const Request &request);
  void on_auto_clear();

  audiokit::ui::TextDisplay &display_;
  audiokit::Logger &logger_;
  const uint32_t auto_clear_ms_;
  const uint32_t pop_timeout_ms_;

  etl::queue<Request, config::display::QUEUE_SIZE> queue_;
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  std::condition_variable idle_;
  bool busy_ = false;

  std::atomic<bool> muted_{false};
  std::atomic<bool> running_{false};
  std::thread worker_;

  audiokit::hal::OneShotTimer auto_clear_timer_;
};

} // namespace soundmaster

#endif // SOUNDMASTER_DISPLAY_QUEUE_H
