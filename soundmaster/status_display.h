#ifndef SOUNDMASTER_STATUS_DISPLAY_H
#define SOUNDMASTER_STATUS_DISPLAY_H

#include "soundmaster/display_queue.h"
#include "soundmaster/source.h"
#include "etl/string.h"

#include <cstdint>

namespace soundmaster {

/**
 * @brief Formats controller state into display texts.
 */
class StatusDisplay {
public:
  static constexpr const char *MUTED_TEXT = "Muted";

  explicit StatusDisplay(DisplayQueue &queue) : queue_(queue) {
  }

  /** @brief "Min" at 0, "Max" at the top of the range, else the number. */
  static etl::string<4> format_volume(uint8_t volume);

  void show_volume(uint8_t volume);
  void show_input(Source source);

  /** @brief Muting shows a persistent text; unmuting clears it. */
  void show_mute(bool muted);

private:
  DisplayQueue &queue_;
};

} // namespace soundmaster

#endif // SOUNDMASTER_STATUS_DISPLAY_H
