#ifndef AUDIOKIT_UI_INPUT_SELECTOR_H
#define AUDIOKIT_UI_INPUT_SELECTOR_H

#include "audiokit/hal/gpio.h"
#include "audiokit/hal/logger.h"
#include "audiokit/hal/time_source.h"
#include "etl/observer.h"

#include <atomic>
#include <cstdint>
#include <optional>

namespace audiokit::ui {

struct SelectionChange {
  uint8_t old_selection;
  uint8_t new_selection;
};

/**
 * @brief Tracks which input an external switcher reports through one-hot
 * indicator lines, and steps it with an emulated button.
 *
 * Selection 0 means no line is high (the switcher's default input);
 * selection n (1..NUM_LINES) means only indicator line n-1 is high. Any
 * other pattern is a transition and keeps the previous selection.
 *
 * init() and update() must be called from one thread; current() may be
 * read from any thread.
 */
class InputSelector : public etl::observable<etl::observer<SelectionChange>, 2> {
public:
  static constexpr uint8_t NUM_LINES = 3;
  static constexpr uint8_t MAX_SELECTION = NUM_LINES;
  static constexpr uint32_t PULSE_MS = 150;
  static constexpr uint32_t SETTLE_MS = 500;
  static constexpr uint8_t MAX_ATTEMPTS = 10;

  explicit InputSelector(Logger &logger);

  /**
   * @brief Decode indicator levels (bit i = line i).
   * @return The selection, or nullopt for an ambiguous pattern.
   */
  static std::optional<uint8_t> resolve(uint32_t levels);

  /** @brief Set the starting selection without notifying observers. */
  void init(uint32_t levels);

  /** @brief Re-decode and notify observers if the selection changed. */
  void update(uint32_t levels);

  uint8_t current() const {
    return current_.load();
  }

  /**
   * @brief Pulse the switch button until the switcher reports target.
   *
   * Blocks for up to MAX_ATTEMPTS * (PULSE_MS + SETTLE_MS). Progress is
   * observed through update(), which must keep running on another thread.
   * When cancel is given and becomes true, no further pulse is sent.
   *
   * @return true if the target selection was reached.
   */
  bool request_selection(uint8_t target, hal::DigitalOutput &switch_output,
                         hal::TimeSource &time_source,
                         const std::atomic<bool> *cancel = nullptr);

private:
  void pulse(hal::DigitalOutput &switch_output, hal::TimeSource &time_source);

  Logger &logger_;
  std::atomic<uint8_t> current_{0};
};

} // namespace audiokit::ui

#endif // AUDIOKIT_UI_INPUT_SELECTOR_H
