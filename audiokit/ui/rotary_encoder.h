#ifndef AUDIOKIT_UI_ROTARY_ENCODER_H
#define AUDIOKIT_UI_ROTARY_ENCODER_H

#include "audiokit/hal/logger.h"
#include "etl/observer.h"

#include <cstdint>

namespace audiokit::ui {

/**
 * @brief Event data structure for encoder notifications
 */
struct EncoderEvent {
  enum class Type : uint8_t {
    Rotation,
    ShortPress,
    LongPress
  };

  Type type;
  int8_t direction;      // +1 / -1 for Rotation, 0 otherwise
  uint32_t timestamp_ms; // When the decoding input was sampled
};

/**
 * @brief Quadrature encoder with an active-low push key.
 *
 * The decoder is fed sampled line levels and never reads hardware itself,
 * so it can run on whichever thread owns it. It is not thread safe.
 *
 * Rotation: the two lines form a 2-bit pattern (left << 1 | right). Leaving
 * the rest pattern 0 latches the direction (left - right); arriving at 3 with
 * a latched direction emits one Rotation event. Repeated patterns are
 * contact bounce and are ignored.
 *
 * Key: on release, the press duration selects ShortPress (< 1 s) or
 * LongPress (< 10 s). Longer presses emit nothing.
 */
class RotaryEncoder : public etl::observable<etl::observer<EncoderEvent>, 2> {
public:
  static constexpr uint32_t SHORT_PRESS_MAX_MS = 1000;
  static constexpr uint32_t LONG_PRESS_MAX_MS = 10000;

  explicit RotaryEncoder(Logger &logger);

  /** @brief Feed the current levels of the two quadrature lines. */
  void on_rotation_levels(bool left, bool right, uint32_t now_ms);

  /** @brief Feed the current level of the key line (low = pressed). */
  void on_key_level(bool level, uint32_t now_ms);

  uint8_t pattern() const {
    return pattern_;
  }

  int8_t latched_direction() const {
    return direction_;
  }

  bool is_pressed() const {
    return pressed_;
  }

private:
  void emit(EncoderEvent::Type type, int8_t direction, uint32_t now_ms);

  Logger &logger_;

  uint8_t pattern_ = 0;
  int8_t direction_ = 0;

  bool pressed_ = false;
  uint32_t last_key_change_ms_ = 0;
};

} // namespace audiokit::ui

#endif // AUDIOKIT_UI_ROTARY_ENCODER_H
