#include "rotary_encoder.h"

namespace audiokit::ui {

namespace {
constexpr uint8_t REST_PATTERN = 0;
constexpr uint8_t DETENT_PATTERN = 3;
} // namespace

RotaryEncoder::RotaryEncoder(Logger &logger) : logger_(logger) {
}

void RotaryEncoder::on_rotation_levels(bool left, bool right, uint32_t now_ms) {
  const uint8_t new_pattern = static_cast<uint8_t>((left ? 2 : 0) | (right ? 1 : 0));

  if (new_pattern == pattern_) {
    return; // Bounce
  }

  if (pattern_ == REST_PATTERN) {
    direction_ = static_cast<int8_t>((left ? 1 : 0) - (right ? 1 : 0));
  }

  if (new_pattern == DETENT_PATTERN && direction_ != 0) {
    emit(EncoderEvent::Type::Rotation, direction_, now_ms);
    direction_ = 0;
  }

  if (new_pattern == REST_PATTERN) {
    direction_ = 0;
  }

  pattern_ = new_pattern;
}

void RotaryEncoder::on_key_level(bool level, uint32_t now_ms) {
  const bool pressed = !level;

  if (pressed == pressed_) {
    logger_.warn("Encoder: same key event repeated");
    return;
  }

  if (!pressed) {
    const uint32_t held_ms = now_ms - last_key_change_ms_;
    if (held_ms < SHORT_PRESS_MAX_MS) {
      logger_.debug("Encoder: short press", static_cast<int32_t>(held_ms));
      emit(EncoderEvent::Type::ShortPress, 0, now_ms);
    } else if (held_ms < LONG_PRESS_MAX_MS) {
      logger_.debug("Encoder: long press", static_cast<int32_t>(held_ms));
      emit(EncoderEvent::Type::LongPress, 0, now_ms);
    }
  }

  pressed_ = pressed;
  last_key_change_ms_ = now_ms;
}

void RotaryEncoder::emit(EncoderEvent::Type type, int8_t direction, uint32_t now_ms) {
  notify_observers(EncoderEvent{type, direction, now_ms});
}

} // namespace audiokit::ui
