#include "encoder_acceleration.h"

namespace audiokit::ui {

int32_t EncoderAcceleration::apply(int8_t direction, uint32_t timestamp_ms) {
  int32_t steps = direction;

  if (static_cast<int32_t>(last_direction_) * direction > 0) {
    const uint32_t interval_ms = timestamp_ms - last_timestamp_ms_;
    for (const Step &step : STEPS) {
      if (interval_ms < step.max_interval_ms) {
        steps *= step.multiplier;
        break;
      }
    }
  }

  // The raw direction is remembered, not the scaled one.
  last_direction_ = direction;
  last_timestamp_ms_ = timestamp_ms;
  return steps;
}

} // namespace audiokit::ui
