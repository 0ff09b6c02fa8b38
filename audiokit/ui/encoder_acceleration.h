#ifndef AUDIOKIT_UI_ENCODER_ACCELERATION_H
#define AUDIOKIT_UI_ENCODER_ACCELERATION_H

#include "etl/array.h"

#include <cstdint>

namespace audiokit::ui {

/**
 * @brief Scales encoder ticks by how quickly they follow each other.
 *
 * A tick in the same direction as the previous one is multiplied by the
 * first row whose interval it beats; anything else counts as one step.
 */
class EncoderAcceleration {
public:
  struct Step {
    int32_t multiplier;
    uint32_t max_interval_ms; // Exclusive
  };

  static constexpr etl::array<Step, 5> STEPS = {{
      {10, 100},
      {5, 120},
      {4, 150},
      {3, 200},
      {2, 300},
  }};

  /**
   * @param direction Raw tick direction, +1 or -1.
   * @param timestamp_ms Time of the tick.
   * @return Signed number of volume steps for this tick.
   */
  int32_t apply(int8_t direction, uint32_t timestamp_ms);

  void reset() {
    last_direction_ = 0;
    last_timestamp_ms_ = 0;
  }

private:
  int8_t last_direction_ = 0;
  uint32_t last_timestamp_ms_ = 0;
};

} // namespace audiokit::ui

#endif // AUDIOKIT_UI_ENCODER_ACCELERATION_H
