#ifndef AUDIOKIT_DRIVERS_SSD1306_H
#define AUDIOKIT_DRIVERS_SSD1306_H

#include "audiokit/hal/i2c_bus.h"
#include "audiokit/hal/logger.h"
#include "audiokit/ui/text_display.h"
#include "etl/array.h"
#include "etl/string_view.h"

#include <cstdint>

namespace audiokit::drivers {

/**
 * @brief Status codes for SSD1306 operations.
 */
enum class Ssd1306Status {
  OK = 0,
  ERROR_NOT_INITIALIZED,
  ERROR_I2C_WRITE_FAILED,
};

/**
 * @brief 128x32 SSD1306 OLED used as a single-line text display.
 *
 * Text is drawn with a 5x7 font, scaled up as far as it fits and centred.
 * Until init() succeeds every drawing call is a no-op returning false, so
 * a missing panel does not disturb the caller.
 */
class Ssd1306 : public ui::TextDisplay {
public:
  static constexpr uint8_t WIDTH = 128;
  static constexpr uint8_t HEIGHT = 32;
  static constexpr uint8_t PAGES = HEIGHT / 8;
  static constexpr uint8_t MAX_SCALE = 4;

  using FrameBuffer = etl::array<uint8_t, WIDTH * PAGES>;

  /**
   * @param bus Bus the panel sits on.
   * @param address 7-bit address (usually 0x3C).
   */
  Ssd1306(hal::I2cBus &bus, uint8_t address, Logger &logger);

  Ssd1306(const Ssd1306 &) = delete;
  Ssd1306 &operator=(const Ssd1306 &) = delete;

  /** @brief Send the power-up sequence and blank the panel. */
  Ssd1306Status init();

  bool is_initialized() const {
    return initialized_;
  }

  Ssd1306Status set_contrast(uint8_t contrast);

  bool show_text(etl::string_view text) override;
  bool clear() override;

  /** @brief Draw text into a frame buffer without touching the bus. */
  static void render_text(etl::string_view text, FrameBuffer &buffer);

  const FrameBuffer &frame_buffer() const {
    return buffer_;
  }

private:
  Ssd1306Status send_commands(etl::span<const uint8_t> commands);
  Ssd1306Status flush();

  hal::I2cBus &bus_;
  Logger &logger_;
  uint8_t address_;
  bool initialized_ = false;
  FrameBuffer buffer_{};
};

} // namespace audiokit::drivers

#endif // AUDIOKIT_DRIVERS_SSD1306_H
