#include "ssd1306.h"

#include "audiokit/drivers/font5x7.h"
#include "etl/algorithm.h"
#include "etl/vector.h"

#include <cstring>

namespace audiokit::drivers {

namespace {

constexpr uint8_t CONTROL_COMMAND = 0x00;
constexpr uint8_t CONTROL_DATA = 0x40;
constexpr size_t MAX_COMMAND_BYTES = 32;

constexpr uint8_t CMD_DISPLAY_OFF = 0xAE;
constexpr uint8_t CMD_DISPLAY_ON = 0xAF;
constexpr uint8_t CMD_SET_CONTRAST = 0x81;
constexpr uint8_t CMD_COLUMN_ADDRESS = 0x21;
constexpr uint8_t CMD_PAGE_ADDRESS = 0x22;

// 128x32 panel, internal charge pump, horizontal addressing.
constexpr uint8_t INIT_SEQUENCE[] = {
    CMD_DISPLAY_OFF,
    0xD5, 0x80,        // Clock divide ratio / oscillator
    0xA8, 0x1F,        // Multiplex ratio: 32 rows
    0xD3, 0x00,        // Display offset
    0x40,              // Start line 0
    0x8D, 0x14,        // Charge pump on
    0x20, 0x00,        // Horizontal addressing
    0xA1,              // Segment remap
    0xC8,              // COM scan descending
    0xDA, 0x02,        // COM pins for 32 rows
    CMD_SET_CONTRAST, 0xFF,
    0xD9, 0xF1,        // Pre-charge period
    0xDB, 0x40,        // VCOMH deselect level
    0xA4,              // Follow RAM
    0xA6,              // Normal, not inverted
    0x2E,              // Scrolling off
    CMD_DISPLAY_ON,
};

constexpr uint8_t GLYPH_ADVANCE = font5x7::GLYPH_WIDTH + 1;

void set_pixel(Ssd1306::FrameBuffer &buffer, int x, int y) {
  if (x < 0 || x >= Ssd1306::WIDTH || y < 0 || y >= Ssd1306::HEIGHT) {
    return;
  }
  buffer[static_cast<size_t>(x + (y / 8) * Ssd1306::WIDTH)] |=
      static_cast<uint8_t>(1u << (y % 8));
}

} // namespace

Ssd1306::Ssd1306(hal::I2cBus &bus, uint8_t address, Logger &logger)
    : bus_(bus), logger_(logger), address_(address) {
}

Ssd1306Status Ssd1306::init() {
  const Ssd1306Status status =
      send_commands(etl::span<const uint8_t>(INIT_SEQUENCE, sizeof(INIT_SEQUENCE)));
  if (status != Ssd1306Status::OK) {
    logger_.error("SSD1306: initialisation failed");
    return status;
  }

  initialized_ = true;
  buffer_.fill(0);
  const Ssd1306Status flushed = flush();
  if (flushed != Ssd1306Status::OK) {
    initialized_ = false;
    return flushed;
  }

  logger_.info("SSD1306 initialized at address", static_cast<uint32_t>(address_));
  return Ssd1306Status::OK;
}

Ssd1306Status Ssd1306::set_contrast(uint8_t contrast) {
  if (!initialized_) {
    return Ssd1306Status::ERROR_NOT_INITIALIZED;
  }
  const uint8_t commands[] = {CMD_SET_CONTRAST, contrast};
  return send_commands(etl::span<const uint8_t>(commands, sizeof(commands)));
}

bool Ssd1306::show_text(etl::string_view text) {
  if (!initialized_) {
    return false;
  }
  render_text(text, buffer_);
  return flush() == Ssd1306Status::OK;
}

bool Ssd1306::clear() {
  if (!initialized_) {
    return false;
  }
  buffer_.fill(0);
  return flush() == Ssd1306Status::OK;
}

void Ssd1306::render_text(etl::string_view text, FrameBuffer &buffer) {
  buffer.fill(0);

  const size_t max_chars = (WIDTH + 1) / GLYPH_ADVANCE;
  const size_t length = etl::min(text.size(), max_chars);
  if (length == 0) {
    return;
  }

  int scale = MAX_SCALE;
  while (scale > 1) {
    const int width = static_cast<int>(length) * GLYPH_ADVANCE * scale - scale;
    if (width <= WIDTH && font5x7::GLYPH_HEIGHT * scale <= HEIGHT) {
      break;
    }
    --scale;
  }

  const int text_width = static_cast<int>(length) * GLYPH_ADVANCE * scale - scale;
  const int origin_x = (WIDTH - text_width) / 2;
  const int origin_y = (HEIGHT - font5x7::GLYPH_HEIGHT * scale) / 2;

  for (size_t i = 0; i < length; ++i) {
    const font5x7::Glyph &glyph = font5x7::glyph_for(text[i]);
    const int glyph_x = origin_x + static_cast<int>(i) * GLYPH_ADVANCE * scale;
    for (int column = 0; column < font5x7::GLYPH_WIDTH; ++column) {
      const uint8_t bits = glyph[static_cast<size_t>(column)];
      for (int row = 0; row < font5x7::GLYPH_HEIGHT; ++row) {
        if ((bits & (1u << row)) == 0) {
          continue;
        }
        for (int dx = 0; dx < scale; ++dx) {
          for (int dy = 0; dy < scale; ++dy) {
            set_pixel(buffer, glyph_x + column * scale + dx, origin_y + row * scale + dy);
          }
        }
      }
    }
  }
}

Ssd1306Status Ssd1306::send_commands(etl::span<const uint8_t> commands) {
  etl::vector<uint8_t, MAX_COMMAND_BYTES + 1> payload;
  payload.push_back(CONTROL_COMMAND);
  for (const uint8_t command : commands) {
    if (payload.full()) {
      logger_.error("SSD1306: command sequence too long");
      return Ssd1306Status::ERROR_I2C_WRITE_FAILED;
    }
    payload.push_back(command);
  }

  const int result = bus_.write(address_, etl::span<const uint8_t>(payload.data(), payload.size()));
  if (result != 0) {
    logger_.error("SSD1306: command write failed", etl::string_view(std::strerror(result)));
    return Ssd1306Status::ERROR_I2C_WRITE_FAILED;
  }
  return Ssd1306Status::OK;
}

Ssd1306Status Ssd1306::flush() {
  const uint8_t window[] = {CMD_COLUMN_ADDRESS, 0, WIDTH - 1, CMD_PAGE_ADDRESS, 0, PAGES - 1};
  const Ssd1306Status status = send_commands(etl::span<const uint8_t>(window, sizeof(window)));
  if (status != Ssd1306Status::OK) {
    return status;
  }

  // One transaction per page keeps each transfer small.
  etl::array<uint8_t, WIDTH + 1> page_data;
  page_data[0] = CONTROL_DATA;
  for (uint8_t page = 0; page < PAGES; ++page) {
    etl::copy_n(buffer_.begin() + page * WIDTH, WIDTH, page_data.begin() + 1);
    const int result =
        bus_.write(address_, etl::span<const uint8_t>(page_data.data(), page_data.size()));
    if (result != 0) {
      logger_.error("SSD1306: data write failed", etl::string_view(std::strerror(result)));
      return Ssd1306Status::ERROR_I2C_WRITE_FAILED;
    }
  }
  return Ssd1306Status::OK;
}

} // namespace audiokit::drivers
