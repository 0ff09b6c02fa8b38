#include "audiokit/drivers/ssd1306.h"
#include "audiokit/hal/null_logger.h"
#include "test/audiokit/hal/mock_hardware.h"
#include "test/test_support.h"

#include <algorithm>

using audiokit::drivers::Ssd1306;
using audiokit::drivers::Ssd1306Status;

namespace {

bool column_is_blank(const Ssd1306::FrameBuffer &buffer, int x) {
  for (int page = 0; page < Ssd1306::PAGES; ++page) {
    if (buffer[static_cast<size_t>(x + page * Ssd1306::WIDTH)] != 0) {
      return false;
    }
  }
  return true;
}

} // namespace

TEST_CASE("Ssd1306 before init", "[ssd1306]") {
  mock::FakeI2cBus bus;
  audiokit::NullLogger logger;
  Ssd1306 display(bus, 0x3C, logger);

  REQUIRE_FALSE(display.is_initialized());
  REQUIRE_FALSE(display.show_text("50"));
  REQUIRE_FALSE(display.clear());
  REQUIRE(display.set_contrast(10) == Ssd1306Status::ERROR_NOT_INITIALIZED);
  REQUIRE(bus.writes().empty());
}

TEST_CASE("Ssd1306 init and flush", "[ssd1306]") {
  mock::FakeI2cBus bus;
  audiokit::NullLogger logger;
  Ssd1306 display(bus, 0x3C, logger);

  SECTION("Init sends commands then a blank frame") {
    REQUIRE(display.init() == Ssd1306Status::OK);
    REQUIRE(display.is_initialized());

    const auto writes = bus.writes();
    // Init sequence, address window, four pages.
    REQUIRE(writes.size() == 6);
    REQUIRE(writes[0].address == 0x3C);
    REQUIRE(writes[0].data.front() == 0x00);
    REQUIRE(writes[0].data.back() == 0xAF);
    for (size_t page = 2; page < 6; ++page) {
      REQUIRE(writes[page].data.size() == Ssd1306::WIDTH + 1);
      REQUIRE(writes[page].data[0] == 0x40);
      REQUIRE(std::all_of(writes[page].data.begin() + 1, writes[page].data.end(),
                          [](uint8_t b) { return b == 0; }));
    }
  }

  SECTION("A failed init leaves the display unusable") {
    bus.fail_from(0);
    REQUIRE(display.init() == Ssd1306Status::ERROR_I2C_WRITE_FAILED);
    REQUIRE_FALSE(display.is_initialized());
    REQUIRE_FALSE(display.show_text("Max"));
  }

  SECTION("show_text writes a full frame") {
    REQUIRE(display.init() == Ssd1306Status::OK);
    bus.clear();
    REQUIRE(display.show_text("OPi"));
    REQUIRE(bus.writes().size() == 5);
    REQUIRE_FALSE(std::all_of(display.frame_buffer().begin(), display.frame_buffer().end(),
                              [](uint8_t b) { return b == 0; }));
  }
}

TEST_CASE("Ssd1306 text rendering", "[ssd1306]") {
  Ssd1306::FrameBuffer buffer{};

  SECTION("Empty text renders a blank frame") {
    buffer.fill(0xFF);
    Ssd1306::render_text("", buffer);
    REQUIRE(std::all_of(buffer.begin(), buffer.end(), [](uint8_t b) { return b == 0; }));
  }

  SECTION("Short text is scaled up and centred") {
    Ssd1306::render_text("Max", buffer);
    // Three glyphs at scale 4 span 68 columns starting at column 30.
    REQUIRE(column_is_blank(buffer, 29));
    REQUIRE(column_is_blank(buffer, 98));
    bool any_lit = false;
    for (int x = 30; x < 98; ++x) {
      any_lit = any_lit || !column_is_blank(buffer, x);
    }
    REQUIRE(any_lit);
  }

  SECTION("Text longer than one line is truncated") {
    Ssd1306::FrameBuffer truncated{};
    Ssd1306::render_text("ABCDEFGHIJKLMNOPQRSTUVWXYZ", buffer);
    Ssd1306::render_text("ABCDEFGHIJKLMNOPQRSTU", truncated);
    REQUIRE(buffer == truncated);
  }
}
