#include "soundmaster/display_queue.h"
#include "soundmaster/status_display.h"
#include "test/audiokit/hal/mock_hardware.h"
#include "test/soundmaster/test_doubles.h"
#include "test/test_support.h"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace soundmaster {

using testing::FakeTextDisplay;

TEST_CASE("StatusDisplay volume text", "[display]") {
  REQUIRE(std::string(StatusDisplay::format_volume(0).c_str()) == "Min");
  REQUIRE(std::string(StatusDisplay::format_volume(1).c_str()) == "1");
  REQUIRE(std::string(StatusDisplay::format_volume(50).c_str()) == "50");
  REQUIRE(std::string(StatusDisplay::format_volume(78).c_str()) == "78");
  REQUIRE(std::string(StatusDisplay::format_volume(79).c_str()) == "Max");
}

TEST_CASE("DisplayQueue rendering", "[display]") {
  FakeTextDisplay display;
  mock::RecordingLogger logger;
  DisplayQueue queue(display, logger, 100, 20);
  queue.start();

  SECTION("Requests render in order") {
    REQUIRE(queue.show_text("one"));
    REQUIRE(queue.show_text("two", true));
    REQUIRE(queue.wait_until_idle(1000));
    REQUIRE(display.frames() == std::vector<std::string>{"one", "two"});
  }

  SECTION("A non-persistent text is cleared automatically") {
    REQUIRE(queue.show_text("50"));
    REQUIRE(test_support::wait_until([&] { return display.clear_count() == 1; }));
    REQUIRE(display.last_frame().empty());
  }

  SECTION("A persistent text stays up") {
    REQUIRE(queue.show_text("Muted", true));
    REQUIRE(queue.wait_until_idle(1000));
    REQUIRE_FALSE(queue.is_auto_clear_pending());
    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    REQUIRE(display.clear_count() == 0);
  }

  SECTION("A new text restarts the auto-clear delay") {
    REQUIRE(queue.show_text("40"));
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    REQUIRE(queue.show_text("41"));
    REQUIRE(queue.wait_until_idle(1000));
    REQUIRE(queue.is_auto_clear_pending());
    REQUIRE(test_support::wait_until([&] { return display.clear_count() == 1; }));
    REQUIRE(display.frames() == std::vector<std::string>{"40", "41", ""});
  }

  SECTION("A text the display could not show does not arm auto-clear") {
    display.set_available(false);
    REQUIRE(queue.show_text("50"));
    REQUIRE(queue.wait_until_idle(1000));
    REQUIRE_FALSE(queue.is_auto_clear_pending());
  }

  queue.stop();
}

TEST_CASE("StatusDisplay mute handling", "[display]") {
  FakeTextDisplay display;
  mock::RecordingLogger logger;
  DisplayQueue queue(display, logger, 100, 20);
  StatusDisplay status(queue);
  queue.start();

  SECTION("Muting cancels a pending auto-clear and keeps the text up") {
    status.show_volume(30);
    REQUIRE(queue.wait_until_idle(1000));
    REQUIRE(queue.is_auto_clear_pending());

    status.show_mute(true);
    REQUIRE(queue.wait_until_idle(1000));
    REQUIRE(queue.is_muted());
    REQUIRE_FALSE(queue.is_auto_clear_pending());
    REQUIRE(display.last_frame() == StatusDisplay::MUTED_TEXT);

    std::this_thread::sleep_for(std::chrono::milliseconds(250));
    REQUIRE(display.clear_count() == 0);
  }

  SECTION("Texts shown while muted are not auto-cleared") {
    status.show_mute(true);
    status.show_input(Source::AUX);
    REQUIRE(queue.wait_until_idle(1000));
    REQUIRE_FALSE(queue.is_auto_clear_pending());
    REQUIRE_FALSE(queue.clear());
    REQUIRE(display.last_frame() == "AUX");
  }

  SECTION("Unmuting clears the display") {
    status.show_mute(true);
    status.show_mute(false);
    REQUIRE(queue.wait_until_idle(1000));
    REQUIRE_FALSE(queue.is_muted());
    REQUIRE(display.frames() == std::vector<std::string>{"Muted", ""});
  }

  queue.stop();
}

} // namespace soundmaster
