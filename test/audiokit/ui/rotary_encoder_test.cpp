#include "audiokit/ui/encoder_acceleration.h"
#include "audiokit/ui/rotary_encoder.h"
#include "test/audiokit/hal/mock_hardware.h"
#include "test/test_support.h"

#include <etl/observer.h>
#include <vector>

using audiokit::ui::EncoderAcceleration;
using audiokit::ui::EncoderEvent;
using audiokit::ui::RotaryEncoder;

namespace {

struct EncoderEventRecorder : etl::observer<EncoderEvent> {
  std::vector<EncoderEvent> events;
  void notification(EncoderEvent e) override {
    events.push_back(e);
  }
};

// Pattern bit 1 is the left line, bit 0 the right line.
void feed_patterns(RotaryEncoder &encoder, const std::vector<uint8_t> &patterns,
                   uint32_t now_ms = 0) {
  for (const uint8_t pattern : patterns) {
    encoder.on_rotation_levels((pattern & 0x2) != 0, (pattern & 0x1) != 0, now_ms++);
  }
}

} // namespace

TEST_CASE("RotaryEncoder rotation decoding", "[encoder]") {
  mock::RecordingLogger logger;
  RotaryEncoder encoder(logger);
  EncoderEventRecorder recorder;
  encoder.add_observer(recorder);

  SECTION("Left line leading gives one positive tick") {
    feed_patterns(encoder, {0, 2, 3, 0});
    REQUIRE(recorder.events.size() == 1);
    REQUIRE(recorder.events[0].type == EncoderEvent::Type::Rotation);
    REQUIRE(recorder.events[0].direction == 1);
  }

  SECTION("Right line leading gives one negative tick") {
    feed_patterns(encoder, {0, 1, 3, 0});
    REQUIRE(recorder.events.size() == 1);
    REQUIRE(recorder.events[0].direction == -1);
  }

  SECTION("Repeated patterns are bounce") {
    feed_patterns(encoder, {2, 2, 2, 3, 3, 0, 0});
    REQUIRE(recorder.events.size() == 1);
  }

  SECTION("Wobbling around the detent does not double count") {
    feed_patterns(encoder, {2, 3, 2, 3, 0});
    REQUIRE(recorder.events.size() == 1);
  }

  SECTION("Returning to rest before the detent emits nothing") {
    feed_patterns(encoder, {2, 0, 1, 0});
    REQUIRE(recorder.events.empty());
    REQUIRE(encoder.latched_direction() == 0);
  }

  SECTION("Consecutive detents") {
    feed_patterns(encoder, {2, 3, 0, 2, 3, 0, 1, 3, 0});
    REQUIRE(recorder.events.size() == 3);
    REQUIRE(recorder.events[0].direction == 1);
    REQUIRE(recorder.events[1].direction == 1);
    REQUIRE(recorder.events[2].direction == -1);
  }

  SECTION("Timestamp is the sample time") {
    encoder.on_rotation_levels(true, false, 100);
    encoder.on_rotation_levels(true, true, 140);
    REQUIRE(recorder.events.size() == 1);
    REQUIRE(recorder.events[0].timestamp_ms == 140);
  }
}

TEST_CASE("RotaryEncoder press classification", "[encoder]") {
  mock::RecordingLogger logger;
  RotaryEncoder encoder(logger);
  EncoderEventRecorder recorder;
  encoder.add_observer(recorder);

  const uint32_t pressed_at = 1000;

  SECTION("Short press") {
    encoder.on_key_level(false, pressed_at);
    encoder.on_key_level(true, pressed_at + 500);
    REQUIRE(recorder.events.size() == 1);
    REQUIRE(recorder.events[0].type == EncoderEvent::Type::ShortPress);
  }

  SECTION("Long press") {
    encoder.on_key_level(false, pressed_at);
    encoder.on_key_level(true, pressed_at + 5000);
    REQUIRE(recorder.events.size() == 1);
    REQUIRE(recorder.events[0].type == EncoderEvent::Type::LongPress);
  }

  SECTION("Very long press emits nothing") {
    encoder.on_key_level(false, pressed_at);
    encoder.on_key_level(true, pressed_at + 20000);
    REQUIRE(recorder.events.empty());
    REQUIRE_FALSE(encoder.is_pressed());
  }

  SECTION("Boundaries") {
    encoder.on_key_level(false, pressed_at);
    encoder.on_key_level(true, pressed_at + RotaryEncoder::SHORT_PRESS_MAX_MS);
    encoder.on_key_level(false, 20000);
    encoder.on_key_level(true, 20000 + RotaryEncoder::LONG_PRESS_MAX_MS);
    REQUIRE(recorder.events.size() == 1);
    REQUIRE(recorder.events[0].type == EncoderEvent::Type::LongPress);
  }

  SECTION("Pressing emits nothing until release") {
    encoder.on_key_level(false, pressed_at);
    REQUIRE(encoder.is_pressed());
    REQUIRE(recorder.events.empty());
  }

  SECTION("A repeated level is logged and ignored") {
    encoder.on_key_level(false, pressed_at);
    encoder.on_key_level(false, pressed_at + 100);
    encoder.on_key_level(true, pressed_at + 300);
    REQUIRE(logger.contains("same key event repeated"));
    REQUIRE(recorder.events.size() == 1);
    REQUIRE(recorder.events[0].type == EncoderEvent::Type::ShortPress);
  }
}

TEST_CASE("EncoderAcceleration", "[encoder]") {
  EncoderAcceleration acceleration;

  SECTION("First tick is unscaled") {
    REQUIRE(acceleration.apply(1, 1000) == 1);
  }

  SECTION("Fast ticks in the same direction are multiplied") {
    REQUIRE(acceleration.apply(1, 1000) == 1);
    REQUIRE(acceleration.apply(1, 1050) == 10);
  }

  SECTION("Slow ticks are unchanged") {
    REQUIRE(acceleration.apply(-1, 1000) == -1);
    REQUIRE(acceleration.apply(-1, 1500) == -1);
  }

  SECTION("Table rows apply in order") {
    uint32_t now = 0;
    acceleration.apply(1, now);
    REQUIRE(acceleration.apply(1, now += 110) == 5);
    REQUIRE(acceleration.apply(1, now += 140) == 4);
    REQUIRE(acceleration.apply(1, now += 199) == 3);
    REQUIRE(acceleration.apply(1, now += 250) == 2);
    REQUIRE(acceleration.apply(1, now += 300) == 1);
  }

  SECTION("A direction change resets the multiplier") {
    acceleration.apply(1, 1000);
    REQUIRE(acceleration.apply(-1, 1020) == -1);
    REQUIRE(acceleration.apply(-1, 1040) == -10);
  }

  SECTION("reset forgets the previous tick") {
    acceleration.apply(1, 1000);
    acceleration.reset();
    REQUIRE(acceleration.apply(1, 1010) == 1);
  }
}
