#include "audiokit/drivers/pt2258.h"
#include "audiokit/hal/null_logger.h"
#include "test/audiokit/hal/mock_hardware.h"
#include "test/test_support.h"

#include <vector>

using audiokit::drivers::Attenuation;
using audiokit::drivers::decode_attenuation;
using audiokit::drivers::Pt2258;
using audiokit::drivers::Pt2258Error;
using audiokit::drivers::Pt2258Status;

TEST_CASE("decode_attenuation splits into 10 dB and 1 dB steps", "[pt2258]") {
  for (uint8_t volume = 0; volume <= Pt2258::MAX_VOLUME; ++volume) {
    const Attenuation steps = decode_attenuation(volume);
    REQUIRE(steps.tens <= 7);
    REQUIRE(steps.ones <= 9);
    REQUIRE(steps.tens * 10 + steps.ones == 79 - volume);
  }

  SECTION("Edges of the range") {
    REQUIRE(decode_attenuation(79).tens == 0);
    REQUIRE(decode_attenuation(79).ones == 0);
    REQUIRE(decode_attenuation(0).tens == 7);
    REQUIRE(decode_attenuation(0).ones == 9);
  }
}

TEST_CASE("Pt2258 construction", "[pt2258]") {
  mock::FakeI2cBus bus;
  mock::MockTimeSource time_source;
  audiokit::NullLogger logger;

  SECTION("Valid address waits for power-on and clears registers") {
    Pt2258 attenuator(bus, 0x88, time_source, logger);

    REQUIRE(time_source.total_slept_ms() >= Pt2258::POWER_ON_SETTLE_MS);
    REQUIRE(attenuator.bus_address() == 0x44);
    const auto writes = bus.writes();
    REQUIRE(writes.size() == 1);
    REQUIRE(writes[0].address == 0x44);
    REQUIRE(writes[0].data == std::vector<uint8_t>{0xC0});
  }

  SECTION("Invalid address throws before touching the bus") {
    REQUIRE_THROWS_AS(Pt2258(bus, 0x42, time_source, logger), Pt2258Error);
    REQUIRE(bus.writes().empty());
  }

  SECTION("A chip that does not acknowledge throws") {
    bus.fail_from(0);
    try {
      Pt2258 attenuator(bus, 0x80, time_source, logger);
      FAIL("Expected Pt2258Error");
    } catch (const Pt2258Error &e) {
      REQUIRE(e.status() == Pt2258Status::ERROR_DEVICE_INIT_FAILED);
    }
  }
}

TEST_CASE("Pt2258 command encoding", "[pt2258]") {
  mock::FakeI2cBus bus;
  mock::MockTimeSource time_source;
  audiokit::NullLogger logger;
  Pt2258 attenuator(bus, 0x8C, time_source, logger);
  bus.clear();

  SECTION("Master volume") {
    REQUIRE(attenuator.set_master_volume(50) == Pt2258Status::OK);
    REQUIRE(bus.single_byte_writes() == std::vector<uint8_t>{0xD2, 0xE9});
  }

  SECTION("Master volume at full level sends zero attenuation") {
    REQUIRE(attenuator.set_master_volume(79) == Pt2258Status::OK);
    REQUIRE(bus.single_byte_writes() == std::vector<uint8_t>{0xD0, 0xE0});
  }

  SECTION("Channel registers follow the pin order") {
    const std::vector<std::vector<uint8_t>> expected = {
        {0x87, 0x99}, {0x47, 0x59}, {0x07, 0x19}, {0x27, 0x39}, {0x67, 0x79}, {0xA7, 0xB9},
    };
    for (uint8_t channel = 0; channel < Pt2258::NUM_CHANNELS; ++channel) {
      bus.clear();
      REQUIRE(attenuator.set_channel_volume(channel, 0) == Pt2258Status::OK);
      REQUIRE(bus.single_byte_writes() == expected[channel]);
    }
  }

  SECTION("Mute") {
    REQUIRE(attenuator.set_mute(true) == Pt2258Status::OK);
    REQUIRE(attenuator.set_mute(false) == Pt2258Status::OK);
    REQUIRE(bus.single_byte_writes() == std::vector<uint8_t>{0xF9, 0xF8});
  }

  SECTION("Out of range arguments are rejected without a write") {
    REQUIRE(attenuator.set_master_volume(80) == Pt2258Status::ERROR_INVALID_ARG);
    REQUIRE(attenuator.set_channel_volume(6, 10) == Pt2258Status::ERROR_INVALID_ARG);
    REQUIRE(attenuator.set_channel_volume(0, 200) == Pt2258Status::ERROR_INVALID_ARG);
    REQUIRE(bus.writes().empty());
  }

  SECTION("A failed 10 dB write skips the 1 dB write") {
    bus.fail_from(0, 121);
    REQUIRE(attenuator.set_master_volume(40) == Pt2258Status::ERROR_I2C_WRITE_FAILED);
    REQUIRE(bus.writes().size() == 1);
    REQUIRE(attenuator.last_error() == 121);
  }
}
