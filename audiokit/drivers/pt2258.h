#ifndef AUDIOKIT_DRIVERS_PT2258_H
#define AUDIOKIT_DRIVERS_PT2258_H

#include "audiokit/hal/i2c_bus.h"
#include "audiokit/hal/logger.h"
#include "audiokit/hal/time_source.h"
#include "etl/array.h"

#include <cstdint>
#include <stdexcept>

namespace audiokit::drivers {

/**
 * @brief Status codes for PT2258 operations.
 */
enum class Pt2258Status {
  OK = 0,
  ERROR_INVALID_ADDRESS,
  ERROR_INVALID_ARG,
  ERROR_I2C_WRITE_FAILED,
  ERROR_DEVICE_INIT_FAILED,
};

const char *to_string(Pt2258Status status);

/**
 * @brief Thrown when the PT2258 cannot be brought up.
 */
class Pt2258Error : public std::runtime_error {
public:
  Pt2258Error(Pt2258Status status, const char *what)
      : std::runtime_error(what), status_(status) {
  }

  Pt2258Status status() const {
    return status_;
  }

private:
  Pt2258Status status_;
};

/**
 * @brief Split of an attenuation into the chip's 10 dB and 1 dB steps.
 */
struct Attenuation {
  uint8_t tens; // 0..7
  uint8_t ones; // 0..9
};

/**
 * @brief Attenuation steps for a volume level (0 = -79 dB, 79 = 0 dB).
 *
 * Only meaningful for volume <= Pt2258::MAX_VOLUME.
 */
constexpr Attenuation decode_attenuation(uint8_t volume) {
  const uint8_t attenuation = static_cast<uint8_t>(79 - volume);
  return Attenuation{static_cast<uint8_t>(attenuation / 10),
                     static_cast<uint8_t>(attenuation % 10)};
}

/**
 * @brief Driver for the PT2258 6-channel electronic volume controller.
 *
 * The chip is write-only: every command is one byte sent to the device in
 * its own bus transaction. Volumes are levels in [0, 79] where 79 is no
 * attenuation; they are sent as a 10 dB step command followed by a 1 dB
 * step command, and the second write is skipped if the first one fails.
 *
 * Construction waits for the chip's power-on settling time and clears its
 * registers; it throws Pt2258Error for an address that is not one of the
 * four strap values or when the chip does not acknowledge.
 */
class Pt2258 {
public:
  static constexpr uint8_t MAX_VOLUME = 79;
  static constexpr uint8_t NUM_CHANNELS = 6;
  static constexpr uint32_t POWER_ON_SETTLE_MS = 300;
  static constexpr etl::array<uint8_t, 4> VALID_ADDRESSES = {0x80, 0x84, 0x88, 0x8C};

  /**
   * @param bus Bus the chip sits on.
   * @param address 8-bit address as set by the CODE1/CODE2 straps.
   * @param time_source Used for the power-on settle delay.
   * @throws Pt2258Error on invalid address or failed initialisation.
   */
  Pt2258(hal::I2cBus &bus, uint8_t address, hal::TimeSource &time_source, Logger &logger);

  Pt2258(const Pt2258 &) = delete;
  Pt2258 &operator=(const Pt2258 &) = delete;
  Pt2258(Pt2258 &&) = delete;
  Pt2258 &operator=(Pt2258 &&) = delete;

  static bool is_valid_address(uint8_t address);

  [[nodiscard]] Pt2258Status set_master_volume(uint8_t volume);
  [[nodiscard]] Pt2258Status set_channel_volume(uint8_t channel, uint8_t volume);
  [[nodiscard]] Pt2258Status set_mute(bool muted);
  [[nodiscard]] Pt2258Status clear_registers();

  /** @brief 7-bit address used on the bus. */
  uint8_t bus_address() const {
    return bus_address_;
  }

  /** @brief errno of the most recent failed bus write, 0 if none. */
  int last_error() const {
    return last_error_;
  }

private:
  static constexpr uint8_t CLEAR_REGISTER = 0xC0;
  static constexpr uint8_t MUTE_REGISTER = 0xF8;
  static constexpr uint8_t MASTER_VOLUME_10DB = 0xD0;
  static constexpr uint8_t MASTER_VOLUME_1DB = 0xE0;

  struct ChannelRegisters {
    uint8_t step_10db;
    uint8_t step_1db;
  };

  // Channel order follows the chip's pin numbering, not the opcode order.
  static constexpr etl::array<ChannelRegisters, NUM_CHANNELS> CHANNEL_REGISTERS = {{
      {0x80, 0x90},
      {0x40, 0x50},
      {0x00, 0x10},
      {0x20, 0x30},
      {0x60, 0x70},
      {0xA0, 0xB0},
  }};

  Pt2258Status write_volume(uint8_t register_10db, uint8_t register_1db, uint8_t volume);
  Pt2258Status write_command(uint8_t command);

  hal::I2cBus &bus_;
  Logger &logger_;
  uint8_t bus_address_;
  int last_error_ = 0;
};

} // namespace audiokit::drivers

#endif // AUDIOKIT_DRIVERS_PT2258_H
