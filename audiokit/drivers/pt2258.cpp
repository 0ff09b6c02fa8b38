#include "pt2258.h"

#include <algorithm>
#include <cstring>

namespace audiokit::drivers {

const char *to_string(Pt2258Status status) {
  switch (status) {
  case Pt2258Status::OK:
    return "OK";
  case Pt2258Status::ERROR_INVALID_ADDRESS:
    return "invalid address";
  case Pt2258Status::ERROR_INVALID_ARG:
    return "invalid argument";
  case Pt2258Status::ERROR_I2C_WRITE_FAILED:
    return "I2C write failed";
  case Pt2258Status::ERROR_DEVICE_INIT_FAILED:
    return "device initialisation failed";
  }
  return "unknown";
}

Pt2258::Pt2258(hal::I2cBus &bus, uint8_t address, hal::TimeSource &time_source, Logger &logger)
    : bus_(bus), logger_(logger), bus_address_(static_cast<uint8_t>(address >> 1)) {
  if (!is_valid_address(address)) {
    logger_.error("PT2258: invalid address", static_cast<uint32_t>(address));
    throw Pt2258Error(Pt2258Status::ERROR_INVALID_ADDRESS,
                      "PT2258 address must be 0x80, 0x84, 0x88 or 0x8C");
  }

  time_source.sleep_ms(POWER_ON_SETTLE_MS);

  if (clear_registers() != Pt2258Status::OK) {
    throw Pt2258Error(Pt2258Status::ERROR_DEVICE_INIT_FAILED,
                      "Failed to initialize PT2258, check the I2C connection");
  }
  logger_.info("PT2258 initialized at address", static_cast<uint32_t>(address));
}

bool Pt2258::is_valid_address(uint8_t address) {
  return std::find(VALID_ADDRESSES.begin(), VALID_ADDRESSES.end(), address) !=
         VALID_ADDRESSES.end();
}

Pt2258Status Pt2258::set_master_volume(uint8_t volume) {
  if (volume > MAX_VOLUME) {
    logger_.error("PT2258: master volume out of range", static_cast<uint32_t>(volume));
    return Pt2258Status::ERROR_INVALID_ARG;
  }
  return write_volume(MASTER_VOLUME_10DB, MASTER_VOLUME_1DB, volume);
}

Pt2258Status Pt2258::set_channel_volume(uint8_t channel, uint8_t volume) {
  if (channel >= NUM_CHANNELS) {
    logger_.error("PT2258: invalid channel", static_cast<uint32_t>(channel));
    return Pt2258Status::ERROR_INVALID_ARG;
  }
  if (volume > MAX_VOLUME) {
    logger_.error("PT2258: channel volume out of range", static_cast<uint32_t>(volume));
    return Pt2258Status::ERROR_INVALID_ARG;
  }
  const ChannelRegisters &registers = CHANNEL_REGISTERS[channel];
  return write_volume(registers.step_10db, registers.step_1db, volume);
}

Pt2258Status Pt2258::set_mute(bool muted) {
  return write_command(static_cast<uint8_t>(MUTE_REGISTER | (muted ? 1 : 0)));
}

Pt2258Status Pt2258::clear_registers() {
  return write_command(CLEAR_REGISTER);
}

Pt2258Status Pt2258::write_volume(uint8_t register_10db, uint8_t register_1db,
                                  uint8_t volume) {
  const Attenuation steps = decode_attenuation(volume);
  const Pt2258Status status = write_command(static_cast<uint8_t>(register_10db | steps.tens));
  if (status != Pt2258Status::OK) {
    return status;
  }
  return write_command(static_cast<uint8_t>(register_1db | steps.ones));
}

Pt2258Status Pt2258::write_command(uint8_t command) {
  const uint8_t payload[1] = {command};
  const int result = bus_.write(bus_address_, etl::span<const uint8_t>(payload, 1));
  if (result != 0) {
    last_error_ = result;
    logger_.error("PT2258: communication error", etl::string_view(std::strerror(result)));
    return Pt2258Status::ERROR_I2C_WRITE_FAILED;
  }
  last_error_ = 0;
  return Pt2258Status::OK;
}

} // namespace audiokit::drivers
