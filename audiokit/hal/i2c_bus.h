#ifndef AUDIOKIT_HAL_I2C_BUS_H
#define AUDIOKIT_HAL_I2C_BUS_H

#include "audiokit/hal/logger.h"
#include "etl/span.h"

#include <cstdint>
#include <mutex>

namespace audiokit::hal {

/**
 * @brief Write-only view of an I2C bus.
 *
 * Each call is one bus transaction: start, 7-bit address, payload, stop.
 */
class I2cBus {
public:
  virtual ~I2cBus() = default;

  /**
   * @brief Write a payload to a device.
   * @param address 7-bit device address.
   * @param data Bytes to send in a single transaction.
   * @return 0 on success, otherwise the errno describing the failure.
   */
  virtual int write(uint8_t address, etl::span<const uint8_t> data) = 0;
};

/**
 * @brief I2C bus on a Linux i2c-dev character device (e.g. /dev/i2c-0).
 *
 * Transfers go through I2C_RDWR so the address and payload form one atomic
 * message. Calls from several threads are serialised.
 */
class LinuxI2cBus : public I2cBus {
public:
  LinuxI2cBus(const char *device_path, Logger &logger);
  ~LinuxI2cBus() override;

  LinuxI2cBus(const LinuxI2cBus &) = delete;
  LinuxI2cBus &operator=(const LinuxI2cBus &) = delete;
  LinuxI2cBus(LinuxI2cBus &&) = delete;
  LinuxI2cBus &operator=(LinuxI2cBus &&) = delete;

  bool is_open() const {
    return fd_ >= 0;
  }

  int write(uint8_t address, etl::span<const uint8_t> data) override;

private:
  int fd_ = -1;
  std::mutex bus_mutex_;
  Logger &logger_;
};

} // namespace audiokit::hal

#endif // AUDIOKIT_HAL_I2C_BUS_H
