#include "i2c_bus.h"

#include <cerrno>
#include <cstring>

extern "C" {
#include <fcntl.h>
#include <linux/i2c-dev.h>
#include <linux/i2c.h>
#include <sys/ioctl.h>
#include <unistd.h>
}

namespace audiokit::hal {

LinuxI2cBus::LinuxI2cBus(const char *device_path, Logger &logger) : logger_(logger) {
  fd_ = ::open(device_path, O_RDWR | O_CLOEXEC);
  if (fd_ < 0) {
    logger_.error("Failed to open I2C device", etl::string_view(device_path));
    logger_.error("open() failed", etl::string_view(std::strerror(errno)));
    return;
  }
  logger_.debug("Opened I2C device", etl::string_view(device_path));
}

LinuxI2cBus::~LinuxI2cBus() {
  if (fd_ >= 0) {
    ::close(fd_);
  }
}

int LinuxI2cBus::write(uint8_t address, etl::span<const uint8_t> data) {
  if (fd_ < 0) {
    return ENODEV;
  }

  i2c_msg message{};
  message.addr = address;
  message.flags = 0;
  message.len = static_cast<__u16>(data.size());
  // The kernel only reads from buf for a write message.
  message.buf = const_cast<__u8 *>(data.data());

  i2c_rdwr_ioctl_data transfer{};
  transfer.msgs = &message;
  transfer.nmsgs = 1;

  std::lock_guard<std::mutex> lock(bus_mutex_);
  if (::ioctl(fd_, I2C_RDWR, &transfer) < 0) {
    return errno;
  }
  return 0;
}

} // namespace audiokit::hal
