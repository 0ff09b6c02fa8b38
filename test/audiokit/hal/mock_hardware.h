#ifndef MOCK_HARDWARE_H
#define MOCK_HARDWARE_H

#include "audiokit/hal/gpio.h"
#include "audiokit/hal/i2c_bus.h"
#include "audiokit/hal/logger.h"
#include "audiokit/hal/time_source.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// In-memory stand-ins for the HAL interfaces, so drivers and decoders can be
// tested without a board.

namespace mock {

struct I2cWrite {
  uint8_t address;
  std::vector<uint8_t> data;
};

// Records every transaction. fail_from_write makes that write (0-based) and
// every later one return error_code.
class FakeI2cBus : public audiokit::hal::I2cBus {
public:
  int write(uint8_t address, etl::span<const uint8_t> data) override;

  std::vector<I2cWrite> writes() const;
  std::vector<uint8_t> single_byte_writes() const;
  void clear();

  void fail_from(size_t write_index, int error_code = 5);

private:
  mutable std::mutex mutex_;
  std::vector<I2cWrite> writes_;
  size_t attempts_ = 0;
  size_t fail_from_write_ = SIZE_MAX;
  int error_code_ = 0;
};

class FakeOutput : public audiokit::hal::DigitalOutput {
public:
  bool write(bool value) override;

  std::vector<bool> levels() const;
  size_t pulse_count() const;

private:
  mutable std::mutex mutex_;
  std::vector<bool> levels_;
};

// Time only moves when sleep_ms() or advance_time() is called. The sleep hook
// runs after the clock has moved, which lets a test react to the code under
// test waiting (e.g. flip an indicator line).
class MockTimeSource : public audiokit::hal::TimeSource {
public:
  explicit MockTimeSource(uint32_t initial_time_ms = 0) : current_time_ms_(initial_time_ms) {
  }

  uint32_t get_time_ms() const override {
    return current_time_ms_.load();
  }

  void sleep_ms(uint32_t duration_ms) override;

  void advance_time(uint32_t ms) {
    current_time_ms_ += ms;
  }

  void set_sleep_hook(std::function<void(uint32_t duration_ms)> hook) {
    sleep_hook_ = std::move(hook);
  }

  uint32_t total_slept_ms() const {
    return total_slept_ms_.load();
  }

private:
  std::atomic<uint32_t> current_time_ms_;
  std::atomic<uint32_t> total_slept_ms_{0};
  std::function<void(uint32_t)> sleep_hook_;
};

struct LogEntry {
  audiokit::LogLevel level;
  std::string message;
  std::string value;
};

class RecordingLogger : public audiokit::Logger {
public:
  void log(audiokit::LogLevel level, etl::string_view message) override;
  void log(audiokit::LogLevel level, etl::string_view message, std::int32_t value) override;
  void log(audiokit::LogLevel level, etl::string_view message, std::uint32_t value) override;
  void log(audiokit::LogLevel level, etl::string_view message, float value) override;
  void log(audiokit::LogLevel level, etl::string_view message, etl::string_view value) override;

  void set_level(audiokit::LogLevel level) override {
    level_ = level;
  }
  audiokit::LogLevel get_level() const override {
    return level_;
  }

  std::vector<LogEntry> entries() const;
  size_t count(audiokit::LogLevel level) const;
  bool contains(const std::string &message_part) const;

private:
  void record(audiokit::LogLevel level, etl::string_view message, std::string value);

  mutable std::mutex mutex_;
  std::vector<LogEntry> entries_;
  audiokit::LogLevel level_ = audiokit::LogLevel::DEBUG;
};

} // namespace mock

#endif // MOCK_HARDWARE_H
