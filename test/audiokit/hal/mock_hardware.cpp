#include "mock_hardware.h"

#include <algorithm>

namespace mock {

int FakeI2cBus::write(uint8_t address, etl::span<const uint8_t> data) {
  std::lock_guard<std::mutex> lock(mutex_);
  const size_t index = attempts_++;
  writes_.push_back(I2cWrite{address, std::vector<uint8_t>(data.begin(), data.end())});
  if (index >= fail_from_write_) {
    return error_code_;
  }
  return 0;
}

std::vector<I2cWrite> FakeI2cBus::writes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return writes_;
}

std::vector<uint8_t> FakeI2cBus::single_byte_writes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<uint8_t> bytes;
  for (const I2cWrite &write : writes_) {
    if (write.data.size() == 1) {
      bytes.push_back(write.data[0]);
    }
  }
  return bytes;
}

void FakeI2cBus::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  writes_.clear();
}

void FakeI2cBus::fail_from(size_t write_index, int error_code) {
  std::lock_guard<std::mutex> lock(mutex_);
  fail_from_write_ = attempts_ + write_index;
  error_code_ = error_code;
}

bool FakeOutput::write(bool value) {
  std::lock_guard<std::mutex> lock(mutex_);
  levels_.push_back(value);
  return true;
}

std::vector<bool> FakeOutput::levels() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return levels_;
}

size_t FakeOutput::pulse_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<size_t>(std::count(levels_.begin(), levels_.end(), true));
}

void MockTimeSource::sleep_ms(uint32_t duration_ms) {
  current_time_ms_ += duration_ms;
  total_slept_ms_ += duration_ms;
  if (sleep_hook_) {
    sleep_hook_(duration_ms);
  }
}

void RecordingLogger::log(audiokit::LogLevel level, etl::string_view message) {
  record(level, message, std::string());
}

void RecordingLogger::log(audiokit::LogLevel level, etl::string_view message,
                          std::int32_t value) {
  record(level, message, std::to_string(value));
}

void RecordingLogger::log(audiokit::LogLevel level, etl::string_view message,
                          std::uint32_t value) {
  record(level, message, std::to_string(value));
}

void RecordingLogger::log(audiokit::LogLevel level, etl::string_view message, float value) {
  record(level, message, std::to_string(value));
}

void RecordingLogger::log(audiokit::LogLevel level, etl::string_view message,
                          etl::string_view value) {
  record(level, message, std::string(value.data(), value.size()));
}

std::vector<LogEntry> RecordingLogger::entries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_;
}

size_t RecordingLogger::count(audiokit::LogLevel level) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<size_t>(std::count_if(entries_.begin(), entries_.end(),
                                           [level](const LogEntry &e) { return e.level == level; }));
}

bool RecordingLogger::contains(const std::string &message_part) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::any_of(entries_.begin(), entries_.end(), [&message_part](const LogEntry &e) {
    return e.message.find(message_part) != std::string::npos;
  });
}

void RecordingLogger::record(audiokit::LogLevel level, etl::string_view message,
                             std::string value) {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.push_back(LogEntry{level, std::string(message.data(), message.size()), std::move(value)});
}

} // namespace mock
