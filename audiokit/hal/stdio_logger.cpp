#include "stdio_logger.h"

#include <ctime>

namespace audiokit {

const char *StdioLogger::level_to_string(LogLevel level) const {
  switch (level) {
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO ";
  case LogLevel::WARN:
    return "WARN ";
  case LogLevel::ERROR:
    return "ERROR";
  default:
    return "UNKN ";
  }
}

bool StdioLogger::should_log(LogLevel level) const {
  return level >= current_level_.load() && level != LogLevel::NONE;
}

// Caller holds stream_mutex_.
void StdioLogger::write_prefix(LogLevel level) {
  std::time_t now = std::time(nullptr);
  std::tm local_time{};
  localtime_r(&now, &local_time);
  char time_text[16];
  if (std::strftime(time_text, sizeof(time_text), "%H:%M:%S", &local_time) == 0) {
    time_text[0] = '\0';
  }
  std::fprintf(stream_, "[%s] [%s] ", time_text, level_to_string(level));
}

StdioLogger::StdioLogger(LogLevel level, std::FILE *stream)
    : current_level_(level), stream_(stream) {
}

void StdioLogger::log(LogLevel level, etl::string_view message) {
  if (!should_log(level)) {
    return;
  }
  std::lock_guard<std::mutex> lock(stream_mutex_);
  write_prefix(level);
  std::fprintf(stream_, "%.*s\n", static_cast<int>(message.size()), message.data());
  std::fflush(stream_);
}

void StdioLogger::log(LogLevel level, etl::string_view message, std::int32_t value) {
  if (!should_log(level)) {
    return;
  }
  std::lock_guard<std::mutex> lock(stream_mutex_);
  write_prefix(level);
  std::fprintf(stream_, "%.*s: %ld\n", static_cast<int>(message.size()), message.data(),
               static_cast<long>(value));
  std::fflush(stream_);
}

void StdioLogger::log(LogLevel level, etl::string_view message, std::uint32_t value) {
  if (!should_log(level)) {
    return;
  }
  std::lock_guard<std::mutex> lock(stream_mutex_);
  write_prefix(level);
  std::fprintf(stream_, "%.*s: %lu\n", static_cast<int>(message.size()), message.data(),
               static_cast<unsigned long>(value));
  std::fflush(stream_);
}

void StdioLogger::log(LogLevel level, etl::string_view message, float value) {
  if (!should_log(level)) {
    return;
  }
  std::lock_guard<std::mutex> lock(stream_mutex_);
  write_prefix(level);
  std::fprintf(stream_, "%.*s: %.2f\n", static_cast<int>(message.size()), message.data(),
               static_cast<double>(value));
  std::fflush(stream_);
}

void StdioLogger::log(LogLevel level, etl::string_view message, etl::string_view value) {
  if (!should_log(level)) {
    return;
  }
  std::lock_guard<std::mutex> lock(stream_mutex_);
  write_prefix(level);
  std::fprintf(stream_, "%.*s: %.*s\n", static_cast<int>(message.size()), message.data(),
               static_cast<int>(value.size()), value.data());
  std::fflush(stream_);
}

void StdioLogger::set_level(LogLevel level) {
  current_level_ = level;
}

LogLevel StdioLogger::get_level() const {
  return current_level_.load();
}

} // namespace audiokit
