#ifndef AUDIOKIT_HAL_STDIO_LOGGER_H
#define AUDIOKIT_HAL_STDIO_LOGGER_H

#include "logger.h"

#include <atomic>
#include <cstdio>
#include <mutex>

namespace audiokit {

/**
 * @brief Logger writing one line per message to a stdio stream.
 *
 * Lines are prefixed with the local wall-clock time and the level. Output
 * from several threads is serialised so lines never interleave.
 */
class StdioLogger : public Logger {
private:
  std::atomic<LogLevel> current_level_;
  std::FILE *stream_;
  std::mutex stream_mutex_;

  const char *level_to_string(LogLevel level) const;
  bool should_log(LogLevel level) const;
  void write_prefix(LogLevel level);

public:
  explicit StdioLogger(LogLevel level = LogLevel::INFO, std::FILE *stream = stdout);

  void log(LogLevel level, etl::string_view message) override;
  void log(LogLevel level, etl::string_view message, std::int32_t value) override;
  void log(LogLevel level, etl::string_view message, std::uint32_t value) override;
  void log(LogLevel level, etl::string_view message, float value) override;
  void log(LogLevel level, etl::string_view message, etl::string_view value) override;

  void set_level(LogLevel level) override;
  LogLevel get_level() const override;
};

} // namespace audiokit
#endif
