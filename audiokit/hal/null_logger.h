#ifndef AUDIOKIT_HAL_NULL_LOGGER_H
#define AUDIOKIT_HAL_NULL_LOGGER_H

#include "logger.h"

namespace audiokit {

class NullLogger : public Logger {
public:
  void log(LogLevel, etl::string_view) override {
  }
  void log(LogLevel, etl::string_view, std::int32_t) override {
  }
  void log(LogLevel, etl::string_view, std::uint32_t) override {
  }
  void log(LogLevel, etl::string_view, float) override {
  }
  void log(LogLevel, etl::string_view, etl::string_view) override {
  }
  void set_level(LogLevel) override {
  }
  LogLevel get_level() const override {
    return LogLevel::NONE;
  }
};

} // namespace audiokit
#endif
