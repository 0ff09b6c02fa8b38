#include "time_source.h"

#include <chrono>
#include <thread>

namespace audiokit::hal {

uint32_t SteadyTimeSource::get_time_ms() const {
  const auto since_epoch = std::chrono::steady_clock::now().time_since_epoch();
  return static_cast<uint32_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count());
}

void SteadyTimeSource::sleep_ms(uint32_t duration_ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(duration_ms));
}

} // namespace audiokit::hal
