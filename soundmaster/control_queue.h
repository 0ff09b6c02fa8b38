#ifndef SOUNDMASTER_CONTROL_QUEUE_H
#define SOUNDMASTER_CONTROL_QUEUE_H

#include "audiokit/hal/logger.h"
#include "soundmaster/config.h"
#include "soundmaster/events.h"
#include "etl/queue.h"
#include "etl/variant.h"

#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace soundmaster {

enum class PinGroup : uint8_t {
  ENCODER_ROTATION, // bit 0 = left, bit 1 = right
  ENCODER_KEY,      // bit 0 = key line level
  INPUT_INDICATORS, // bit i = indicator line i
};

/**
 * @brief Levels of one GPIO line group, sampled after an edge.
 */
struct RawPinSample {
  PinGroup group;
  uint32_t levels;
  uint32_t timestamp_ms;
};

using ControlItem = etl::variant<RawPinSample, Event>;

/**
 * @brief Bounded multi-producer queue feeding the control thread.
 *
 * A full queue drops the new item with a warning rather than blocking the
 * producer.
 */
class ControlQueue {
public:
  explicit ControlQueue(audiokit::Logger &logger);

  ControlQueue(const ControlQueue &) = delete;
  ControlQueue &operator=(const ControlQueue &) = delete;

  bool push(const ControlItem &item);

  bool push_event(const Event &event) {
    return push(ControlItem(etl::in_place_index_t<1>(), event));
  }

  bool push_sample(const RawPinSample &sample) {
    return push(ControlItem(etl::in_place_index_t<0>(), sample));
  }

  /**
   * @brief Wait up to timeout_ms for an item.
   * @return false on timeout or once the queue is closed and empty.
   */
  bool pop(ControlItem &item, uint32_t timeout_ms);

  /** @brief Wake all waiters and reject further pushes. */
  void close();

  bool is_closed() const;
  size_t size() const;

private:
  etl::queue<ControlItem, config::CONTROL_QUEUE_SIZE> queue_;
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  bool closed_ = false;
  audiokit::Logger &logger_;
};

} // namespace soundmaster

#endif // SOUNDMASTER_CONTROL_QUEUE_H
