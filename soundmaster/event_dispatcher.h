#ifndef SOUNDMASTER_EVENT_DISPATCHER_H
#define SOUNDMASTER_EVENT_DISPATCHER_H

#include "audiokit/hal/logger.h"
#include "soundmaster/config.h"
#include "soundmaster/events.h"
#include "etl/array.h"
#include "etl/delegate.h"
#include "etl/vector.h"

namespace soundmaster {

/**
 * @brief Typed publish/subscribe registry.
 *
 * Subscribers are kept per event type in registration order and called
 * synchronously on the publishing thread. A subscriber that throws is
 * logged and the remaining subscribers still run. Each publish delivers to
 * the subscriber list as it was when the publish started, so callbacks may
 * subscribe or unsubscribe freely.
 *
 * Not thread safe: all calls come from the control thread.
 */
class EventDispatcher {
public:
  using Subscriber = etl::delegate<void(const Event &)>;
  using SubscriberList = etl::vector<Subscriber, config::MAX_SUBSCRIBERS_PER_EVENT>;

  explicit EventDispatcher(audiokit::Logger &logger);

  EventDispatcher(const EventDispatcher &) = delete;
  EventDispatcher &operator=(const EventDispatcher &) = delete;

  /**
   * @return false if the list for this type is full or the callback is not
   * valid.
   */
  bool subscribe(EventType type, Subscriber subscriber);

  /** @return false if the callback was not subscribed to this type. */
  bool unsubscribe(EventType type, Subscriber subscriber);

  void publish(const Event &event);

  size_t subscriber_count(EventType type) const;

private:
  etl::array<SubscriberList, NUM_EVENT_TYPES> subscribers_;
  audiokit::Logger &logger_;
};

} // namespace soundmaster

#endif // SOUNDMASTER_EVENT_DISPATCHER_H
