#include "soundmaster/event_dispatcher.h"

#include "etl/algorithm.h"

#include <exception>

namespace soundmaster {

namespace {
size_t index_of(EventType type) {
  return static_cast<size_t>(type);
}
} // namespace

EventDispatcher::EventDispatcher(audiokit::Logger &logger) : logger_(logger) {
}

bool EventDispatcher::subscribe(EventType type, Subscriber subscriber) {
  if (!subscriber.is_valid()) {
    logger_.error("Dispatcher: invalid subscriber for", etl::string_view(to_string(type)));
    return false;
  }

  SubscriberList &list = subscribers_[index_of(type)];
  if (list.full()) {
    logger_.error("Dispatcher: subscriber list full for", etl::string_view(to_string(type)));
    return false;
  }
  list.push_back(subscriber);
  return true;
}

bool EventDispatcher::unsubscribe(EventType type, Subscriber subscriber) {
  SubscriberList &list = subscribers_[index_of(type)];
  auto it = etl::find(list.begin(), list.end(), subscriber);
  if (it == list.end()) {
    return false;
  }
  list.erase(it);
  return true;
}

void EventDispatcher::publish(const Event &event) {
  const EventType type = type_of(event);

  // Snapshot, so callbacks can change the registry mid-delivery.
  const SubscriberList snapshot = subscribers_[index_of(type)];

  for (const Subscriber &subscriber : snapshot) {
    try {
      subscriber(event);
    } catch (const std::exception &e) {
      logger_.error("Dispatcher: subscriber failed", etl::string_view(e.what()));
    } catch (...) {
      logger_.error("Dispatcher: subscriber failed", etl::string_view("unknown exception"));
    }
  }
}

size_t EventDispatcher::subscriber_count(EventType type) const {
  return subscribers_[index_of(type)].size();
}

} // namespace soundmaster
