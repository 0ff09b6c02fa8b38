#ifndef SOUNDMASTER_SYSTEM_CONTEXT_H
#define SOUNDMASTER_SYSTEM_CONTEXT_H

#include "audiokit/hal/logger.h"
#include "audiokit/hal/time_source.h"

namespace soundmaster {

class EventDispatcher;
class ControlQueue;

/**
 * @brief Context object that holds shared resources for the control path.
 *
 * Built once in main and passed by reference; dependencies are not owned
 * by this context.
 */
class SystemContext {
public:
  SystemContext(EventDispatcher &dispatcher_ref, ControlQueue &control_queue_ref,
                audiokit::hal::TimeSource &time_source_ref, audiokit::Logger &logger_ref)
      : dispatcher(dispatcher_ref), control_queue(control_queue_ref),
        time_source(time_source_ref), logger(logger_ref) {
  }

  // Non-copyable and non-movable
  SystemContext(const SystemContext &) = delete;
  SystemContext &operator=(const SystemContext &) = delete;
  SystemContext(SystemContext &&) = delete;
  SystemContext &operator=(SystemContext &&) = delete;

  // References to shared dependencies (not owned)
  EventDispatcher &dispatcher;
  ControlQueue &control_queue;
  audiokit::hal::TimeSource &time_source;
  audiokit::Logger &logger;
};

} // namespace soundmaster

#endif // SOUNDMASTER_SYSTEM_CONTEXT_H
