#ifndef SOUNDMASTER_CONSOLE_CONTROL_SOURCE_H
#define SOUNDMASTER_CONSOLE_CONTROL_SOURCE_H

#include "audiokit/hal/logger.h"
#include "soundmaster/control_queue.h"
#include "etl/string.h"
#include "etl/string_view.h"

#include <atomic>
#include <thread>

namespace soundmaster {

/**
 * @brief Reads "<topic> <payload>" lines from a file descriptor and queues
 * the decoded control events.
 *
 * Stands in for a message-broker link: "Volume/set 42" on stdin behaves
 * like the same message arriving from the network.
 */
class ConsoleControlSource {
public:
  static constexpr size_t MAX_LINE_LENGTH = 128;
  static constexpr int POLL_TIMEOUT_MS = 200;

  ConsoleControlSource(int fd, ControlQueue &control_queue, audiokit::Logger &logger);
  ~ConsoleControlSource();

  ConsoleControlSource(const ConsoleControlSource &) = delete;
  ConsoleControlSource &operator=(const ConsoleControlSource &) = delete;

  void start();
  void stop();

  /** @return true if the line produced a queued event. */
  bool handle_line(etl::string_view line);

private:
  void run();
  void consume(const char *data, size_t length);

  int fd_;
  ControlQueue &control_queue_;
  audiokit::Logger &logger_;
  etl::string<MAX_LINE_LENGTH> line_;
  bool line_overflowed_ = false;
  std::atomic<bool> running_{false};
  std::thread thread_;
};

} // namespace soundmaster

#endif // SOUNDMASTER_CONSOLE_CONTROL_SOURCE_H
