#ifndef SOUNDMASTER_TEST_DOUBLES_H
#define SOUNDMASTER_TEST_DOUBLES_H

#include "audiokit/ui/text_display.h"
#include "soundmaster/status_publisher.h"

#include <algorithm>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace soundmaster::testing {

// Records what the display worker rendered. An empty string is a clear.
class FakeTextDisplay : public audiokit::ui::TextDisplay {
public:
  bool show_text(etl::string_view text) override {
    std::lock_guard<std::mutex> lock(mutex_);
    frames_.emplace_back(text.data(), text.size());
    return available_;
  }

  bool clear() override {
    std::lock_guard<std::mutex> lock(mutex_);
    frames_.emplace_back();
    return available_;
  }

  void set_available(bool available) {
    std::lock_guard<std::mutex> lock(mutex_);
    available_ = available;
  }

  std::vector<std::string> frames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_;
  }

  std::string last_frame() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.empty() ? std::string("<none>") : frames_.back();
  }

  size_t clear_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count(frames_.begin(), frames_.end(), std::string()));
  }

private:
  mutable std::mutex mutex_;
  std::vector<std::string> frames_;
  bool available_ = true;
};

class RecordingStatusPublisher : public StatusPublisher {
public:
  using Message = std::pair<std::string, std::string>;

  void publish(etl::string_view topic, etl::string_view payload) override {
    messages.emplace_back(std::string(topic.data(), topic.size()),
                          std::string(payload.data(), payload.size()));
  }

  std::vector<std::string> payloads_for(const std::string &topic) const {
    std::vector<std::string> payloads;
    for (const Message &message : messages) {
      if (message.first == topic) {
        payloads.push_back(message.second);
      }
    }
    return payloads;
  }

  std::vector<Message> messages;
};

} // namespace soundmaster::testing

#endif // SOUNDMASTER_TEST_DOUBLES_H
