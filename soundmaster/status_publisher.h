#ifndef SOUNDMASTER_STATUS_PUBLISHER_H
#define SOUNDMASTER_STATUS_PUBLISHER_H

#include "audiokit/hal/logger.h"
#include "soundmaster/audio_settings.h"
#include "soundmaster/config.h"
#include "etl/string.h"
#include "etl/string_view.h"

namespace soundmaster {

using TopicString = etl::string<config::topics::MAX_TOPIC_LENGTH>;
using PayloadString = etl::string<config::topics::MAX_PAYLOAD_LENGTH>;

/**
 * @brief Outbound side of the remote-control link.
 *
 * Topics are relative to the main topic (config::topics).
 */
class StatusPublisher {
public:
  virtual ~StatusPublisher() = default;
  virtual void publish(etl::string_view topic, etl::string_view payload) = 0;
};

/**
 * @brief Writes every status update to the log.
 */
class LoggingStatusPublisher : public StatusPublisher {
public:
  explicit LoggingStatusPublisher(audiokit::Logger &logger,
                                  const char *main_topic = config::topics::MAIN_TOPIC)
      : logger_(logger), main_topic_(main_topic) {
  }

  void publish(etl::string_view topic, etl::string_view payload) override;

private:
  audiokit::Logger &logger_;
  const char *main_topic_;
};

PayloadString format_volume_payload(uint8_t volume);

/** @brief JSON array of the channel volumes, "[a,b,c,d,e,f]". */
PayloadString format_channels_payload(const ChannelVolumes &volumes);

inline etl::string_view format_mute_payload(bool muted) {
  return muted ? etl::string_view("true") : etl::string_view("false");
}

inline etl::string_view format_audio_status_payload(bool playing) {
  return playing ? etl::string_view("on") : etl::string_view("off");
}

} // namespace soundmaster

#endif // SOUNDMASTER_STATUS_PUBLISHER_H
