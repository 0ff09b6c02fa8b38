#include "soundmaster/status_publisher.h"

#include "etl/to_string.h"

#include <ArduinoJson.h>

namespace soundmaster {

void LoggingStatusPublisher::publish(etl::string_view topic, etl::string_view payload) {
  TopicString full_topic(main_topic_);
  full_topic.append("/");
  full_topic.append(topic.begin(), topic.end());
  logger_.info(etl::string_view(full_topic.data(), full_topic.size()), payload);
}

PayloadString format_volume_payload(uint8_t volume) {
  PayloadString payload;
  etl::to_string(static_cast<uint32_t>(volume), payload);
  return payload;
}

PayloadString format_channels_payload(const ChannelVolumes &volumes) {
  StaticJsonDocument<JSON_ARRAY_SIZE(config::volume::NUM_CHANNELS)> doc;
  JsonArray array = doc.to<JsonArray>();
  for (const uint8_t volume : volumes) {
    array.add(static_cast<unsigned int>(volume));
  }

  char buffer[config::topics::MAX_PAYLOAD_LENGTH];
  const size_t length = serializeJson(doc, buffer, sizeof(buffer));
  return PayloadString(buffer, length);
}

} // namespace soundmaster
