#include "soundmaster/control_messages.h"

#include "soundmaster/audio_settings.h"
#include "soundmaster/config.h"

#include <ArduinoJson.h>

#include <cstdint>

namespace soundmaster {

namespace {

// Room for one more element than there are channels, so an over-long array
// is reported as such rather than as a parse failure.
constexpr size_t JSON_CAPACITY = JSON_ARRAY_SIZE(config::volume::NUM_CHANNELS + 1);
using ControlJsonDocument = StaticJsonDocument<JSON_CAPACITY>;

bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

etl::string_view trim(etl::string_view text) {
  while (!text.empty() && is_space(text.front())) {
    text.remove_prefix(1);
  }
  while (!text.empty() && is_space(text.back())) {
    text.remove_suffix(1);
  }
  return text;
}

bool has_prefix(etl::string_view text, etl::string_view prefix) {
  return text.size() >= prefix.size() && text.substr(0, prefix.size()) == prefix;
}

bool equals_ignore_case(etl::string_view text, etl::string_view expected) {
  if (text.size() != expected.size()) {
    return false;
  }
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
    if (c != expected[i]) {
      return false;
    }
  }
  return true;
}

DeserializationError parse_json(etl::string_view payload, ControlJsonDocument &doc) {
  if (trim(payload).empty()) {
    return DeserializationError::EmptyInput;
  }
  return deserializeJson(doc, payload.data(), payload.size());
}

uint8_t clamp_json_volume(JsonVariantConst value) {
  const int64_t raw = value.as<int64_t>();
  if (raw < config::volume::MIN) {
    return config::volume::MIN;
  }
  if (raw > config::volume::MAX) {
    return config::volume::MAX;
  }
  return static_cast<uint8_t>(raw);
}

/** @brief Strip the main topic prefix if present. */
etl::string_view relative_topic(etl::string_view topic) {
  const etl::string_view main_topic(config::topics::MAIN_TOPIC);
  if (has_prefix(topic, main_topic) && topic.size() > main_topic.size() &&
      topic[main_topic.size()] == '/') {
    topic.remove_prefix(main_topic.size() + 1);
  }
  return topic;
}

std::optional<Event> decode_volume(etl::string_view payload, audiokit::Logger &logger) {
  ControlJsonDocument doc;
  const DeserializationError error = parse_json(payload, doc);
  if (error || !doc.is<int64_t>()) {
    logger.error("Volume message should be an integer", payload);
    return std::nullopt;
  }
  return Event(Events::VolumeRequestEvent{clamp_json_volume(doc.as<JsonVariantConst>())});
}

std::optional<Event> decode_channel_volumes(etl::string_view payload, audiokit::Logger &logger) {
  ControlJsonDocument doc;
  const DeserializationError error = parse_json(payload, doc);
  if (error) {
    logger.error("Error decoding channel volumes message", etl::string_view(error.c_str()));
    return std::nullopt;
  }
  if (!doc.is<JsonArrayConst>()) {
    logger.warn("Channel volumes message is not an array, ignored", payload);
    return std::nullopt;
  }

  const JsonArrayConst values = doc.as<JsonArrayConst>();
  if (values.size() == 0) {
    logger.warn("Channel volumes message is empty, ignored");
    return std::nullopt;
  }

  Events::ChannelVolumesRequestEvent request;
  for (JsonVariantConst value : values) {
    if (!value.is<int64_t>()) {
      logger.error("Channel volumes should all be integers", payload);
      return std::nullopt;
    }
    if (request.volumes.full()) {
      logger.error("Too many channel volumes", payload);
      return std::nullopt;
    }
    request.volumes.push_back(clamp_json_volume(value));
  }
  return Event(request);
}

std::optional<Event> decode_mute(etl::string_view payload) {
  return Event(Events::MuteRequestEvent{equals_ignore_case(trim(payload), "true")});
}

std::optional<Event> decode_active_input(etl::string_view payload, audiokit::Logger &logger) {
  const std::optional<Source> source = source_from_label(trim(payload));
  if (!source.has_value()) {
    logger.warn("Unsupported input", payload);
    return std::nullopt;
  }
  return Event(Events::SourceRequestEvent{*source});
}

} // namespace

std::optional<Event> decode_control_message(etl::string_view topic, etl::string_view payload,
                                            audiokit::Logger &logger) {
  const etl::string_view relative = relative_topic(trim(topic));

  if (relative == etl::string_view(config::topics::SET_VOLUME)) {
    return decode_volume(payload, logger);
  }
  if (relative == etl::string_view(config::topics::SET_VOLUME_CHANNELS)) {
    return decode_channel_volumes(payload, logger);
  }
  if (relative == etl::string_view(config::topics::SET_MUTE)) {
    return decode_mute(payload);
  }
  if (relative == etl::string_view(config::topics::SET_ACTIVE_INPUT)) {
    return decode_active_input(payload, logger);
  }

  logger.warn("Unknown control topic", topic);
  return std::nullopt;
}

} // namespace soundmaster
