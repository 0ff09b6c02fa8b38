#ifndef SOUNDMASTER_EVENTS_H
#define SOUNDMASTER_EVENTS_H

#include "soundmaster/audio_settings.h"
#include "soundmaster/config.h"
#include "soundmaster/source.h"
#include "etl/variant.h"
#include "etl/vector.h"

#include <cstddef>
#include <cstdint>

namespace soundmaster::Events {

/**
 * @brief One encoder detent, already scaled by acceleration.
 */
struct RotationEvent {
  int32_t steps;
  uint32_t timestamp_ms;
};

struct ShortPressEvent {
  uint32_t timestamp_ms;
};

struct LongPressEvent {
  uint32_t timestamp_ms;
};

/**
 * @brief The DSP board reports a different input.
 */
struct SourceSwitchedEvent {
  Source old_source;
  Source new_source;
};

/**
 * @brief Someone asked for a different input; the board has not switched yet.
 */
struct SourceRequestEvent {
  Source target;
};

struct MuteRequestEvent {
  bool muted;
};

struct VolumeRequestEvent {
  uint8_t volume; // Already clamped
};

/**
 * @brief New volumes for the first volumes.size() channels, already clamped.
 */
struct ChannelVolumesRequestEvent {
  etl::vector<uint8_t, config::volume::NUM_CHANNELS> volumes;
};

struct AudioStatusChangedEvent {
  bool playing;
};

struct StateLoadedEvent {
  AudioSettings settings;
};

struct StateSavedEvent {};

struct AttenuatorReadyEvent {};

} // namespace soundmaster::Events

namespace soundmaster {

// Alternative order must match EventType.
using Event = etl::variant<Events::RotationEvent, Events::ShortPressEvent, Events::LongPressEvent,
                           Events::SourceSwitchedEvent, Events::SourceRequestEvent,
                           Events::MuteRequestEvent, Events::VolumeRequestEvent,
                           Events::ChannelVolumesRequestEvent, Events::AudioStatusChangedEvent,
                           Events::StateLoadedEvent, Events::StateSavedEvent,
                           Events::AttenuatorReadyEvent>;

enum class EventType : uint8_t {
  ROTATION,
  SHORT_PRESS,
  LONG_PRESS,
  SOURCE_SWITCHED,
  SOURCE_REQUEST,
  MUTE_REQUEST,
  VOLUME_REQUEST,
  CHANNEL_VOLUMES_REQUEST,
  AUDIO_STATUS_CHANGED,
  STATE_LOADED,
  STATE_SAVED,
  ATTENUATOR_READY,
};

constexpr size_t NUM_EVENT_TYPES = 12;
static_assert(etl::variant_size<Event>::value == NUM_EVENT_TYPES,
              "Every event alternative needs an EventType");

inline EventType type_of(const Event &event) {
  return static_cast<EventType>(event.index());
}

const char *to_string(EventType type);

} // namespace soundmaster

#endif // SOUNDMASTER_EVENTS_H
