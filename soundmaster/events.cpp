#include "soundmaster/events.h"

namespace soundmaster {

const char *to_string(EventType type) {
  switch (type) {
  case EventType::ROTATION:
    return "rotation";
  case EventType::SHORT_PRESS:
    return "short-press";
  case EventType::LONG_PRESS:
    return "long-press";
  case EventType::SOURCE_SWITCHED:
    return "source-switched";
  case EventType::SOURCE_REQUEST:
    return "source-request";
  case EventType::MUTE_REQUEST:
    return "mute-request";
  case EventType::VOLUME_REQUEST:
    return "volume-request";
  case EventType::CHANNEL_VOLUMES_REQUEST:
    return "channel-volumes-request";
  case EventType::AUDIO_STATUS_CHANGED:
    return "audio-status-changed";
  case EventType::STATE_LOADED:
    return "state-loaded";
  case EventType::STATE_SAVED:
    return "state-saved";
  case EventType::ATTENUATOR_READY:
    return "attenuator-ready";
  }
  return "unknown";
}

} // namespace soundmaster
