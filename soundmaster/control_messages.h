#ifndef SOUNDMASTER_CONTROL_MESSAGES_H
#define SOUNDMASTER_CONTROL_MESSAGES_H

#include "audiokit/hal/logger.h"
#include "soundmaster/events.h"
#include "etl/string_view.h"

#include <optional>

namespace soundmaster {

/**
 * @brief Turn an inbound remote-control message into a request event.
 *
 * Accepted topics, relative to the main topic or prefixed with it:
 *   Volume/set           integer, clamped to the volume range
 *   Volume/channels/set  array of integers, e.g. "[50, 60]", clamped
 *   Mute/set             "true" (any case) mutes, anything else unmutes
 *   Active_Input/set     a source label
 *
 * Malformed payloads and unknown topics are logged and yield nullopt.
 */
std::optional<Event> decode_control_message(etl::string_view topic, etl::string_view payload,
                                            audiokit::Logger &logger);

} // namespace soundmaster

#endif // SOUNDMASTER_CONTROL_MESSAGES_H
