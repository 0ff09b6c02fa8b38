#ifndef SOUNDMASTER_CONFIG_H
#define SOUNDMASTER_CONFIG_H

#include "etl/array.h"
#include <cstddef>
#include <cstdint>

namespace soundmaster {
namespace config {

constexpr const char *APP_NAME = "soundmaster";

// GPIO Configuration
// Line offsets on the SoC's first GPIO chip (Orange Pi Zero header pin in
// the comment).
namespace gpio {
constexpr const char *CHIP_PATH = "/dev/gpiochip0";
constexpr const char *CONSUMER = "soundmaster";

constexpr uint32_t ENCODER_LEFT = 0;   // Pin 13, PA0
constexpr uint32_t ENCODER_RIGHT = 1;  // Pin 11, PA1
constexpr uint32_t ENCODER_KEY = 3;    // Pin 15, PA3
constexpr uint32_t ENCODER_DEBOUNCE_US = 1000;
constexpr uint32_t KEY_DEBOUNCE_US = 20000;

// One-hot indicator lines from the DSP board, in selection order.
constexpr etl::array<uint32_t, 3> INPUT_INDICATORS = {
    2,  // Pin 22, PA2: Opt1
    67, // Pin 24, PC3: Opt2
    21, // Pin 26, PA21: AUX
};
constexpr uint32_t INPUT_SWITCH = 198; // Pin 8, PG6: emulated DSP button
} // namespace gpio

// I2C Configuration
namespace i2c {
constexpr const char *BUS_PATH = "/dev/i2c-0";
constexpr uint8_t PT2258_ADDRESS = 0x88;  // 8-bit strap address
constexpr uint8_t DISPLAY_ADDRESS = 0x3C; // 7-bit
} // namespace i2c

// Volume Configuration
namespace volume {
constexpr uint8_t MIN = 0;
constexpr uint8_t MAX = 79;
constexpr uint8_t DEFAULT = 50;
constexpr size_t NUM_CHANNELS = 6;
} // namespace volume

// Persistence Configuration
namespace persistence {
constexpr const char *STATE_FILE = "soundmaster_state.bin";
constexpr uint32_t SAVE_DELAY_MS = 10000;
constexpr size_t MAX_PATH_LENGTH = 128;
} // namespace persistence

// Display Configuration
namespace display {
constexpr uint32_t AUTO_CLEAR_MS = 7000;
constexpr uint32_t POP_TIMEOUT_MS = 500;
constexpr size_t QUEUE_SIZE = 16;
constexpr size_t MAX_TEXT_LENGTH = 20;
constexpr uint8_t CONTRAST = 255;
} // namespace display

// Audio card status polling
namespace audio_status {
constexpr const char *STATUS_FILE = "/proc/asound/card0/pcm0p/sub0/status";
constexpr uint32_t POLL_INTERVAL_MS = 1000;
} // namespace audio_status

// Status and control topics, relative to MAIN_TOPIC
namespace topics {
constexpr const char *MAIN_TOPIC = "kimiHome/audio/soundmaster";
constexpr const char *ACTIVE_INPUT = "Active_Input";
constexpr const char *VOLUME = "Volume";
constexpr const char *VOLUME_CHANNELS = "Volume/channels";
constexpr const char *MUTE = "Mute";
constexpr const char *AUDIO_STATUS = "Audio_Status";
constexpr const char *SET_ACTIVE_INPUT = "Active_Input/set";
constexpr const char *SET_VOLUME = "Volume/set";
constexpr const char *SET_VOLUME_CHANNELS = "Volume/channels/set";
constexpr const char *SET_MUTE = "Mute/set";
constexpr size_t MAX_TOPIC_LENGTH = 64;
constexpr size_t MAX_PAYLOAD_LENGTH = 64;
} // namespace topics

// Event plumbing
constexpr size_t CONTROL_QUEUE_SIZE = 64;
constexpr size_t MAX_SUBSCRIBERS_PER_EVENT = 4;
constexpr size_t MAX_POST_ACTIONS = 8;

} // namespace config
} // namespace soundmaster

#endif // SOUNDMASTER_CONFIG_H
