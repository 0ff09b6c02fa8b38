#ifndef SOUNDMASTER_AUDIO_SETTINGS_H
#define SOUNDMASTER_AUDIO_SETTINGS_H

#include "soundmaster/config.h"
#include "soundmaster/source.h"
#include "etl/array.h"

#include <cstdint>

namespace soundmaster {

using ChannelVolumes = etl::array<uint8_t, config::volume::NUM_CHANNELS>;

constexpr uint8_t clamp_volume(int32_t value) {
  if (value < config::volume::MIN) {
    return config::volume::MIN;
  }
  if (value > config::volume::MAX) {
    return config::volume::MAX;
  }
  return static_cast<uint8_t>(value);
}

/**
 * @brief Everything the controller restores at boot.
 */
struct AudioSettings {
  uint8_t master_volume = config::volume::DEFAULT;
  ChannelVolumes channel_volumes;
  bool muted = false;
  Source active_input = DEFAULT_SOURCE;

  AudioSettings() {
    channel_volumes.fill(config::volume::DEFAULT);
  }

  bool operator==(const AudioSettings &other) const {
    return master_volume == other.master_volume && channel_volumes == other.channel_volumes &&
           muted == other.muted && active_input == other.active_input;
  }

  bool operator!=(const AudioSettings &other) const {
    return !(*this == other);
  }
};

/**
 * @brief On-disk record of AudioSettings.
 *
 * Written and read as one block. The active input is stored by label so
 * the record stays meaningful if the Source enumeration is reordered.
 */
struct PersistedSettings {
  static constexpr uint32_t MAGIC_NUMBER = 0x534E444D; // 'SNDM'
  static constexpr uint8_t FORMAT_VERSION = 1;
  static constexpr size_t LABEL_LENGTH = 8;

  uint32_t magic;
  uint8_t version;
  uint8_t master_volume;
  uint8_t mute_state;
  uint8_t reserved; // Padding for alignment
  ChannelVolumes channel_volumes;
  etl::array<char, LABEL_LENGTH> active_input;

  PersistedSettings();
  explicit PersistedSettings(const AudioSettings &settings);

  /**
   * @brief Validates the loaded data structure.
   * @return true if the header matches and every field is in range
   */
  bool is_valid() const;

  /** @brief Only meaningful when is_valid() holds. */
  AudioSettings to_settings() const;
};

static_assert(sizeof(PersistedSettings) <= 64, "PersistedSettings should stay a small record");

} // namespace soundmaster

#endif // SOUNDMASTER_AUDIO_SETTINGS_H
