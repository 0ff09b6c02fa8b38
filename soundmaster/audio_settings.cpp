#include "soundmaster/audio_settings.h"

#include "etl/algorithm.h"

namespace soundmaster {

PersistedSettings::PersistedSettings() : PersistedSettings(AudioSettings{}) {
}

PersistedSettings::PersistedSettings(const AudioSettings &settings)
    : magic(MAGIC_NUMBER), version(FORMAT_VERSION), master_volume(settings.master_volume),
      mute_state(settings.muted ? 1 : 0), reserved(0), channel_volumes(settings.channel_volumes) {
  active_input.fill('\0');
  const etl::string_view label = to_label(settings.active_input);
  etl::copy_n(label.begin(), etl::min(label.size(), LABEL_LENGTH - 1), active_input.begin());
}

bool PersistedSettings::is_valid() const {
  if (magic != MAGIC_NUMBER || version != FORMAT_VERSION) {
    return false;
  }
  if (master_volume > config::volume::MAX || mute_state > 1) {
    return false;
  }
  for (const uint8_t volume : channel_volumes) {
    if (volume > config::volume::MAX) {
      return false;
    }
  }
  if (active_input[LABEL_LENGTH - 1] != '\0') {
    return false;
  }
  return source_from_label(etl::string_view(active_input.data())).has_value();
}

AudioSettings PersistedSettings::to_settings() const {
  AudioSettings settings;
  settings.master_volume = master_volume;
  settings.channel_volumes = channel_volumes;
  settings.muted = mute_state != 0;
  settings.active_input =
      source_from_label(etl::string_view(active_input.data())).value_or(DEFAULT_SOURCE);
  return settings;
}

} // namespace soundmaster
