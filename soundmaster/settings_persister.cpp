#include "soundmaster/settings_persister.h"

#include "soundmaster/config.h"
#include "etl/string.h"

#include <cstdio>
#include <cstring>

namespace soundmaster {

bool SettingsPersister::is_valid_filepath(const char *filepath) {
  if (filepath == nullptr) {
    return false;
  }
  const size_t length = std::strlen(filepath);
  return length > 0 && length <= MAX_FILEPATH_LENGTH;
}

bool SettingsPersister::save_to_file(const char *filepath, const AudioSettings &settings) {
  if (!is_valid_filepath(filepath)) {
    return false;
  }
  etl::string<config::persistence::MAX_PATH_LENGTH> temp_path(filepath);
  temp_path.append(".tmp");

  FILE *file = fopen(temp_path.c_str(), "wb");
  if (!file) {
    return false;
  }

  const PersistedSettings record(settings);
  const size_t written = fwrite(&record, sizeof(PersistedSettings), 1, file);
  const bool flushed = fflush(file) == 0;
  const bool closed = fclose(file) == 0;

  if (written != 1 || !flushed || !closed) {
    remove(temp_path.c_str());
    return false;
  }

  return rename(temp_path.c_str(), filepath) == 0;
}

bool SettingsPersister::load_from_file(const char *filepath, AudioSettings &settings) {
  FILE *file = fopen(filepath, "rb");
  if (!file) {
    return false; // File doesn't exist, not an error
  }

  PersistedSettings record;
  const size_t read_size = fread(&record, sizeof(PersistedSettings), 1, file);
  fclose(file);

  if (read_size != 1 || !record.is_valid()) {
    return false; // Corrupted or invalid file
  }

  settings = record.to_settings();
  return true;
}

AudioSettings SettingsPersister::load_or_defaults(const char *filepath, audiokit::Logger &logger) {
  AudioSettings settings;
  if (load_from_file(filepath, settings)) {
    logger.debug("Settings loaded from", etl::string_view(filepath));
    return settings;
  }
  logger.warn("No valid settings file, using defaults", etl::string_view(filepath));
  return AudioSettings{};
}

} // namespace soundmaster
