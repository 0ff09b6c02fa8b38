#ifndef SOUNDMASTER_SETTINGS_PERSISTER_H
#define SOUNDMASTER_SETTINGS_PERSISTER_H

#include "audiokit/hal/logger.h"
#include "soundmaster/audio_settings.h"
#include "soundmaster/config.h"

#include <cstddef>

namespace soundmaster {

/**
 * @brief Pure file I/O for the settings record.
 *
 * Saves go through a temporary file and a rename, so a reader never sees a
 * partially written record.
 */
class SettingsPersister {
public:
  // Leaves room for the ".tmp" suffix within MAX_PATH_LENGTH.
  static constexpr size_t MAX_FILEPATH_LENGTH = config::persistence::MAX_PATH_LENGTH - 4;

  /** @return true for a non-empty path of at most MAX_FILEPATH_LENGTH. */
  static bool is_valid_filepath(const char *filepath);

  /**
   * @brief Save settings to a file.
   * @param filepath Path to the file to write
   * @param settings The settings to save
   * @return true if save was successful, false otherwise
   */
  bool save_to_file(const char *filepath, const AudioSettings &settings);

  /**
   * @brief Load settings from a file.
   * @param filepath Path to the file to read
   * @param settings Output parameter, only written on success
   * @return true if a valid record was read, false otherwise
   */
  bool load_from_file(const char *filepath, AudioSettings &settings);

  /**
   * @brief Load settings, falling back to defaults for a missing or invalid
   * file.
   */
  AudioSettings load_or_defaults(const char *filepath, audiokit::Logger &logger);
};

} // namespace soundmaster

#endif // SOUNDMASTER_SETTINGS_PERSISTER_H
