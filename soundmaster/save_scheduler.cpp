#include "soundmaster/save_scheduler.h"

namespace soundmaster {

SaveScheduler::SaveScheduler(const char *filepath, SettingsPersister &persister,
                             ControlQueue &control_queue, audiokit::Logger &logger,
                             uint32_t save_delay_ms)
    : filepath_(filepath != nullptr ? filepath : ""),
      filepath_valid_(SettingsPersister::is_valid_filepath(filepath)),
      persister_(persister), control_queue_(control_queue), logger_(logger),
      save_delay_ms_(save_delay_ms),
      timer_(audiokit::hal::OneShotTimer::Callback::create<SaveScheduler, &SaveScheduler::on_timer>(
          *this)) {
  if (!filepath_valid_) {
    logger_.error("Save scheduler: unusable state file path, saving disabled");
  }
}

void SaveScheduler::request_save(const AudioSettings &settings) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_settings_ = settings;
    has_pending_ = true;
  }
  timer_.schedule(save_delay_ms_);
}

bool SaveScheduler::flush() {
  timer_.cancel();
  return write_pending() != WriteResult::FAILED;
}

bool SaveScheduler::has_pending_save() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return has_pending_;
}

uint32_t SaveScheduler::save_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return save_count_;
}

void SaveScheduler::on_timer() {
  if (write_pending() == WriteResult::WRITTEN) {
    control_queue_.push_event(Event(Events::StateSavedEvent{}));
  }
}

SaveScheduler::WriteResult SaveScheduler::write_pending() {
  std::lock_guard<std::mutex> write_lock(write_mutex_);

  AudioSettings snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!has_pending_) {
      return WriteResult::NOTHING_PENDING;
    }
    snapshot = pending_settings_;
    has_pending_ = false;
  }

  if (!filepath_valid_) {
    logger_.error("Settings not saved, no usable state file path");
    return WriteResult::FAILED;
  }
  if (!persister_.save_to_file(filepath_.c_str(), snapshot)) {
    logger_.error("Failed to save settings to", etl::string_view(filepath_.c_str()));
    return WriteResult::FAILED;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++save_count_;
  }
  logger_.debug("State saved");
  return WriteResult::WRITTEN;
}

} // namespace soundmaster
