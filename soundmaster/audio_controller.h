#ifndef SOUNDMASTER_AUDIO_CONTROLLER_H
#define SOUNDMASTER_AUDIO_CONTROLLER_H

#include "audiokit/drivers/pt2258.h"
#include "soundmaster/audio_settings.h"
#include "soundmaster/config.h"
#include "soundmaster/event_dispatcher.h"
#include "soundmaster/events.h"
#include "soundmaster/input_switch_worker.h"
#include "soundmaster/save_scheduler.h"
#include "soundmaster/status_display.h"
#include "soundmaster/status_publisher.h"
#include "soundmaster/system_context.h"
#include "etl/vector.h"

#include <cstdint>

namespace soundmaster {

/**
 * @brief Follow-up work a handler asks for once its state change is done.
 */
enum class PostAction : uint8_t {
  PUBLISH_VOLUME,
  PUBLISH_CHANNELS,
  PUBLISH_MUTE,
  PUBLISH_ACTIVE_INPUT,
  PUBLISH_AUDIO_STATUS,
  RENDER_VOLUME,
  RENDER_MUTE,
  RENDER_INPUT,
  SAVE,
};

using PostActions = etl::vector<PostAction, config::MAX_POST_ACTIONS>;

/**
 * @brief Business logic of the controller.
 *
 * Owns the audio settings, mirrors them into the attenuator and turns
 * every handled event into an ordered list of post-actions. The post-actions
 * of one event run publish first, then render, then save.
 *
 * Runs on the control thread only. The attenuator may be null when it
 * failed to initialise; hardware writes are then skipped. A failed write
 * leaves the in-memory state changed, the next change re-sends it.
 */
class AudioController {
public:
  AudioController(SystemContext &context, audiokit::drivers::Pt2258 *attenuator,
                  StatusPublisher &publisher, StatusDisplay &display,
                  SaveScheduler &save_scheduler, InputSwitchWorker &input_switch);

  AudioController(const AudioController &) = delete;
  AudioController &operator=(const AudioController &) = delete;

  /** @brief Register for every event type this controller handles. */
  bool subscribe();

  const AudioSettings &settings() const {
    return settings_;
  }

  bool audio_playing() const {
    return audio_playing_;
  }

  PostActions handle(const Events::RotationEvent &event);
  PostActions handle(const Events::ShortPressEvent &event);
  PostActions handle(const Events::LongPressEvent &event);
  PostActions handle(const Events::SourceSwitchedEvent &event);
  PostActions handle(const Events::SourceRequestEvent &event);
  PostActions handle(const Events::MuteRequestEvent &event);
  PostActions handle(const Events::VolumeRequestEvent &event);
  PostActions handle(const Events::ChannelVolumesRequestEvent &event);
  PostActions handle(const Events::AudioStatusChangedEvent &event);
  PostActions handle(const Events::StateLoadedEvent &event);
  PostActions handle(const Events::StateSavedEvent &event);
  PostActions handle(const Events::AttenuatorReadyEvent &event);

  void run_post_actions(const PostActions &actions);

private:
  void on_event(const Event &event);
  void execute(PostAction action);

  void apply_master();
  void apply_channels();
  void apply_mute();

  SystemContext &context_;
  audiokit::drivers::Pt2258 *attenuator_;
  StatusPublisher &publisher_;
  StatusDisplay &display_;
  SaveScheduler &save_scheduler_;
  InputSwitchWorker &input_switch_;
  audiokit::Logger &logger_;

  AudioSettings settings_;
  bool audio_playing_ = false;
};

} // namespace soundmaster

#endif // SOUNDMASTER_AUDIO_CONTROLLER_H
