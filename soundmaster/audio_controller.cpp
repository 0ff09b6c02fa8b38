#include "soundmaster/audio_controller.h"

#include "etl/array.h"

#include <initializer_list>

namespace soundmaster {

namespace {

enum class ActionStage : uint8_t {
  PUBLISH,
  RENDER,
  SAVE
};

ActionStage stage_of(PostAction action) {
  switch (action) {
  case PostAction::PUBLISH_VOLUME:
  case PostAction::PUBLISH_CHANNELS:
  case PostAction::PUBLISH_MUTE:
  case PostAction::PUBLISH_ACTIVE_INPUT:
  case PostAction::PUBLISH_AUDIO_STATUS:
    return ActionStage::PUBLISH;
  case PostAction::RENDER_VOLUME:
  case PostAction::RENDER_MUTE:
  case PostAction::RENDER_INPUT:
    return ActionStage::RENDER;
  case PostAction::SAVE:
    break;
  }
  return ActionStage::SAVE;
}

// Long presses are decoded and published but nothing acts on them.
constexpr etl::array<EventType, 11> HANDLED_EVENTS = {
    EventType::ROTATION,
    EventType::SHORT_PRESS,
    EventType::SOURCE_SWITCHED,
    EventType::SOURCE_REQUEST,
    EventType::MUTE_REQUEST,
    EventType::VOLUME_REQUEST,
    EventType::CHANNEL_VOLUMES_REQUEST,
    EventType::AUDIO_STATUS_CHANGED,
    EventType::STATE_LOADED,
    EventType::STATE_SAVED,
    EventType::ATTENUATOR_READY,
};

} // namespace

AudioController::AudioController(SystemContext &context, audiokit::drivers::Pt2258 *attenuator,
                                 StatusPublisher &publisher, StatusDisplay &display,
                                 SaveScheduler &save_scheduler, InputSwitchWorker &input_switch)
    : context_(context), attenuator_(attenuator), publisher_(publisher), display_(display),
      save_scheduler_(save_scheduler), input_switch_(input_switch), logger_(context.logger) {
}

bool AudioController::subscribe() {
  const EventDispatcher::Subscriber subscriber =
      EventDispatcher::Subscriber::create<AudioController, &AudioController::on_event>(*this);

  bool all_subscribed = true;
  for (const EventType type : HANDLED_EVENTS) {
    all_subscribed = context_.dispatcher.subscribe(type, subscriber) && all_subscribed;
  }
  return all_subscribed;
}

void AudioController::on_event(const Event &event) {
  const PostActions actions =
      etl::visit([this](const auto &typed_event) { return handle(typed_event); }, event);
  run_post_actions(actions);
}

// --- Handlers ---

PostActions AudioController::handle(const Events::RotationEvent &event) {
  settings_.master_volume = clamp_volume(settings_.master_volume + event.steps);
  apply_master();
  logger_.info("Master volume adjusted via encoder", static_cast<int32_t>(settings_.master_volume));
  return {PostAction::PUBLISH_VOLUME, PostAction::RENDER_VOLUME, PostAction::SAVE};
}

PostActions AudioController::handle(const Events::ShortPressEvent &) {
  settings_.muted = !settings_.muted;
  apply_mute();
  logger_.info("Mute toggled via encoder", etl::string_view(settings_.muted ? "ON" : "OFF"));
  return {PostAction::PUBLISH_MUTE, PostAction::RENDER_MUTE, PostAction::SAVE};
}

PostActions AudioController::handle(const Events::LongPressEvent &) {
  return {};
}

PostActions AudioController::handle(const Events::SourceSwitchedEvent &event) {
  settings_.active_input = event.new_source;
  logger_.info("Active input is now", to_label(event.new_source));
  return {PostAction::PUBLISH_ACTIVE_INPUT, PostAction::RENDER_INPUT, PostAction::SAVE};
}

PostActions AudioController::handle(const Events::SourceRequestEvent &event) {
  input_switch_.request(event.target);
  return {PostAction::SAVE};
}

PostActions AudioController::handle(const Events::MuteRequestEvent &event) {
  settings_.muted = event.muted;
  apply_mute();
  logger_.info("Mute set via control message", etl::string_view(settings_.muted ? "ON" : "OFF"));
  return {PostAction::PUBLISH_MUTE, PostAction::RENDER_MUTE, PostAction::SAVE};
}

PostActions AudioController::handle(const Events::VolumeRequestEvent &event) {
  settings_.master_volume = clamp_volume(event.volume);
  apply_master();
  logger_.info("Master volume set via control message",
               static_cast<int32_t>(settings_.master_volume));
  return {PostAction::PUBLISH_VOLUME, PostAction::RENDER_VOLUME, PostAction::SAVE};
}

PostActions AudioController::handle(const Events::ChannelVolumesRequestEvent &event) {
  for (size_t channel = 0; channel < event.volumes.size(); ++channel) {
    settings_.channel_volumes[channel] = clamp_volume(event.volumes[channel]);
  }
  apply_channels();
  logger_.info("Channel volumes updated, count", static_cast<int32_t>(event.volumes.size()));
  return {PostAction::PUBLISH_CHANNELS, PostAction::SAVE};
}

PostActions AudioController::handle(const Events::AudioStatusChangedEvent &event) {
  audio_playing_ = event.playing;
  logger_.info("Audio output status", format_audio_status_payload(audio_playing_));
  return {PostAction::PUBLISH_AUDIO_STATUS};
}

PostActions AudioController::handle(const Events::StateLoadedEvent &event) {
  logger_.info("Applying loaded state");
  settings_ = event.settings;
  input_switch_.request(settings_.active_input);
  apply_channels();
  apply_master();
  apply_mute();
  return {PostAction::PUBLISH_CHANNELS, PostAction::PUBLISH_VOLUME, PostAction::PUBLISH_MUTE,
          PostAction::RENDER_INPUT};
}

PostActions AudioController::handle(const Events::StateSavedEvent &) {
  logger_.debug("State saved");
  return {};
}

PostActions AudioController::handle(const Events::AttenuatorReadyEvent &) {
  logger_.info("Attenuator ready");
  return {};
}

// --- Post-actions ---

void AudioController::run_post_actions(const PostActions &actions) {
  for (const ActionStage stage : {ActionStage::PUBLISH, ActionStage::RENDER, ActionStage::SAVE}) {
    for (const PostAction action : actions) {
      if (stage_of(action) == stage) {
        execute(action);
      }
    }
  }
}

void AudioController::execute(PostAction action) {
  switch (action) {
  case PostAction::PUBLISH_VOLUME: {
    const PayloadString payload = format_volume_payload(settings_.master_volume);
    publisher_.publish(config::topics::VOLUME, etl::string_view(payload.data(), payload.size()));
    break;
  }
  case PostAction::PUBLISH_CHANNELS: {
    const PayloadString payload = format_channels_payload(settings_.channel_volumes);
    publisher_.publish(config::topics::VOLUME_CHANNELS,
                       etl::string_view(payload.data(), payload.size()));
    break;
  }
  case PostAction::PUBLISH_MUTE:
    publisher_.publish(config::topics::MUTE, format_mute_payload(settings_.muted));
    break;
  case PostAction::PUBLISH_ACTIVE_INPUT:
    publisher_.publish(config::topics::ACTIVE_INPUT, to_label(settings_.active_input));
    break;
  case PostAction::PUBLISH_AUDIO_STATUS:
    publisher_.publish(config::topics::AUDIO_STATUS, format_audio_status_payload(audio_playing_));
    break;
  case PostAction::RENDER_VOLUME:
    display_.show_volume(settings_.master_volume);
    break;
  case PostAction::RENDER_MUTE:
    display_.show_mute(settings_.muted);
    break;
  case PostAction::RENDER_INPUT:
    display_.show_input(settings_.active_input);
    break;
  case PostAction::SAVE:
    save_scheduler_.request_save(settings_);
    break;
  }
}

// --- Attenuator ---

void AudioController::apply_master() {
  if (attenuator_ == nullptr) {
    return;
  }
  const auto status = attenuator_->set_master_volume(settings_.master_volume);
  if (status != audiokit::drivers::Pt2258Status::OK) {
    logger_.error("Failed to apply master volume",
                  etl::string_view(audiokit::drivers::to_string(status)));
  }
}

void AudioController::apply_channels() {
  if (attenuator_ == nullptr) {
    return;
  }
  for (uint8_t channel = 0; channel < settings_.channel_volumes.size(); ++channel) {
    const auto status =
        attenuator_->set_channel_volume(channel, settings_.channel_volumes[channel]);
    if (status != audiokit::drivers::Pt2258Status::OK) {
      logger_.error("Failed to apply channel volume", static_cast<int32_t>(channel));
    }
  }
}

void AudioController::apply_mute() {
  if (attenuator_ == nullptr) {
    return;
  }
  const auto status = attenuator_->set_mute(settings_.muted);
  if (status != audiokit::drivers::Pt2258Status::OK) {
    logger_.error("Failed to apply mute", etl::string_view(audiokit::drivers::to_string(status)));
    return;
  }
  if (!settings_.muted) {
    apply_master();
  }
}

} // namespace soundmaster
