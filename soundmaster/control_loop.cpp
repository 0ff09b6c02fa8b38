#include "soundmaster/control_loop.h"

#include "soundmaster/source.h"

namespace soundmaster {

ControlLoop::ControlLoop(SystemContext &context, audiokit::ui::InputSelector &input_selector)
    : context_(context), input_selector_(input_selector), encoder_(context.logger),
      encoder_observer_(this), selection_observer_(this) {
  encoder_.add_observer(encoder_observer_);
  input_selector_.add_observer(selection_observer_);
}

void ControlLoop::process(const ControlItem &item) {
  if (etl::holds_alternative<RawPinSample>(item)) {
    process_sample(etl::get<RawPinSample>(item));
  } else {
    context_.dispatcher.publish(etl::get<Event>(item));
  }
}

bool ControlLoop::run_once(uint32_t timeout_ms) {
  ControlItem item;
  if (!context_.control_queue.pop(item, timeout_ms)) {
    return false;
  }
  process(item);
  return true;
}

void ControlLoop::run(const std::atomic<bool> &stop_requested) {
  context_.logger.debug("Control loop started");
  while (!stop_requested.load()) {
    if (!run_once() && context_.control_queue.is_closed()) {
      break;
    }
  }
  context_.logger.debug("Control loop stopped");
}

void ControlLoop::process_sample(const RawPinSample &sample) {
  switch (sample.group) {
  case PinGroup::ENCODER_ROTATION:
    encoder_.on_rotation_levels((sample.levels & 0x1) != 0, (sample.levels & 0x2) != 0,
                                sample.timestamp_ms);
    break;
  case PinGroup::ENCODER_KEY:
    encoder_.on_key_level((sample.levels & 0x1) != 0, sample.timestamp_ms);
    break;
  case PinGroup::INPUT_INDICATORS:
    input_selector_.update(sample.levels);
    break;
  }
}

void ControlLoop::EncoderEventHandler::notification(audiokit::ui::EncoderEvent event) {
  EventDispatcher &dispatcher = parent->context_.dispatcher;

  switch (event.type) {
  case audiokit::ui::EncoderEvent::Type::Rotation: {
    const int32_t steps = parent->acceleration_.apply(event.direction, event.timestamp_ms);
    dispatcher.publish(Event(Events::RotationEvent{steps, event.timestamp_ms}));
    break;
  }
  case audiokit::ui::EncoderEvent::Type::ShortPress:
    dispatcher.publish(Event(Events::ShortPressEvent{event.timestamp_ms}));
    break;
  case audiokit::ui::EncoderEvent::Type::LongPress:
    dispatcher.publish(Event(Events::LongPressEvent{event.timestamp_ms}));
    break;
  }
}

void ControlLoop::SelectionEventHandler::notification(audiokit::ui::SelectionChange change) {
  const std::optional<Source> old_source = source_from_selection(change.old_selection);
  const std::optional<Source> new_source = source_from_selection(change.new_selection);
  if (!old_source.has_value() || !new_source.has_value()) {
    parent->context_.logger.warn("Unknown input selection",
                                 static_cast<int32_t>(change.new_selection));
    return;
  }
  parent->context_.dispatcher.publish(
      Event(Events::SourceSwitchedEvent{*old_source, *new_source}));
}

} // namespace soundmaster
