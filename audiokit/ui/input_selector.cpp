#include "input_selector.h"

namespace audiokit::ui {

InputSelector::InputSelector(Logger &logger) : logger_(logger) {
}

std::optional<uint8_t> InputSelector::resolve(uint32_t levels) {
  const uint32_t mask = (1u << NUM_LINES) - 1;
  levels &= mask;

  if (levels == 0) {
    return 0;
  }
  for (uint8_t line = 0; line < NUM_LINES; ++line) {
    if (levels == (1u << line)) {
      return static_cast<uint8_t>(line + 1);
    }
  }
  return std::nullopt;
}

void InputSelector::init(uint32_t levels) {
  const std::optional<uint8_t> selection = resolve(levels);
  current_.store(selection.value_or(0));
  logger_.info("Input selector: initial selection", static_cast<int32_t>(current_.load()));
}

void InputSelector::update(uint32_t levels) {
  const std::optional<uint8_t> selection = resolve(levels);
  if (!selection.has_value()) {
    return;
  }

  const uint8_t previous = current_.load();
  if (*selection == previous) {
    return;
  }

  current_.store(*selection);
  notify_observers(SelectionChange{previous, *selection});
}

bool InputSelector::request_selection(uint8_t target, hal::DigitalOutput &switch_output,
                                      hal::TimeSource &time_source,
                                      const std::atomic<bool> *cancel) {
  if (target > MAX_SELECTION) {
    logger_.warn("Input selector: unsupported selection", static_cast<int32_t>(target));
    return false;
  }

  uint8_t attempts = 0;
  while (current() != target && attempts < MAX_ATTEMPTS) {
    if (cancel != nullptr && cancel->load()) {
      logger_.info("Input selector: switching cancelled after attempts",
                   static_cast<int32_t>(attempts));
      return false;
    }
    pulse(switch_output, time_source);
    time_source.sleep_ms(SETTLE_MS);
    ++attempts;
  }

  if (current() == target) {
    logger_.info("Input selector: switched to", static_cast<int32_t>(target));
    return true;
  }

  logger_.error("Input selector: switching failed after attempts", static_cast<int32_t>(attempts));
  return false;
}

void InputSelector::pulse(hal::DigitalOutput &switch_output, hal::TimeSource &time_source) {
  if (!switch_output.write(true)) {
    logger_.warn("Input selector: failed to drive switch output");
  }
  time_source.sleep_ms(PULSE_MS);
  if (!switch_output.write(false)) {
    logger_.warn("Input selector: failed to release switch output");
  }
}

} // namespace audiokit::ui
