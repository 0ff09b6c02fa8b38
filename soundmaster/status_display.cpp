#include "soundmaster/status_display.h"

#include "soundmaster/config.h"
#include "etl/to_string.h"

namespace soundmaster {

etl::string<4> StatusDisplay::format_volume(uint8_t volume) {
  if (volume == config::volume::MIN) {
    return etl::string<4>("Min");
  }
  if (volume >= config::volume::MAX) {
    return etl::string<4>("Max");
  }
  etl::string<4> text;
  etl::to_string(static_cast<uint32_t>(volume), text);
  return text;
}

void StatusDisplay::show_volume(uint8_t volume) {
  const etl::string<4> text = format_volume(volume);
  queue_.show_text(etl::string_view(text.data(), text.size()));
}

void StatusDisplay::show_input(Source source) {
  queue_.show_text(to_label(source));
}

void StatusDisplay::show_mute(bool muted) {
  queue_.set_muted(muted);
  if (muted) {
    queue_.show_text(MUTED_TEXT, true);
  } else {
    queue_.clear();
  }
}

} // namespace soundmaster
