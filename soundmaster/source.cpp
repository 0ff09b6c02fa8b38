#include "soundmaster/source.h"

#include "etl/array.h"

namespace soundmaster {

namespace {
constexpr etl::array<const char *, NUM_SOURCES> LABELS = {"OPi", "Opt1", "Opt2", "AUX"};
} // namespace

etl::string_view to_label(Source source) {
  const uint8_t index = to_selection(source);
  if (index >= NUM_SOURCES) {
    return etl::string_view("?");
  }
  return etl::string_view(LABELS[index]);
}

std::optional<Source> source_from_label(etl::string_view label) {
  for (uint8_t i = 0; i < NUM_SOURCES; ++i) {
    if (label == etl::string_view(LABELS[i])) {
      return static_cast<Source>(i);
    }
  }
  return std::nullopt;
}

std::optional<Source> source_from_selection(uint8_t selection) {
  if (selection >= NUM_SOURCES) {
    return std::nullopt;
  }
  return static_cast<Source>(selection);
}

} // namespace soundmaster
