#ifndef SOUNDMASTER_SOURCE_H
#define SOUNDMASTER_SOURCE_H

#include "etl/string_view.h"

#include <cstdint>
#include <optional>

namespace soundmaster {

/**
 * @brief Audio inputs of the DSP board, in indicator-line order.
 *
 * The numeric value is the input selector's selection index: OPi is the
 * board's default input (no indicator line high).
 */
enum class Source : uint8_t {
  OPi = 0,
  Opt1 = 1,
  Opt2 = 2,
  AUX = 3
};

constexpr uint8_t NUM_SOURCES = 4;
constexpr Source DEFAULT_SOURCE = Source::OPi;

etl::string_view to_label(Source source);
std::optional<Source> source_from_label(etl::string_view label);
std::optional<Source> source_from_selection(uint8_t selection);

constexpr uint8_t to_selection(Source source) {
  return static_cast<uint8_t>(source);
}

} // namespace soundmaster

#endif // SOUNDMASTER_SOURCE_H
