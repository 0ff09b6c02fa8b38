#ifndef AUDIOKIT_UI_TEXT_DISPLAY_H
#define AUDIOKIT_UI_TEXT_DISPLAY_H

#include "etl/string_view.h"

namespace audiokit::ui {

/**
 * @brief A display that shows one short line of text at a time.
 */
class TextDisplay {
public:
  virtual ~TextDisplay() = default;

  virtual bool show_text(etl::string_view text) = 0;
  virtual bool clear() = 0;
};

} // namespace audiokit::ui

#endif // AUDIOKIT_UI_TEXT_DISPLAY_H
