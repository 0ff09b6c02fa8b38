#ifndef SOUNDMASTER_CONTROL_LOOP_H
#define SOUNDMASTER_CONTROL_LOOP_H

#include "audiokit/ui/encoder_acceleration.h"
#include "audiokit/ui/input_selector.h"
#include "audiokit/ui/rotary_encoder.h"
#include "soundmaster/control_queue.h"
#include "soundmaster/event_dispatcher.h"
#include "soundmaster/system_context.h"
#include "etl/observer.h"

#include <atomic>
#include <cstdint>

namespace soundmaster {

/**
 * @brief The control thread's body.
 *
 * Pops items from the control queue, feeds raw pin samples to the decoders
 * it owns and publishes the resulting events, together with ready-made
 * events from other threads, through the dispatcher.
 */
class ControlLoop {
public:
  static constexpr uint32_t POP_TIMEOUT_MS = 200;

  ControlLoop(SystemContext &context, audiokit::ui::InputSelector &input_selector);

  ControlLoop(const ControlLoop &) = delete;
  ControlLoop &operator=(const ControlLoop &) = delete;

  void process(const ControlItem &item);

  /** @return true if an item was processed. */
  bool run_once(uint32_t timeout_ms = POP_TIMEOUT_MS);

  /** @brief Process items until stop_requested is set or the queue closes. */
  void run(const std::atomic<bool> &stop_requested);

  const audiokit::ui::RotaryEncoder &encoder() const {
    return encoder_;
  }

private:
  struct EncoderEventHandler : public etl::observer<audiokit::ui::EncoderEvent> {
    ControlLoop *parent;

    explicit EncoderEventHandler(ControlLoop *p) : parent(p) {
    }
    void notification(audiokit::ui::EncoderEvent event) override;
  };

  struct SelectionEventHandler : public etl::observer<audiokit::ui::SelectionChange> {
    ControlLoop *parent;

    explicit SelectionEventHandler(ControlLoop *p) : parent(p) {
    }
    void notification(audiokit::ui::SelectionChange change) override;
  };

  void process_sample(const RawPinSample &sample);

  SystemContext &context_;
  audiokit::ui::InputSelector &input_selector_;
  audiokit::ui::RotaryEncoder encoder_;
  audiokit::ui::EncoderAcceleration acceleration_;
  EncoderEventHandler encoder_observer_;
  SelectionEventHandler selection_observer_;
};

} // namespace soundmaster

#endif // SOUNDMASTER_CONTROL_LOOP_H
