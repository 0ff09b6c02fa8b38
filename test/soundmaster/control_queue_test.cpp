#include "audiokit/ui/input_selector.h"
#include "soundmaster/control_queue.h"
#include "soundmaster/input_switch_worker.h"
#include "test/audiokit/hal/mock_hardware.h"
#include "test/test_support.h"

#include <chrono>
#include <thread>

namespace soundmaster {

TEST_CASE("ControlQueue", "[control_queue]") {
  mock::RecordingLogger logger;
  ControlQueue queue(logger);

  SECTION("Items come out in order") {
    REQUIRE(queue.push_sample(RawPinSample{PinGroup::ENCODER_KEY, 1, 10}));
    REQUIRE(queue.push_event(Event(Events::MuteRequestEvent{true})));

    ControlItem item;
    REQUIRE(queue.pop(item, 0));
    REQUIRE(etl::holds_alternative<RawPinSample>(item));
    REQUIRE(etl::get<RawPinSample>(item).timestamp_ms == 10);
    REQUIRE(queue.pop(item, 0));
    REQUIRE(etl::holds_alternative<Event>(item));
    REQUIRE_FALSE(queue.pop(item, 0));
  }

  SECTION("A full queue drops new items") {
    for (size_t i = 0; i < config::CONTROL_QUEUE_SIZE; ++i) {
      REQUIRE(queue.push_event(Event(Events::StateSavedEvent{})));
    }
    REQUIRE_FALSE(queue.push_event(Event(Events::StateSavedEvent{})));
    REQUIRE(queue.size() == config::CONTROL_QUEUE_SIZE);
    REQUIRE(logger.count(audiokit::LogLevel::WARN) == 1);
  }

  SECTION("pop wakes up for an item from another thread") {
    std::thread producer([&] {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      queue.push_event(Event(Events::AttenuatorReadyEvent{}));
    });
    ControlItem item;
    REQUIRE(queue.pop(item, 2000));
    producer.join();
  }

  SECTION("Closing wakes waiters and rejects pushes") {
    std::thread closer([&] {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      queue.close();
    });
    ControlItem item;
    const auto started = std::chrono::steady_clock::now();
    REQUIRE_FALSE(queue.pop(item, 5000));
    REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(4));
    closer.join();

    REQUIRE(queue.is_closed());
    REQUIRE_FALSE(queue.push_event(Event(Events::StateSavedEvent{})));
  }
}

TEST_CASE("InputSwitchWorker", "[input_switch]") {
  mock::RecordingLogger logger;
  mock::MockTimeSource time_source;
  mock::FakeOutput switch_output;
  audiokit::ui::InputSelector selector(logger);
  selector.init(0);
  InputSwitchWorker worker(selector, switch_output, time_source, logger);
  worker.start();

  SECTION("Idle until asked") {
    REQUIRE(worker.is_idle());
    REQUIRE(switch_output.pulse_count() == 0);
  }

  SECTION("A board that never switches gives up after the attempt budget") {
    worker.request(Source::AUX);
    REQUIRE(test_support::wait_until([&] { return worker.is_idle(); }));
    REQUIRE(switch_output.pulse_count() == audiokit::ui::InputSelector::MAX_ATTEMPTS);
    REQUIRE(logger.contains("Input switch did not reach"));
  }

  SECTION("Stopping mid-cycle sends no further pulses") {
    time_source.set_sleep_hook([](uint32_t) {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    });
    worker.request(Source::AUX);
    REQUIRE(test_support::wait_until([&] { return switch_output.pulse_count() >= 2; }));

    worker.stop();
    const size_t pulses_at_stop = switch_output.pulse_count();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    REQUIRE(switch_output.pulse_count() == pulses_at_stop);
    REQUIRE(pulses_at_stop < audiokit::ui::InputSelector::MAX_ATTEMPTS);
    REQUIRE_FALSE(logger.contains("Input switch did not reach"));
    REQUIRE(logger.contains("Input switch cancelled"));
  }

  SECTION("Stop is safe with nothing running") {
    worker.stop();
    worker.request(Source::Opt1);
    REQUIRE(switch_output.pulse_count() == 0);
  }

  worker.stop();
}

} // namespace soundmaster
