#include "audiokit/hal/one_shot_timer.h"
#include "test/test_support.h"

#include <atomic>
#include <chrono>
#include <thread>

using audiokit::hal::OneShotTimer;

namespace {

struct FireCounter {
  std::atomic<int> fired{0};

  void on_fire() {
    ++fired;
  }

  OneShotTimer::Callback callback() {
    return OneShotTimer::Callback::create<FireCounter, &FireCounter::on_fire>(*this);
  }
};

void sleep_ms(uint32_t ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

} // namespace

TEST_CASE("OneShotTimer", "[timer]") {
  FireCounter counter;
  OneShotTimer timer(counter.callback());

  SECTION("Fires once after the delay") {
    timer.schedule(30);
    REQUIRE(timer.is_pending());
    REQUIRE(test_support::wait_until([&] { return counter.fired.load() == 1; }));
    REQUIRE_FALSE(timer.is_pending());
    sleep_ms(60);
    REQUIRE(counter.fired.load() == 1);
  }

  SECTION("Rescheduling replaces the pending deadline") {
    for (int i = 0; i < 5; ++i) {
      timer.schedule(80);
      sleep_ms(10);
    }
    REQUIRE(counter.fired.load() == 0);
    REQUIRE(test_support::wait_until([&] { return counter.fired.load() == 1; }));
    sleep_ms(120);
    REQUIRE(counter.fired.load() == 1);
  }

  SECTION("Cancel prevents the callback") {
    timer.schedule(40);
    timer.cancel();
    REQUIRE_FALSE(timer.is_pending());
    sleep_ms(80);
    REQUIRE(counter.fired.load() == 0);
  }

  SECTION("Destroying a pending timer does not fire it") {
    FireCounter other;
    {
      OneShotTimer short_lived(other.callback());
      short_lived.schedule(1000);
    }
    REQUIRE(other.fired.load() == 0);
  }
}
