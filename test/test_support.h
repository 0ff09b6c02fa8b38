#ifndef TEST_SUPPORT_H_O674NK3Y
#define TEST_SUPPORT_H_O674NK3Y

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <cstdint>
#include <thread>

namespace test_support {

// Worker threads in the code under test run on real time; poll for their
// effect instead of sleeping a fixed amount.
template <typename Predicate>
bool wait_until(Predicate predicate, uint32_t timeout_ms = 2000) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  while (!predicate()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return true;
}

} // namespace test_support

#endif /* end of include guard: TEST_SUPPORT_H_O674NK3Y */
