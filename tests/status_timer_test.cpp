#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <thread>
#include "StatusTimer.hpp"

using namespace std::chrono_literals;

class StatusTimerTest : public ::testing::Test {
protected:
  std::atomic<int> fired{0};

  std::function<void()> counter() {
    return [this] { ++fired; };
  }

  // Polls instead of sleeping the whole timeout
  bool wait_for_fired(int expected, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
      if (fired.load() >= expected) {
        return true;
      }
      std::this_thread::sleep_for(5ms);
    }
    return fired.load() >= expected;
  }
};

TEST_F(StatusTimerTest, FiresOnceAfterDelay) {
  StatusTimer timer;
  timer.start(20ms, counter());
  ASSERT_TRUE(wait_for_fired(1, 2000ms)) << "Callback should run after the delay";
  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(fired.load(), 1);
}

TEST_F(StatusTimerTest, DestroyingCancelsPendingCallback) {
  const auto started = std::chrono::steady_clock::now();
  {
    auto timer = std::make_unique<StatusTimer>();
    timer->start(2s, counter());
  }
  const auto elapsed = std::chrono::steady_clock::now() - started;

  EXPECT_LT(elapsed, 1s) << "Destruction should not wait out the delay";
  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(fired.load(), 0) << "No callback may run after the timer is gone";
}

TEST_F(StatusTimerTest, RestartCancelsPreviousCallback) {
  std::atomic<int> first{0};
  StatusTimer timer;
  timer.start(2s, [&first] { ++first; });
  timer.start(20ms, counter());

  ASSERT_TRUE(wait_for_fired(1, 2000ms));
  EXPECT_EQ(first.load(), 0);
}

TEST_F(StatusTimerTest, StopWithoutStartIsHarmless) {
  StatusTimer timer;
  EXPECT_NO_THROW(timer.stop());
  timer.start(2s, counter());
  timer.stop();
  EXPECT_EQ(fired.load(), 0);
}
