#include <gtest/gtest.h>

#include "agent/timer.hpp"

using namespace ferry;
using namespace std::chrono_literals;

// --- TimerTest ---

TEST(TimerTest, NotArmedByDefault) {
  Timer timer;

  EXPECT_FALSE(timer.is_armed());
  EXPECT_FALSE(timer.is_expired());
  EXPECT_FALSE(timer.get_remaining().has_value());
}

TEST(TimerTest, ExpiresAtDeadline) {
  Timer timer;
  auto now = Timer::Clock::now();
  timer.start(100ms, now);

  EXPECT_TRUE(timer.is_armed());
  EXPECT_FALSE(timer.is_expired(now));
  EXPECT_FALSE(timer.is_expired(now + 99ms));
  EXPECT_TRUE(timer.is_expired(now + 100ms));
  EXPECT_TRUE(timer.is_expired(now + 1s));
}

TEST(TimerTest, RemainingSaturatesAtZero) {
  Timer timer;
  auto now = Timer::Clock::now();
  timer.start(50ms, now);

  EXPECT_EQ(timer.get_remaining(now), Timer::Clock::duration(50ms));
  EXPECT_EQ(timer.get_remaining(now + 20ms), Timer::Clock::duration(30ms));
  EXPECT_EQ(timer.get_remaining(now + 80ms), Timer::Clock::duration::zero());
}

TEST(TimerTest, RestartReplacesDeadline) {
  Timer timer;
  auto now = Timer::Clock::now();
  timer.start(10ms, now);
  timer.start(1s, now);

  EXPECT_FALSE(timer.is_expired(now + 10ms));
  EXPECT_EQ(timer.get_remaining(now), Timer::Clock::duration(1s));
}

TEST(TimerTest, ZeroDurationIsImmediatelyExpired) {
  Timer timer;
  auto now = Timer::Clock::now();
  timer.start(0ms, now);

  EXPECT_TRUE(timer.is_expired(now));
}

TEST(TimerTest, Stop) {
  Timer timer;
  timer.start(0ms);
  timer.stop();

  EXPECT_FALSE(timer.is_armed());
  EXPECT_FALSE(timer.is_expired());
  EXPECT_FALSE(timer.get_remaining().has_value());
}

TEST(TimerTest, ShorterRestartWins) {
  Timer timer;
  auto now = Timer::Clock::now();
  timer.start(100ms, now);
  timer.start(10ms, now);

  EXPECT_EQ(timer.get_remaining(now), Timer::Clock::duration(10ms));
  EXPECT_TRUE(timer.is_expired(now + 10ms));
}
