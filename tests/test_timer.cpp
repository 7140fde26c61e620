/**
 * @file test_timer.cpp
 * @brief Tests for timer.hpp
 */

#include "mwb/timer.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>

namespace {

void Count(void* ctx) { static_cast<std::atomic<int>*>(ctx)->fetch_add(1); }
void Noop(void*) {}

}  // namespace

// ============================================================================
// Registration
// ============================================================================

TEST_CASE("TimerScheduler Add and Remove", "[timer]") {
  mwb::TimerScheduler<4> sched;
  auto r = sched.Add(100, Noop);
  REQUIRE(r.has_value());
  REQUIRE(r.value().value() > 0);
  REQUIRE(sched.TaskCount() == 1);

  REQUIRE(sched.Remove(r.value()).has_value());
  REQUIRE(sched.TaskCount() == 0);

  auto again = sched.Remove(r.value());
  REQUIRE_FALSE(again.has_value());
  REQUIRE(again.get_error() == mwb::TimerError::kNotFound);
}

TEST_CASE("TimerScheduler rejects zero period and null callback", "[timer]") {
  mwb::TimerScheduler<4> sched;
  REQUIRE(sched.Add(0, Noop).get_error() == mwb::TimerError::kInvalidPeriod);
  REQUIRE(sched.Add(10, nullptr).get_error() == mwb::TimerError::kInvalidPeriod);
}

TEST_CASE("TimerScheduler slots full and reuse", "[timer]") {
  mwb::TimerScheduler<2> sched;
  auto r1 = sched.Add(100, Noop);
  auto r2 = sched.Add(100, Noop);
  REQUIRE(r2.has_value());
  auto r3 = sched.Add(100, Noop);
  REQUIRE(r3.get_error() == mwb::TimerError::kSlotsFull);

  REQUIRE(sched.Remove(r1.value()).has_value());
  auto r4 = sched.Add(100, Noop);
  REQUIRE(r4.has_value());
  REQUIRE_FALSE(r4.value() == r1.value());
}

// ============================================================================
// Thread lifecycle
// ============================================================================

TEST_CASE("TimerScheduler Start and Stop", "[timer]") {
  mwb::TimerScheduler<4> sched;
  REQUIRE(sched.Start().has_value());
  REQUIRE(sched.IsRunning());
  REQUIRE(sched.Start().get_error() == mwb::TimerError::kAlreadyRunning);
  sched.Stop();
  REQUIRE_FALSE(sched.IsRunning());
  sched.Stop();

  REQUIRE(sched.Start().has_value());
  sched.Stop();
}

TEST_CASE("TimerScheduler fires periodically", "[timer]") {
  std::atomic<int> counter{0};
  mwb::TimerScheduler<4> sched;
  REQUIRE(sched.Add(10, Count, &counter).has_value());
  REQUIRE(sched.Start().has_value());
  std::this_thread::sleep_for(std::chrono::milliseconds(120));
  sched.Stop();
  REQUIRE(counter.load() >= 2);
}

TEST_CASE("TimerScheduler first fire waits one period", "[timer]") {
  std::atomic<int> counter{0};
  mwb::TimerScheduler<4> sched;
  REQUIRE(sched.Add(5000, Count, &counter).has_value());
  REQUIRE(sched.Start().has_value());
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  sched.Stop();
  REQUIRE(counter.load() == 0);
}

TEST_CASE("TimerScheduler callback runs without the scheduler lock", "[timer]") {
  struct Ctx {
    mwb::TimerScheduler<4>* sched;
    std::atomic<int> added{0};
  } ctx;
  mwb::TimerScheduler<4> sched;
  ctx.sched = &sched;

  // Add() from inside a callback would deadlock if the lock were held.
  REQUIRE(sched.Add(5, [](void* p) {
    auto* c = static_cast<Ctx*>(p);
    if (c->added.load() == 0 && c->sched->Add(10000, Noop).has_value()) {
      c->added.fetch_add(1);
    }
  }, &ctx).has_value());

  REQUIRE(sched.Start().has_value());
  for (int i = 0; i < 200 && ctx.added.load() == 0; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  sched.Stop();
  REQUIRE(ctx.added.load() == 1);
  REQUIRE(sched.TaskCount() == 2);
}

TEST_CASE("TimerScheduler destructor stops thread", "[timer]") {
  std::atomic<int> counter{0};
  {
    mwb::TimerScheduler<1> sched;
    REQUIRE(sched.Add(5, Count, &counter).has_value());
    REQUIRE(sched.Start().has_value());
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
  }
  int after = counter.load();
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  REQUIRE(counter.load() == after);
}
