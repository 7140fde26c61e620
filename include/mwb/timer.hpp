/**
 * @file timer.hpp
 * @brief Periodic timer task scheduler driving the stale-device sweep.
 *
 * One background thread fires registered callbacks at fixed periods,
 * measured on std::chrono::steady_clock. Callbacks run on the scheduler
 * thread with no scheduler lock held, so a callback may call Add() or
 * Remove() on its own scheduler.
 */

#ifndef MWB_TIMER_HPP_
#define MWB_TIMER_HPP_

#include "mwb/log.hpp"
#include "mwb/platform.hpp"
#include "mwb/vocabulary.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace mwb {

enum class TimerError : uint8_t {
  kInvalidPeriod = 0,
  kSlotsFull,
  kNotFound,
  kAlreadyRunning,
};

/// Opaque handle returned by TimerScheduler::Add().
class TimerTaskId {
 public:
  constexpr explicit TimerTaskId(uint32_t v = 0) noexcept : v_(v) {}
  constexpr uint32_t value() const noexcept { return v_; }
  constexpr bool operator==(TimerTaskId o) const noexcept { return v_ == o.v_; }

 private:
  uint32_t v_;
};

/**
 * @param ctx  User-supplied context pointer (may be nullptr).
 */
using TimerTaskFn = void (*)(void* ctx);

/**
 * @brief Fixed-capacity periodic scheduler.
 *
 * @code
 *   mwb::TimerScheduler<4> sched;
 *   sched.Add(60000, &Bridge::SweepTick, this);
 *   sched.Start();
 *   ...
 *   sched.Stop();
 * @endcode
 */
template <uint32_t MaxTasks = 8>
class TimerScheduler final {
  static_assert(MaxTasks > 0, "TimerScheduler needs at least one slot");

 public:
  TimerScheduler() = default;
  ~TimerScheduler() { Stop(); }

  TimerScheduler(const TimerScheduler&) = delete;
  TimerScheduler& operator=(const TimerScheduler&) = delete;

  /**
   * @brief Register a task firing every @p period_ms, first after one period.
   * @return kInvalidPeriod for 0 ms, kSlotsFull when no slot is free.
   */
  expected<TimerTaskId, TimerError> Add(uint32_t period_ms, TimerTaskFn fn,
                                        void* ctx = nullptr) {
    using Result = expected<TimerTaskId, TimerError>;
    if (period_ms == 0U || fn == nullptr) {
      return Result::error(TimerError::kInvalidPeriod);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& slot : slots_) {
      if (slot.active) continue;
      slot.fn = fn;
      slot.ctx = ctx;
      slot.period = std::chrono::milliseconds(period_ms);
      slot.next_fire = Now() + slot.period;
      slot.id = next_id_++;
      slot.active = true;
      wake_.notify_all();
      return Result::success(TimerTaskId(slot.id));
    }
    return Result::error(TimerError::kSlotsFull);
  }

  expected<void, TimerError> Remove(TimerTaskId task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& slot : slots_) {
      if (slot.active && slot.id == task_id.value()) {
        slot.active = false;
        return expected<void, TimerError>::success();
      }
    }
    return expected<void, TimerError>::error(TimerError::kNotFound);
  }

  expected<void, TimerError> Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_.load(std::memory_order_acquire)) {
      return expected<void, TimerError>::error(TimerError::kAlreadyRunning);
    }
    running_.store(true, std::memory_order_release);
    worker_ = std::thread(&TimerScheduler::ScheduleLoop, this);
    return expected<void, TimerError>::success();
  }

  /// Blocks until the scheduler thread exits. Safe when not running.
  void Stop() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      running_.store(false, std::memory_order_release);
      wake_.notify_all();
    }
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
      worker_.join();
    }
  }

  bool IsRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

  uint32_t TaskCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t count = 0U;
    for (const auto& slot : slots_) {
      if (slot.active) ++count;
    }
    return count;
  }

 private:
  using SteadyClock = std::chrono::steady_clock;

  struct TaskSlot {
    TimerTaskFn fn = nullptr;
    void* ctx = nullptr;
    std::chrono::milliseconds period{0};
    SteadyClock::time_point next_fire{};
    uint32_t id = 0;
    bool active = false;
  };

  struct DueTask {
    TimerTaskFn fn;
    void* ctx;
  };

  static SteadyClock::time_point Now() noexcept { return SteadyClock::now(); }

  void ScheduleLoop() {
    MWB_LOG_DEBUG("Timer", "scheduler thread started");
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_.load(std::memory_order_acquire)) {
      const auto now = Now();
      std::array<DueTask, MaxTasks> due{};
      uint32_t due_count = 0U;
      auto next_wake = now + std::chrono::seconds(1);

      for (auto& slot : slots_) {
        if (!slot.active) continue;
        if (now >= slot.next_fire) {
          due[due_count++] = DueTask{slot.fn, slot.ctx};
          // Skip missed periods instead of firing a burst.
          while (slot.next_fire <= now) slot.next_fire += slot.period;
        }
        if (slot.next_fire < next_wake) next_wake = slot.next_fire;
      }

      if (due_count > 0U) {
        lock.unlock();
        for (uint32_t i = 0U; i < due_count; ++i) due[i].fn(due[i].ctx);
        lock.lock();
        continue;
      }
      wake_.wait_until(lock, next_wake);
    }
    MWB_LOG_DEBUG("Timer", "scheduler thread stopped");
  }

  std::array<TaskSlot, MaxTasks> slots_{};
  uint32_t next_id_ = 1;
  std::atomic<bool> running_{false};
  std::thread worker_;
  mutable std::mutex mutex_;
  std::condition_variable wake_;
};

}  // namespace mwb

#endif  // MWB_TIMER_HPP_
