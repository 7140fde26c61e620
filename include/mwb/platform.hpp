/**
 * @file platform.hpp
 * @brief Platform detection, compiler hints, assertion macro and clocks.
 */

#ifndef MWB_PLATFORM_HPP_
#define MWB_PLATFORM_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace mwb {

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__linux__)
#define MWB_PLATFORM_LINUX 1
#elif defined(__APPLE__)
#define MWB_PLATFORM_MACOS 1
#elif defined(_WIN32)
#define MWB_PLATFORM_WINDOWS 1
#endif

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
#define MWB_LIKELY(x) __builtin_expect(!!(x), 1)
#define MWB_UNLIKELY(x) __builtin_expect(!!(x), 0)
#define MWB_UNUSED __attribute__((unused))
#else
#define MWB_LIKELY(x) (x)
#define MWB_UNLIKELY(x) (x)
#define MWB_UNUSED
#endif

// ============================================================================
// Assert Macro
// ============================================================================

namespace detail {

/**
 * @brief Called when an assertion fails in debug mode.
 *
 * Prints the failed condition, file, and line to stderr, then aborts.
 */
inline void AssertFail(const char* cond, const char* file, int line) {
  (void)std::fprintf(stderr, "MWB_ASSERT failed: %s at %s:%d\n", cond, file,
                     line);
  std::abort();
}

}  // namespace detail

#ifdef NDEBUG
#define MWB_ASSERT(cond) ((void)0)
#else
#define MWB_ASSERT(cond) \
  ((cond) ? ((void)0) : ::mwb::detail::AssertFail(#cond, __FILE__, __LINE__))
#endif

// ============================================================================
// Clock - time source for throttling and staleness
// ============================================================================

/**
 * @brief Time source injected into the stores.
 *
 * Monotonic milliseconds drive the target-frame throttle; wall-clock seconds
 * drive staleness eviction and event timestamps.
 */
class Clock {
 public:
  virtual ~Clock() = default;

  virtual uint64_t MonotonicMs() const noexcept = 0;
  virtual double WallSeconds() const noexcept = 0;
};

/// @brief Clock backed by steady_clock / system_clock.
class SystemClock final : public Clock {
 public:
  uint64_t MonotonicMs() const noexcept override {
    auto dur = std::chrono::steady_clock::now().time_since_epoch();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(dur).count());
  }

  double WallSeconds() const noexcept override {
    auto dur = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(dur).count();
  }

  /// @brief Process-wide default instance.
  static const SystemClock& Instance() noexcept {
    static SystemClock clock;
    return clock;
  }
};

// ============================================================================
// Macro Helpers
// ============================================================================

#define MWB_CONCAT_IMPL(a, b) a##b
#define MWB_CONCAT(a, b) MWB_CONCAT_IMPL(a, b)

}  // namespace mwb

#endif  // MWB_PLATFORM_HPP_
