#ifndef HEADROOM_HELPERS_CLOCK_HPP
#define HEADROOM_HELPERS_CLOCK_HPP
/**
 * @file Clock.hpp
 * @brief Monotonic timestamps and the injectable clock used by stateful samplers.
 *
 * All snapshot timestamps in headroom are CLOCK_MONOTONIC nanoseconds. Components
 * that compute rates accept a MonotonicClock so tests can drive time explicitly.
 */

#include <chrono>
#include <cmath>
#include <cstdint>
#include <ctime> // clock_gettime, CLOCK_MONOTONIC
#include <functional>
#include <thread>
#include <utility>

namespace headroom {
namespace helpers {
namespace clock {

/* ----------------------------- Types ----------------------------- */

/// Source of monotonic nanosecond timestamps.
using MonotonicClock = std::function<std::uint64_t()>;

/* ----------------------------- Constants ----------------------------- */

inline constexpr std::uint64_t NS_PER_SECOND = 1'000'000'000ULL;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Get monotonic timestamp in nanoseconds.
 *
 * Uses CLOCK_MONOTONIC, unaffected by wall-clock adjustments.
 *
 * @note Syscall (clock_gettime), typically vDSO-accelerated.
 */
[[nodiscard]] inline std::uint64_t getMonotonicNs() noexcept {
  struct timespec ts{};
  ::clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<std::uint64_t>(ts.tv_sec) * NS_PER_SECOND +
         static_cast<std::uint64_t>(ts.tv_nsec);
}

/// The system monotonic clock as a MonotonicClock.
[[nodiscard]] inline MonotonicClock systemClock() { return &getMonotonicNs; }

/// Use @p clock when set, otherwise the system monotonic clock.
[[nodiscard]] inline MonotonicClock orSystemClock(MonotonicClock clock) {
  return clock ? std::move(clock) : systemClock();
}

/**
 * @brief Seconds elapsed from @p startNs to @p endNs, 0 if the end precedes the start.
 */
[[nodiscard]] constexpr double elapsedSeconds(std::uint64_t startNs,
                                              std::uint64_t endNs) noexcept {
  if (endNs <= startNs) {
    return 0.0;
  }
  return static_cast<double>(endNs - startNs) / static_cast<double>(NS_PER_SECOND);
}

/// Block the calling thread for @p seconds. Non-positive, NaN and infinite values return at once.
inline void sleepForSeconds(double seconds) {
  if (!std::isfinite(seconds) || seconds <= 0.0) {
    return;
  }
  std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
}

} // namespace clock
} // namespace helpers
} // namespace headroom

#endif // HEADROOM_HELPERS_CLOCK_HPP
