#ifndef HEADROOM_CGROUP_RATE_CACHE_HPP
#define HEADROOM_CGROUP_RATE_CACHE_HPP
/**
 * @file RateCache.hpp
 * @brief Turns successive samples of a cumulative counter into a per-second rate.
 * @note NOT thread-safe: Each parser owns its own instance.
 *
 * computeRate() always records the new sample. It returns a rate only when a
 * previous sample exists for the same key, the counter did not go backwards,
 * and time advanced:
 *
 *   rate = ((value - prev.value) / scaleToSeconds) / (now - prev.timestamp)
 *
 * With scaleToSeconds = 1e9 and a nanosecond usage counter, the rate is in
 * cores (CPU-seconds per wall second).
 */

#include "src/helpers/inc/Clock.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

namespace headroom {

namespace cgroup {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Last observed raw counter value and when it was read.
 */
struct RateSample {
  double value{0.0};     ///< Raw counter value
  double timestamp{0.0}; ///< Monotonic seconds
};

/* ----------------------------- RateCache ----------------------------- */

class RateCache {
public:
  /// Uses the system monotonic clock.
  RateCache();

  explicit RateCache(helpers::clock::MonotonicClock clock);

  /**
   * @brief Record a sample and derive a rate against the previous one.
   * @param key            Sample identity (e.g. resolved file path).
   * @param rawValue       Current cumulative counter value.
   * @param scaleToSeconds Counter units per second (1e9 for ns, 1e6 for us).
   * @return Rate, or nullopt on first sample, counter reset, non-advancing
   *         time, or non-positive scale.
   */
  [[nodiscard]] std::optional<double> computeRate(const std::string& key, double rawValue,
                                                  double scaleToSeconds);

  /// Last sample recorded for @p key.
  [[nodiscard]] std::optional<RateSample> lastSample(const std::string& key) const;

  [[nodiscard]] std::size_t size() const noexcept { return samples_.size(); }

  void reset() noexcept { samples_.clear(); }

private:
  helpers::clock::MonotonicClock clock_;
  std::unordered_map<std::string, RateSample> samples_;
};

} // namespace cgroup

} // namespace headroom

#endif // HEADROOM_CGROUP_RATE_CACHE_HPP
