/**
 * @file RateCache.cpp
 * @brief Counter-to-rate conversion.
 */

#include "src/cgroup/inc/RateCache.hpp"
#include "src/helpers/inc/Log.hpp"

#include <utility>

namespace headroom {

namespace cgroup {

RateCache::RateCache() : RateCache(helpers::clock::systemClock()) {}

RateCache::RateCache(helpers::clock::MonotonicClock clock)
    : clock_(helpers::clock::orSystemClock(std::move(clock))) {}

std::optional<double> RateCache::computeRate(const std::string& key, double rawValue,
                                             double scaleToSeconds) {
  const double NOW =
      static_cast<double>(clock_()) / static_cast<double>(helpers::clock::NS_PER_SECOND);

  std::optional<RateSample> prev;
  const auto IT = samples_.find(key);
  if (IT != samples_.end()) {
    prev = IT->second;
  }
  samples_[key] = RateSample{rawValue, NOW};

  if (!prev) {
    helpers::log::logger()->debug("Rate warm-up for {}", key);
    return std::nullopt;
  }
  if (scaleToSeconds <= 0.0) {
    return std::nullopt;
  }

  const double DELTA_VALUE = rawValue - prev->value;
  const double DELTA_TIME = NOW - prev->timestamp;
  if (DELTA_VALUE < 0.0) {
    helpers::log::logger()->debug("Counter reset for {} ({} -> {})", key, prev->value, rawValue);
    return std::nullopt;
  }
  if (DELTA_TIME <= 0.0) {
    return std::nullopt;
  }

  return (DELTA_VALUE / scaleToSeconds) / DELTA_TIME;
}

std::optional<RateSample> RateCache::lastSample(const std::string& key) const {
  const auto IT = samples_.find(key);
  if (IT == samples_.end()) {
    return std::nullopt;
  }
  return IT->second;
}

} // namespace cgroup

} // namespace headroom
