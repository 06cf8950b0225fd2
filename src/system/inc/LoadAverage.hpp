#ifndef HEADROOM_SYSTEM_LOAD_AVERAGE_HPP
#define HEADROOM_SYSTEM_LOAD_AVERAGE_HPP
/**
 * @file LoadAverage.hpp
 * @brief 1/5/15-minute run-queue averages and their fallback chain.
 *
 * Chain:
 *  1. ProcLoadavgSource    - /proc/loadavg (averages plus task counts)
 *  2. GetloadavgSource     - getloadavg(3) (averages only)
 */

#include "src/helpers/inc/Result.hpp"
#include "src/source/inc/Source.hpp"
#include "src/support/inc/FileReader.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace headroom {

namespace system {

inline constexpr const char* PROC_LOADAVG_PATH = "/proc/loadavg";

/* ----------------------------- LoadAverageSnapshot ----------------------------- */

struct LoadAverageSnapshot {
  double oneMinute{0.0};
  double fiveMinutes{0.0};
  double fifteenMinutes{0.0};
  std::optional<std::uint64_t> runningTasks{}; ///< Currently runnable entities
  std::optional<std::uint64_t> totalTasks{};   ///< Existing kernel scheduling entities

  /// Averages divided by @p cores; unchanged when @p cores is 0.
  [[nodiscard]] LoadAverageSnapshot normalized(std::size_t cores) const noexcept;

  /// @brief "0.52 0.58 0.59".
  [[nodiscard]] std::string toString() const;
};

/**
 * @brief Parse /proc/loadavg ("0.52 0.58 0.59 2/1043 12345").
 * @return Snapshot, or PARSE_FAILURE when fewer than three averages parse.
 */
[[nodiscard]] Result<LoadAverageSnapshot> parseProcLoadavg(std::string_view content);

/* ----------------------------- Sources ----------------------------- */

class ProcLoadavgSource final : public source::Source<LoadAverageSnapshot> {
public:
  explicit ProcLoadavgSource(std::shared_ptr<const support::IFileReader> reader);

  [[nodiscard]] Result<LoadAverageSnapshot> read() override;

  [[nodiscard]] const char* name() const noexcept override { return "proc-loadavg"; }

private:
  std::shared_ptr<const support::IFileReader> reader_;
};

class GetloadavgSource final : public source::Source<LoadAverageSnapshot> {
public:
  [[nodiscard]] Result<LoadAverageSnapshot> read() override;

  [[nodiscard]] const char* name() const noexcept override { return "getloadavg"; }
};

[[nodiscard]] std::unique_ptr<source::Source<LoadAverageSnapshot>>
createLoadAverageSource(std::shared_ptr<const support::IFileReader> reader);

} // namespace system

} // namespace headroom

#endif // HEADROOM_SYSTEM_LOAD_AVERAGE_HPP
