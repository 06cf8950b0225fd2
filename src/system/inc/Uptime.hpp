#ifndef HEADROOM_SYSTEM_UPTIME_HPP
#define HEADROOM_SYSTEM_UPTIME_HPP
/**
 * @file Uptime.hpp
 * @brief Time since boot and its fallback chain.
 *
 * Chain:
 *  1. ProcUptimeSource   - /proc/uptime (sub-second precision)
 *  2. SysinfoUptimeSource - sysinfo(2) (whole seconds)
 */

#include "src/helpers/inc/Result.hpp"
#include "src/source/inc/Source.hpp"
#include "src/support/inc/FileReader.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace headroom {

namespace system {

inline constexpr const char* PROC_UPTIME_PATH = "/proc/uptime";

/* ----------------------------- UptimeSnapshot ----------------------------- */

struct UptimeSnapshot {
  double totalSeconds{0.0};     ///< Seconds since boot
  std::int64_t bootTimeUnix{0}; ///< Boot time, seconds since the epoch

  [[nodiscard]] std::uint64_t days() const noexcept;
  [[nodiscard]] std::uint64_t hours() const noexcept;   ///< 0-23, after days()
  [[nodiscard]] std::uint64_t minutes() const noexcept; ///< 0-59, after hours()

  /// @brief "3d 4h 5m".
  [[nodiscard]] std::string toString() const;
};

/**
 * @brief Parse /proc/uptime ("<uptime> <idle>").
 * @param content   File content.
 * @param nowUnix   Current wall time, used to derive the boot time.
 * @return Snapshot, or PARSE_FAILURE when the first field is not a number.
 */
[[nodiscard]] Result<UptimeSnapshot> parseProcUptime(std::string_view content,
                                                     std::int64_t nowUnix);

/* ----------------------------- Sources ----------------------------- */

class ProcUptimeSource final : public source::Source<UptimeSnapshot> {
public:
  explicit ProcUptimeSource(std::shared_ptr<const support::IFileReader> reader);

  [[nodiscard]] Result<UptimeSnapshot> read() override;

  [[nodiscard]] const char* name() const noexcept override { return "proc-uptime"; }

private:
  std::shared_ptr<const support::IFileReader> reader_;
};

class SysinfoUptimeSource final : public source::Source<UptimeSnapshot> {
public:
  [[nodiscard]] Result<UptimeSnapshot> read() override;

  [[nodiscard]] const char* name() const noexcept override { return "sysinfo"; }
};

[[nodiscard]] std::unique_ptr<source::Source<UptimeSnapshot>>
createUptimeSource(std::shared_ptr<const support::IFileReader> reader);

} // namespace system

} // namespace headroom

#endif // HEADROOM_SYSTEM_UPTIME_HPP
