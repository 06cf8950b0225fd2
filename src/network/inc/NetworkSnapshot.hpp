#ifndef HEADROOM_NETWORK_NETWORK_SNAPSHOT_HPP
#define HEADROOM_NETWORK_NETWORK_SNAPSHOT_HPP
/**
 * @file NetworkSnapshot.hpp
 * @brief Per-interface traffic counters and socket state counts.
 * @note Thread-safe: Value types and pure parsers.
 *
 * Counters are cumulative since boot (or since the interface came up).
 */

#include "src/helpers/inc/Result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace headroom {

namespace network {

/* ----------------------------- InterfaceCounters ----------------------------- */

struct InterfaceCounters {
  std::string name;             ///< Interface name ("eth0")
  std::uint64_t rxBytes{0};     ///< Bytes received
  std::uint64_t txBytes{0};     ///< Bytes transmitted
  std::uint64_t rxPackets{0};   ///< Packets received
  std::uint64_t txPackets{0};   ///< Packets transmitted
  std::uint64_t rxErrors{0};    ///< Receive errors
  std::uint64_t txErrors{0};    ///< Transmit errors
  std::uint64_t rxDropped{0};   ///< Receive drops
  std::uint64_t txDropped{0};   ///< Transmit drops

  [[nodiscard]] std::uint64_t totalErrors() const noexcept { return rxErrors + txErrors; }
  [[nodiscard]] std::uint64_t totalDrops() const noexcept { return rxDropped + txDropped; }
};

/* ----------------------------- ConnectionStats ----------------------------- */

/**
 * @brief Socket counts by state from /proc/net/tcp and /proc/net/udp.
 */
struct ConnectionStats {
  std::uint64_t tcpEstablished{0}; ///< State 01
  std::uint64_t tcpListening{0};   ///< State 0A
  std::uint64_t tcpTimeWait{0};    ///< State 06
  std::uint64_t udpListening{0};   ///< State 07 (unconnected, bound)

  [[nodiscard]] std::uint64_t total() const noexcept {
    return tcpEstablished + tcpListening + tcpTimeWait + udpListening;
  }
};

/* ----------------------------- NetworkSnapshot ----------------------------- */

struct NetworkSnapshot {
  std::vector<InterfaceCounters> interfaces;
  std::optional<ConnectionStats> connections{}; ///< Absent when socket tables are unreadable

  [[nodiscard]] std::uint64_t totalRxBytes() const noexcept;
  [[nodiscard]] std::uint64_t totalTxBytes() const noexcept;
  [[nodiscard]] std::uint64_t totalRxPackets() const noexcept;
  [[nodiscard]] std::uint64_t totalTxPackets() const noexcept;

  /// Counters of interface @p name, or nullptr.
  [[nodiscard]] const InterfaceCounters* findInterface(std::string_view name) const noexcept;

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Parse /proc/net/dev.
 *
 * The two header lines and any line without a "name:" prefix followed by at
 * least 16 counters are skipped.
 */
[[nodiscard]] Result<std::vector<InterfaceCounters>> parseProcNetDev(std::string_view content);

/**
 * @brief Count sockets by state in /proc/net/tcp and /proc/net/udp content.
 *
 * The first line of each table is a header. The state is the fourth column.
 */
[[nodiscard]] ConnectionStats parseSocketTable(std::string_view tcpContent,
                                               std::string_view udpContent);

} // namespace network

} // namespace headroom

#endif // HEADROOM_NETWORK_NETWORK_SNAPSHOT_HPP
