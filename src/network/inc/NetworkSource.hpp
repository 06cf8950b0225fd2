#ifndef HEADROOM_NETWORK_NETWORK_SOURCE_HPP
#define HEADROOM_NETWORK_NETWORK_SOURCE_HPP
/**
 * @file NetworkSource.hpp
 * @brief Network snapshot sources and their fallback chain.
 *
 * Chain:
 *  1. ProcNetDevSource  - /proc/net/dev, plus socket states from /proc/net/{tcp,udp}
 *  2. SysClassNetSource - /sys/class/net/<if>/statistics/* (no socket states)
 */

#include "src/helpers/inc/Result.hpp"
#include "src/network/inc/NetworkSnapshot.hpp"
#include "src/source/inc/Source.hpp"
#include "src/support/inc/FileReader.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace headroom {

namespace network {

inline constexpr const char* PROC_NET_DEV_PATH = "/proc/net/dev";
inline constexpr const char* PROC_NET_TCP_PATH = "/proc/net/tcp";
inline constexpr const char* PROC_NET_UDP_PATH = "/proc/net/udp";
inline constexpr const char* SYS_CLASS_NET_PATH = "/sys/class/net";

class ProcNetDevSource final : public source::Source<NetworkSnapshot> {
public:
  explicit ProcNetDevSource(std::shared_ptr<const support::IFileReader> reader);

  /// Connections are attached only when both socket tables are readable.
  [[nodiscard]] Result<NetworkSnapshot> read() override;

  [[nodiscard]] const char* name() const noexcept override { return "proc-net-dev"; }

private:
  std::shared_ptr<const support::IFileReader> reader_;
};

class SysClassNetSource final : public source::Source<NetworkSnapshot> {
public:
  explicit SysClassNetSource(std::shared_ptr<const support::IFileReader> reader);

  /// Unreadable counters read as 0; an unlistable class directory fails.
  [[nodiscard]] Result<NetworkSnapshot> read() override;

  [[nodiscard]] const char* name() const noexcept override { return "sys-class-net"; }

private:
  [[nodiscard]] std::uint64_t readCounter(const std::string& ifname, const char* counter) const;

  std::shared_ptr<const support::IFileReader> reader_;
};

[[nodiscard]] std::unique_ptr<source::Source<NetworkSnapshot>>
createNetworkSource(std::shared_ptr<const support::IFileReader> reader);

} // namespace network

} // namespace headroom

#endif // HEADROOM_NETWORK_NETWORK_SOURCE_HPP
