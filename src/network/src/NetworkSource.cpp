/**
 * @file NetworkSource.cpp
 * @brief procfs and sysfs network sources.
 */

#include "src/network/inc/NetworkSource.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/source/inc/FallbackSource.hpp"
#include "src/support/inc/Platform.hpp"

#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace headroom {

namespace network {

using headroom::helpers::strings::parseUint64;

/* ----------------------------- ProcNetDevSource ----------------------------- */

ProcNetDevSource::ProcNetDevSource(std::shared_ptr<const support::IFileReader> reader)
    : reader_(std::move(reader)) {}

Result<NetworkSnapshot> ProcNetDevSource::read() {
  const auto DEV = reader_->read(PROC_NET_DEV_PATH);
  if (DEV.isFailure()) {
    return Result<NetworkSnapshot>::failure(DEV.error());
  }
  auto ifaces = parseProcNetDev(DEV.value());
  if (ifaces.isFailure()) {
    return Result<NetworkSnapshot>::failure(ifaces.error());
  }

  NetworkSnapshot snap{};
  snap.interfaces = std::move(ifaces).value();

  const auto TCP = reader_->read(PROC_NET_TCP_PATH);
  const auto UDP = reader_->read(PROC_NET_UDP_PATH);
  if (TCP.isSuccess() && UDP.isSuccess()) {
    snap.connections = parseSocketTable(TCP.value(), UDP.value());
  }
  return Result<NetworkSnapshot>::success(std::move(snap));
}

/* ----------------------------- SysClassNetSource ----------------------------- */

SysClassNetSource::SysClassNetSource(std::shared_ptr<const support::IFileReader> reader)
    : reader_(std::move(reader)) {}

std::uint64_t SysClassNetSource::readCounter(const std::string& ifname,
                                             const char* counter) const {
  const auto CONTENT =
      reader_->read(fmt::format("{}/{}/statistics/{}", SYS_CLASS_NET_PATH, ifname, counter));
  if (CONTENT.isFailure()) {
    return 0;
  }
  return parseUint64(CONTENT.value()).value_or(0);
}

Result<NetworkSnapshot> SysClassNetSource::read() {
  const auto NAMES = reader_->list(SYS_CLASS_NET_PATH);
  if (NAMES.isFailure()) {
    return Result<NetworkSnapshot>::failure(NAMES.error());
  }

  NetworkSnapshot snap{};
  for (const std::string& ifname : NAMES.value()) {
    InterfaceCounters c{};
    c.name = ifname;
    c.rxBytes = readCounter(ifname, "rx_bytes");
    c.txBytes = readCounter(ifname, "tx_bytes");
    c.rxPackets = readCounter(ifname, "rx_packets");
    c.txPackets = readCounter(ifname, "tx_packets");
    c.rxErrors = readCounter(ifname, "rx_errors");
    c.txErrors = readCounter(ifname, "tx_errors");
    c.rxDropped = readCounter(ifname, "rx_dropped");
    c.txDropped = readCounter(ifname, "tx_dropped");
    snap.interfaces.push_back(std::move(c));
  }
  return Result<NetworkSnapshot>::success(std::move(snap));
}

/* ----------------------------- Factory ----------------------------- */

std::unique_ptr<source::Source<NetworkSnapshot>>
createNetworkSource(std::shared_ptr<const support::IFileReader> reader) {
  std::vector<std::unique_ptr<source::Source<NetworkSnapshot>>> chain;
  if constexpr (support::currentPlatform() == support::Platform::LINUX) {
    chain.push_back(std::make_unique<ProcNetDevSource>(reader));
    chain.push_back(std::make_unique<SysClassNetSource>(std::move(reader)));
  }
  return std::make_unique<source::FallbackSource<NetworkSnapshot>>("network", std::move(chain));
}

} // namespace network

} // namespace headroom
