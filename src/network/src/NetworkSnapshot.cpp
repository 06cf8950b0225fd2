/**
 * @file NetworkSnapshot.cpp
 * @brief /proc/net parsers and NetworkSnapshot totals.
 */

#include "src/network/inc/NetworkSnapshot.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <array>
#include <cstddef>
#include <utility>

#include <fmt/core.h>

namespace headroom {

namespace network {

namespace {

using headroom::helpers::strings::parseUint64;
using headroom::helpers::strings::splitLines;
using headroom::helpers::strings::splitWhitespace;
using headroom::helpers::strings::trim;

/// Receive (8) plus transmit (8) columns.
constexpr std::size_t NET_DEV_FIELD_COUNT = 16;

/// Column of the socket state in /proc/net/{tcp,udp}.
constexpr std::size_t SOCKET_STATE_COLUMN = 3;

constexpr std::string_view TCP_ESTABLISHED = "01";
constexpr std::string_view TCP_TIME_WAIT = "06";
constexpr std::string_view TCP_LISTEN = "0A";
constexpr std::string_view UDP_CLOSE = "07";

/// Invoke @p fn with the state column of every table row after the header.
template <typename Fn> void forEachSocketState(std::string_view content, Fn&& fn) {
  const auto LINES = splitLines(content);
  for (std::size_t i = 1; i < LINES.size(); ++i) {
    const auto FIELDS = splitWhitespace(LINES[i]);
    if (FIELDS.size() <= SOCKET_STATE_COLUMN) {
      continue;
    }
    fn(FIELDS[SOCKET_STATE_COLUMN]);
  }
}

} // namespace

/* ----------------------------- NetworkSnapshot ----------------------------- */

std::uint64_t NetworkSnapshot::totalRxBytes() const noexcept {
  std::uint64_t sum = 0;
  for (const InterfaceCounters& c : interfaces) {
    sum += c.rxBytes;
  }
  return sum;
}

std::uint64_t NetworkSnapshot::totalTxBytes() const noexcept {
  std::uint64_t sum = 0;
  for (const InterfaceCounters& c : interfaces) {
    sum += c.txBytes;
  }
  return sum;
}

std::uint64_t NetworkSnapshot::totalRxPackets() const noexcept {
  std::uint64_t sum = 0;
  for (const InterfaceCounters& c : interfaces) {
    sum += c.rxPackets;
  }
  return sum;
}

std::uint64_t NetworkSnapshot::totalTxPackets() const noexcept {
  std::uint64_t sum = 0;
  for (const InterfaceCounters& c : interfaces) {
    sum += c.txPackets;
  }
  return sum;
}

const InterfaceCounters* NetworkSnapshot::findInterface(std::string_view name) const noexcept {
  for (const InterfaceCounters& c : interfaces) {
    if (c.name == name) {
      return &c;
    }
  }
  return nullptr;
}

std::string NetworkSnapshot::toString() const {
  std::string out;
  out += fmt::format("Interfaces: {}\n", interfaces.size());
  for (const InterfaceCounters& c : interfaces) {
    out += fmt::format("  {}: rx={} tx={} bytes, rx={} tx={} pkts", c.name, c.rxBytes, c.txBytes,
                       c.rxPackets, c.txPackets);
    if (c.totalErrors() > 0 || c.totalDrops() > 0) {
      out += fmt::format(" [errors={} drops={}]", c.totalErrors(), c.totalDrops());
    }
    out += '\n';
  }
  if (connections) {
    out += fmt::format("TCP: established={} listening={} time_wait={}\n",
                       connections->tcpEstablished, connections->tcpListening,
                       connections->tcpTimeWait);
    out += fmt::format("UDP: listening={}\n", connections->udpListening);
  }
  return out;
}

/* ----------------------------- Parsing ----------------------------- */

Result<std::vector<InterfaceCounters>> parseProcNetDev(std::string_view content) {
  std::vector<InterfaceCounters> out;

  for (const std::string_view LINE : splitLines(content)) {
    const std::size_t COLON = LINE.find(':');
    if (COLON == std::string_view::npos) {
      continue;
    }
    const std::string_view NAME = trim(LINE.substr(0, COLON));
    if (NAME.empty() || NAME.find('|') != std::string_view::npos) {
      continue;
    }

    const auto FIELDS = splitWhitespace(LINE.substr(COLON + 1));
    if (FIELDS.size() < NET_DEV_FIELD_COUNT) {
      continue;
    }
    std::array<std::uint64_t, NET_DEV_FIELD_COUNT> vals{};
    bool ok = true;
    for (std::size_t i = 0; i < NET_DEV_FIELD_COUNT && ok; ++i) {
      const auto V = parseUint64(FIELDS[i]);
      ok = V.has_value();
      vals[i] = V.value_or(0);
    }
    if (!ok) {
      continue;
    }

    InterfaceCounters c{};
    c.name = std::string(NAME);
    c.rxBytes = vals[0];
    c.rxPackets = vals[1];
    c.rxErrors = vals[2];
    c.rxDropped = vals[3];
    c.txBytes = vals[8];
    c.txPackets = vals[9];
    c.txErrors = vals[10];
    c.txDropped = vals[11];
    out.push_back(std::move(c));
  }

  return Result<std::vector<InterfaceCounters>>::success(std::move(out));
}

ConnectionStats parseSocketTable(std::string_view tcpContent, std::string_view udpContent) {
  ConnectionStats stats{};
  forEachSocketState(tcpContent, [&stats](std::string_view state) {
    if (state == TCP_ESTABLISHED) {
      ++stats.tcpEstablished;
    } else if (state == TCP_LISTEN) {
      ++stats.tcpListening;
    } else if (state == TCP_TIME_WAIT) {
      ++stats.tcpTimeWait;
    }
  });
  forEachSocketState(udpContent, [&stats](std::string_view state) {
    if (state == UDP_CLOSE) {
      ++stats.udpListening;
    }
  });
  return stats;
}

} // namespace network

} // namespace headroom
