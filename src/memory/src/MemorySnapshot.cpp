/**
 * @file MemorySnapshot.cpp
 * @brief /proc/meminfo parsing and memory percentages.
 */

#include "src/memory/inc/MemorySnapshot.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <optional>
#include <vector>

#include <fmt/core.h>

namespace headroom {

namespace memory {

using headroom::helpers::format::bytesBinary;
using headroom::helpers::strings::parseUint64;
using headroom::helpers::strings::splitLines;
using headroom::helpers::strings::splitWhitespace;

namespace {

inline double sharePercent(std::uint64_t part, std::uint64_t whole) noexcept {
  return (whole == 0) ? 0.0 : static_cast<double>(part) * 100.0 / static_cast<double>(whole);
}

inline std::uint64_t floorSub(std::uint64_t a, std::uint64_t b) noexcept {
  return (a > b) ? (a - b) : 0;
}

/// Parsed values of interest, absent when the key was not seen.
struct MeminfoFields {
  std::optional<std::uint64_t> total;
  std::optional<std::uint64_t> free;
  std::optional<std::uint64_t> available;
  std::uint64_t buffers{0};
  std::uint64_t cached{0};
  std::uint64_t swapTotal{0};
  std::uint64_t swapFree{0};
};

/// "MemTotal:  16318480 kB" -> bytes. Values without a unit are taken as bytes.
std::optional<std::uint64_t> parseMeminfoValue(const std::vector<std::string_view>& tokens) {
  if (tokens.size() < 2) {
    return std::nullopt;
  }
  const auto VALUE = parseUint64(tokens[1]);
  if (!VALUE) {
    return std::nullopt;
  }
  if (tokens.size() >= 3 && tokens[2] == "kB") {
    return *VALUE * 1024ULL;
  }
  return VALUE;
}

} // namespace

/* ----------------------------- MemorySnapshot ----------------------------- */

double MemorySnapshot::usedPercentage() const noexcept {
  return sharePercent(usedBytes, totalBytes);
}

double MemorySnapshot::availablePercentage() const noexcept {
  return sharePercent(availableBytes, totalBytes);
}

double MemorySnapshot::swapUsedPercentage() const noexcept {
  return sharePercent(swapUsedBytes, swapTotalBytes);
}

std::string MemorySnapshot::toString() const {
  std::string out;
  out += fmt::format("Total:     {}\n", bytesBinary(totalBytes));
  out += fmt::format("Used:      {} ({:.1f}%)\n", bytesBinary(usedBytes), usedPercentage());
  out += fmt::format("Free:      {}\n", bytesBinary(freeBytes));
  out += fmt::format("Available: {} ({:.1f}%)\n", bytesBinary(availableBytes),
                     availablePercentage());
  out += fmt::format("Buffers:   {}\n", bytesBinary(buffersBytes));
  out += fmt::format("Cached:    {}\n", bytesBinary(cachedBytes));
  if (hasSwap()) {
    out += fmt::format("Swap:      {} / {} ({:.1f}%)\n", bytesBinary(swapUsedBytes),
                       bytesBinary(swapTotalBytes), swapUsedPercentage());
  } else {
    out += "Swap:      none\n";
  }
  return out;
}

/* ----------------------------- Parsing ----------------------------- */

Result<MemorySnapshot> parseMeminfo(std::string_view content) {
  MeminfoFields f{};

  for (const std::string_view LINE : splitLines(content)) {
    const auto TOKENS = splitWhitespace(LINE);
    if (TOKENS.empty()) {
      continue;
    }
    const std::string_view KEY = TOKENS[0];
    const auto VALUE = parseMeminfoValue(TOKENS);
    if (!VALUE) {
      continue;
    }

    if (KEY == "MemTotal:") {
      f.total = VALUE;
    } else if (KEY == "MemFree:") {
      f.free = VALUE;
    } else if (KEY == "MemAvailable:") {
      f.available = VALUE;
    } else if (KEY == "Buffers:") {
      f.buffers = *VALUE;
    } else if (KEY == "Cached:") {
      f.cached = *VALUE;
    } else if (KEY == "SwapTotal:") {
      f.swapTotal = *VALUE;
    } else if (KEY == "SwapFree:") {
      f.swapFree = *VALUE;
    }
  }

  if (!f.total || !f.free) {
    return Result<MemorySnapshot>::failure(ErrorCode::PARSE_FAILURE,
                                           "Missing MemTotal or MemFree in meminfo");
  }

  MemorySnapshot snap{};
  snap.totalBytes = *f.total;
  snap.freeBytes = *f.free;
  snap.availableBytes = f.available.value_or(*f.free);
  snap.buffersBytes = f.buffers;
  snap.cachedBytes = f.cached;
  snap.usedBytes = floorSub(snap.totalBytes, snap.freeBytes + snap.buffersBytes + snap.cachedBytes);
  snap.swapTotalBytes = f.swapTotal;
  snap.swapFreeBytes = f.swapFree;
  snap.swapUsedBytes = floorSub(f.swapTotal, f.swapFree);
  return Result<MemorySnapshot>::success(snap);
}

} // namespace memory

} // namespace headroom
