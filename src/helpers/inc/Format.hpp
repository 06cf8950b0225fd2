#ifndef HEADROOM_HELPERS_FORMAT_HPP
#define HEADROOM_HELPERS_FORMAT_HPP
/**
 * @file Format.hpp
 * @brief Human-readable formatting for bytes, percentages and optional values.
 *
 * Shared by every toString() and by the CLI tools so output stays consistent.
 *
 * @note All functions return std::string. Use in cold paths only.
 */

#include <cstdint>
#include <optional>
#include <string>

#include <fmt/core.h>
#include <fmt/format.h>

namespace headroom {
namespace helpers {
namespace format {

/* ----------------------------- API ----------------------------- */

/**
 * @brief Format bytes using binary units (KiB, MiB, GiB, TiB).
 * @param bytes Byte count.
 * @return Formatted string (e.g., "1.5 GiB").
 */
[[nodiscard]] inline std::string bytesBinary(std::uint64_t bytes) {
  if (bytes == 0) {
    return "0 B";
  }

  static constexpr std::uint64_t KIB = 1024ULL;
  static constexpr std::uint64_t MIB = KIB * 1024ULL;
  static constexpr std::uint64_t GIB = MIB * 1024ULL;
  static constexpr std::uint64_t TIB = GIB * 1024ULL;

  if (bytes >= TIB) {
    return fmt::format("{:.1f} TiB", static_cast<double>(bytes) / static_cast<double>(TIB));
  }
  if (bytes >= GIB) {
    return fmt::format("{:.1f} GiB", static_cast<double>(bytes) / static_cast<double>(GIB));
  }
  if (bytes >= MIB) {
    return fmt::format("{:.1f} MiB", static_cast<double>(bytes) / static_cast<double>(MIB));
  }
  if (bytes >= KIB) {
    return fmt::format("{:.1f} KiB", static_cast<double>(bytes) / static_cast<double>(KIB));
  }

  return fmt::format("{} B", bytes);
}

/// Signed variant; negative values keep their sign ("-1.5 MiB").
[[nodiscard]] inline std::string bytesBinarySigned(std::int64_t bytes) {
  if (bytes < 0) {
    return "-" + bytesBinary(static_cast<std::uint64_t>(-(bytes + 1)) + 1U);
  }
  return bytesBinary(static_cast<std::uint64_t>(bytes));
}

/// "42.5%".
[[nodiscard]] inline std::string percent(double value) { return fmt::format("{:.1f}%", value); }

/// Byte count or "unlimited".
[[nodiscard]] inline std::string optionalBytes(const std::optional<std::int64_t>& bytes) {
  if (!bytes) {
    return "unlimited";
  }
  return bytesBinarySigned(*bytes);
}

/// Floating value with two decimals, or "n/a".
[[nodiscard]] inline std::string optionalFixed(const std::optional<double>& value) {
  if (!value) {
    return "n/a";
  }
  return fmt::format("{:.2f}", *value);
}

/// Counter value or "n/a".
[[nodiscard]] inline std::string optionalCount(const std::optional<std::uint64_t>& value) {
  if (!value) {
    return "n/a";
  }
  return fmt::format("{}", *value);
}

} // namespace format
} // namespace helpers
} // namespace headroom

#endif // HEADROOM_HELPERS_FORMAT_HPP
