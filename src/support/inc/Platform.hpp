#ifndef HEADROOM_SUPPORT_PLATFORM_HPP
#define HEADROOM_SUPPORT_PLATFORM_HPP
/**
 * @file Platform.hpp
 * @brief Compile-time operating system identification.
 *
 * Source factories branch on this once at construction; nothing re-checks the
 * platform per call.
 */

#include <cstdint>

namespace headroom {

namespace support {

/* ----------------------------- Platform ----------------------------- */

enum class Platform : std::uint8_t {
  LINUX = 0,
  MACOS,
  FREEBSD,
  WINDOWS,
  OTHER,
};

/// Platform this binary was compiled for.
[[nodiscard]] constexpr Platform currentPlatform() noexcept {
#if defined(__linux__)
  return Platform::LINUX;
#elif defined(__APPLE__)
  return Platform::MACOS;
#elif defined(__FreeBSD__)
  return Platform::FREEBSD;
#elif defined(_WIN32)
  return Platform::WINDOWS;
#else
  return Platform::OTHER;
#endif
}

[[nodiscard]] constexpr const char* toString(Platform platform) noexcept {
  switch (platform) {
  case Platform::LINUX:
    return "linux";
  case Platform::MACOS:
    return "macos";
  case Platform::FREEBSD:
    return "freebsd";
  case Platform::WINDOWS:
    return "windows";
  case Platform::OTHER:
    return "other";
  }
  return "unknown";
}

} // namespace support

} // namespace headroom

#endif // HEADROOM_SUPPORT_PLATFORM_HPP
