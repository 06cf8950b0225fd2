/**
 * @file Config.cpp
 * @brief Default allow-lists and environment overlay.
 */

#include "src/support/inc/Config.hpp"

#include <cstdlib> // getenv

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace headroom {

namespace support {

namespace {

/// Environment value, or empty when unset.
std::string envOrEmpty(const char* name) {
  const char* value = std::getenv(name);
  return (value != nullptr) ? std::string(value) : std::string();
}

} // namespace

/* ----------------------------- Defaults ----------------------------- */

std::vector<std::string> defaultAllowedPathPrefixes() {
  return {"/proc/",      "/sys/",         "/etc/os-release", "/usr/lib/os-release",
          "/.dockerenv", "/run/.containerenv"};
}

std::vector<std::string> defaultAllowedCommandPrefixes() {
  return {"df", "nproc", "getconf", "uname",  "cat /proc/", "cat /sys/",
          "echo", "printf", "true", "false", "which"};
}

/* ----------------------------- Config ----------------------------- */

Config Config::fromEnvironment() {
  Config cfg{};
  cfg.procRoot = envOrEmpty("HEADROOM_PROC_ROOT");
  cfg.sysRoot = envOrEmpty("HEADROOM_SYS_ROOT");
  const std::string LEVEL = envOrEmpty("HEADROOM_LOG_LEVEL");
  if (!LEVEL.empty()) {
    cfg.logLevel = LEVEL;
  }
  return cfg;
}

std::string Config::toString() const {
  return fmt::format("Config:\n"
                     "  procRoot: {}\n"
                     "  sysRoot:  {}\n"
                     "  paths:    {}\n"
                     "  commands: {}\n"
                     "  logLevel: {}",
                     procRoot.empty() ? "/" : procRoot, sysRoot.empty() ? "/" : sysRoot,
                     fmt::join(allowedPathPrefixes, ", "), fmt::join(allowedCommandPrefixes, ", "),
                     logLevel);
}

} // namespace support

} // namespace headroom
