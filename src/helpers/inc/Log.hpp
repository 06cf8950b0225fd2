#ifndef HEADROOM_HELPERS_LOG_HPP
#define HEADROOM_HELPERS_LOG_HPP
/**
 * @file Log.hpp
 * @brief Access to the library's named spdlog logger.
 *
 * All headroom diagnostics go through one logger named "headroom". If the
 * application registered a logger with that name before first use, it is
 * reused; otherwise a stderr color logger is created at level warn.
 *
 * @note Thread-safe: spdlog's registry and *_mt sinks are synchronized.
 */

#include <memory>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace headroom {
namespace helpers {
namespace log {

/* ----------------------------- Constants ----------------------------- */

inline constexpr const char* LOGGER_NAME = "headroom";

/* ----------------------------- API ----------------------------- */

/**
 * @brief Get the library logger, creating it on first call.
 * @return Shared logger (never null).
 */
[[nodiscard]] inline std::shared_ptr<spdlog::logger> logger() {
  static const std::shared_ptr<spdlog::logger> LOGGER = [] {
    if (auto existing = spdlog::get(LOGGER_NAME)) {
      return existing;
    }
    auto created = spdlog::stderr_color_mt(LOGGER_NAME);
    created->set_level(spdlog::level::warn);
    return created;
  }();
  return LOGGER;
}

/**
 * @brief Set the library log level from its name.
 * @param level "trace", "debug", "info", "warn", "error", "critical" or "off".
 *              Unrecognized names select "off" (spdlog's from_str behavior).
 */
inline void setLevel(const std::string& level) {
  logger()->set_level(spdlog::level::from_str(level));
}

} // namespace log
} // namespace helpers
} // namespace headroom

#endif // HEADROOM_HELPERS_LOG_HPP
