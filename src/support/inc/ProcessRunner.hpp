#ifndef HEADROOM_SUPPORT_PROCESS_RUNNER_HPP
#define HEADROOM_SUPPORT_PROCESS_RUNNER_HPP
/**
 * @file ProcessRunner.hpp
 * @brief Allow-listed execution of external commands.
 *
 * Used only by last-resort fallback sources (e.g. `df -kP` when statvfs-based
 * storage enumeration fails). A command runs only if it starts with an allowed
 * prefix and contains no shell metacharacters.
 *
 * Exit status classification:
 *  - 0:    success, stdout returned
 *  - 127:  COMMAND_NOT_FOUND
 *  - 126:  INSUFFICIENT_PERMISSIONS
 *  - else: SYSTEM_ERROR ("Command failed with exit code N")
 *
 * @note Blocking: waits for the child to exit.
 */

#include "src/helpers/inc/Result.hpp"
#include "src/support/inc/Config.hpp"

#include <string>
#include <vector>

namespace headroom {

namespace support {

/* ----------------------------- IProcessRunner ----------------------------- */

class IProcessRunner {
public:
  virtual ~IProcessRunner() = default;

  /// Run @p command and capture its standard output.
  [[nodiscard]] virtual Result<std::string> execute(const std::string& command) const = 0;

  /// Output split into non-empty, right-trimmed lines.
  [[nodiscard]] Result<std::vector<std::string>> executeLines(const std::string& command) const;

  /// True if `which <name>` succeeds. Names with characters outside [A-Za-z0-9._-] are rejected.
  [[nodiscard]] bool commandExists(const std::string& name) const;
};

/* ----------------------------- ProcessRunner ----------------------------- */

/**
 * @brief popen-based IProcessRunner.
 */
class ProcessRunner final : public IProcessRunner {
public:
  ProcessRunner();

  explicit ProcessRunner(const Config& config);

  [[nodiscard]] Result<std::string> execute(const std::string& command) const override;

  /// True if @p command passes the prefix allow-list and metacharacter check.
  [[nodiscard]] bool isAllowed(const std::string& command) const;

private:
  std::vector<std::string> allowedPrefixes_;
};

} // namespace support

} // namespace headroom

#endif // HEADROOM_SUPPORT_PROCESS_RUNNER_HPP
