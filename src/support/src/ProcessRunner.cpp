/**
 * @file ProcessRunner.cpp
 * @brief popen-based command execution with allow-list and exit classification.
 */

#include "src/support/inc/ProcessRunner.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <sys/wait.h> // WIFEXITED, WEXITSTATUS

#include <array>
#include <cerrno>
#include <cstdio> // popen, pclose, fread
#include <string_view>
#include <system_error>
#include <utility>

#include <fmt/core.h>

namespace headroom {

namespace support {

namespace {

using headroom::helpers::strings::startsWith;

inline constexpr int EXIT_NOT_FOUND = 127;
inline constexpr int EXIT_NOT_EXECUTABLE = 126;

/// Characters that would let a command chain, redirect or substitute.
inline constexpr std::string_view SHELL_METACHARACTERS = ";|&$`<>()\n\r\\";

bool hasShellMetacharacters(std::string_view command) noexcept {
  return command.find_first_of(SHELL_METACHARACTERS) != std::string_view::npos;
}

/// Prefix match on a word boundary ("df" accepts "df -kP" but not "dfx").
bool matchesPrefix(std::string_view command, std::string_view prefix) noexcept {
  if (prefix.empty() || !startsWith(command, prefix)) {
    return false;
  }
  if (command.size() == prefix.size()) {
    return true;
  }
  const char LAST = prefix.back();
  return LAST == '/' || LAST == ' ' || command[prefix.size()] == ' ';
}

bool isSafeCommandName(std::string_view name) noexcept {
  if (name.empty()) {
    return false;
  }
  for (const char C : name) {
    const bool OK = (C >= 'a' && C <= 'z') || (C >= 'A' && C <= 'Z') || (C >= '0' && C <= '9') ||
                    C == '.' || C == '_' || C == '-';
    if (!OK) {
      return false;
    }
  }
  return true;
}

} // namespace

/* ----------------------------- IProcessRunner ----------------------------- */

Result<std::vector<std::string>> IProcessRunner::executeLines(const std::string& command) const {
  return execute(command).map([](const std::string& out) {
    std::vector<std::string> lines;
    for (const std::string_view LINE : helpers::strings::splitLines(out)) {
      const std::string_view TRIMMED = helpers::strings::trimRight(LINE);
      if (!TRIMMED.empty()) {
        lines.emplace_back(TRIMMED);
      }
    }
    return lines;
  });
}

bool IProcessRunner::commandExists(const std::string& name) const {
  if (!isSafeCommandName(name)) {
    return false;
  }
  return execute("which " + name).isSuccess();
}

/* ----------------------------- ProcessRunner ----------------------------- */

ProcessRunner::ProcessRunner() : ProcessRunner(Config{}) {}

ProcessRunner::ProcessRunner(const Config& config)
    : allowedPrefixes_(config.allowedCommandPrefixes) {}

bool ProcessRunner::isAllowed(const std::string& command) const {
  if (hasShellMetacharacters(command)) {
    return false;
  }
  for (const std::string& prefix : allowedPrefixes_) {
    if (matchesPrefix(command, prefix)) {
      return true;
    }
  }
  return false;
}

Result<std::string> ProcessRunner::execute(const std::string& command) const {
  if (!isAllowed(command)) {
    helpers::log::logger()->warn("Rejected command outside allow-list: {}", command);
    return Result<std::string>::failure(
        ErrorCode::ACCESS_DENIED, fmt::format("Command not whitelisted for security: {}", command));
  }

  const std::string SHELL_LINE = command + " 2>/dev/null";
  FILE* pipe = ::popen(SHELL_LINE.c_str(), "r");
  if (pipe == nullptr) {
    const int ERR = errno;
    return Result<std::string>::failure(
        ErrorCode::SYSTEM_ERROR,
        fmt::format("Failed to start '{}': {}", command,
                    std::error_code(ERR, std::generic_category()).message()));
  }

  std::string output;
  std::array<char, 4096> buf{};
  std::size_t n = 0;
  while ((n = std::fread(buf.data(), 1, buf.size(), pipe)) > 0) {
    output.append(buf.data(), n);
  }

  const int STATUS = ::pclose(pipe);
  if (STATUS == -1) {
    return Result<std::string>::failure(ErrorCode::SYSTEM_ERROR,
                                        fmt::format("Failed to wait for '{}'", command));
  }
  if (!WIFEXITED(STATUS)) {
    return Result<std::string>::failure(ErrorCode::SYSTEM_ERROR,
                                        fmt::format("Command terminated abnormally: {}", command));
  }

  const int CODE = WEXITSTATUS(STATUS);
  if (CODE == EXIT_NOT_FOUND) {
    return Result<std::string>::failure(ErrorCode::COMMAND_NOT_FOUND,
                                        fmt::format("Command not found: {}", command));
  }
  if (CODE == EXIT_NOT_EXECUTABLE) {
    return Result<std::string>::failure(ErrorCode::INSUFFICIENT_PERMISSIONS,
                                        fmt::format("Command not executable: {}", command));
  }
  if (CODE != 0) {
    return Result<std::string>::failure(ErrorCode::SYSTEM_ERROR,
                                        fmt::format("Command failed with exit code {}", CODE));
  }

  helpers::log::logger()->debug("Command '{}' returned {} bytes", command, output.size());
  return Result<std::string>::success(std::move(output));
}

} // namespace support

} // namespace headroom
