/**
 * @file FileReader.cpp
 * @brief Allow-list enforcement, root remapping and errno classification.
 */

#include "src/support/inc/FileReader.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Log.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <cerrno>
#include <system_error>
#include <utility>

#include <fmt/core.h>

namespace headroom {

namespace support {

namespace {

using headroom::helpers::strings::startsWith;

/// Map an errno from open/read/opendir to an ErrorCode.
ErrorCode classifyErrno(int err) noexcept {
  switch (err) {
  case ENOENT:
  case ENOTDIR:
    return ErrorCode::FILE_NOT_FOUND;
  case EACCES:
  case EPERM:
    return ErrorCode::INSUFFICIENT_PERMISSIONS;
  default:
    return ErrorCode::SYSTEM_ERROR;
  }
}

std::string errnoMessage(int err) {
  return std::error_code(err, std::generic_category()).message();
}

/// True if any '/'-separated component of @p path is "..".
bool hasParentComponent(std::string_view path) {
  for (const std::string_view PART : helpers::strings::split(path, '/')) {
    if (PART == "..") {
      return true;
    }
  }
  return false;
}

/**
 * True if @p path is @p prefix or lies under it. A prefix ending in '/' is a
 * directory ("/proc" matches "/proc/"); any other prefix names one entry, so
 * "/etc/os-release" does not admit "/etc/os-release.bak".
 */
bool underPrefix(std::string_view path, std::string_view prefix) {
  if (prefix.empty()) {
    return false;
  }
  if (prefix.back() == '/') {
    const std::string_view BARE = helpers::strings::trimRightChar(prefix, '/');
    return startsWith(path, prefix) || (!BARE.empty() && path == BARE);
  }
  return path == prefix || (startsWith(path, prefix) && path[prefix.size()] == '/');
}

/// Prefix @p path with @p root when it starts with @p mount ("/proc" or "/sys").
std::string remap(const std::string& path, std::string_view mount, const std::string& root) {
  if (root.empty()) {
    return path;
  }
  if (path != mount && !startsWith(path, std::string(mount) + "/")) {
    return path;
  }
  return std::string(helpers::strings::trimRightChar(root, '/')) + path;
}

} // namespace

/* ----------------------------- IFileReader ----------------------------- */

Result<std::vector<std::string>> IFileReader::readLines(const std::string& path) const {
  return read(path).map([](const std::string& content) {
    std::vector<std::string> lines;
    for (const std::string_view LINE : helpers::strings::splitLines(content)) {
      const std::string_view TRIMMED = helpers::strings::trimRight(LINE);
      if (!TRIMMED.empty()) {
        lines.emplace_back(TRIMMED);
      }
    }
    return lines;
  });
}

/* ----------------------------- FileReader ----------------------------- */

FileReader::FileReader() : FileReader(Config{}) {}

FileReader::FileReader(const Config& config)
    : allowedPrefixes_(config.allowedPathPrefixes), procRoot_(config.procRoot),
      sysRoot_(config.sysRoot) {}

bool FileReader::isAllowed(const std::string& path) const {
  if (path.empty() || path.front() != '/' || hasParentComponent(path)) {
    return false;
  }
  for (const std::string& prefix : allowedPrefixes_) {
    if (underPrefix(path, prefix)) {
      return true;
    }
  }
  return false;
}

std::string FileReader::mapPath(const std::string& path) const {
  if (startsWith(path, "/proc")) {
    return remap(path, "/proc", procRoot_);
  }
  if (startsWith(path, "/sys")) {
    return remap(path, "/sys", sysRoot_);
  }
  return path;
}

Result<std::string> FileReader::read(const std::string& path) const {
  if (!isAllowed(path)) {
    helpers::log::logger()->warn("Rejected read outside allow-list: {}", path);
    return Result<std::string>::failure(ErrorCode::ACCESS_DENIED,
                                        fmt::format("Path not allowed for security: {}", path));
  }

  const std::string PHYSICAL = mapPath(path);
  std::string content;
  const int ERR = helpers::files::readTextFile(PHYSICAL.c_str(), content);
  if (ERR != 0) {
    return Result<std::string>::failure(classifyErrno(ERR),
                                        fmt::format("Cannot read {}: {}", path, errnoMessage(ERR)));
  }
  return Result<std::string>::success(std::move(content));
}

bool FileReader::exists(const std::string& path) const {
  if (!isAllowed(path)) {
    return false;
  }
  return helpers::files::isReadable(mapPath(path).c_str());
}

Result<std::vector<std::string>> FileReader::list(const std::string& path) const {
  using ListResult = Result<std::vector<std::string>>;
  if (!isAllowed(path)) {
    helpers::log::logger()->warn("Rejected listing outside allow-list: {}", path);
    return ListResult::failure(ErrorCode::ACCESS_DENIED,
                               fmt::format("Path not allowed for security: {}", path));
  }

  std::vector<std::string> entries;
  const int ERR = helpers::files::listDirectory(mapPath(path).c_str(), entries);
  if (ERR != 0) {
    return ListResult::failure(classifyErrno(ERR),
                               fmt::format("Cannot list {}: {}", path, errnoMessage(ERR)));
  }
  return ListResult::success(std::move(entries));
}

} // namespace support

} // namespace headroom
