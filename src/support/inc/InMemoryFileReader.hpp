#ifndef HEADROOM_SUPPORT_IN_MEMORY_FILE_READER_HPP
#define HEADROOM_SUPPORT_IN_MEMORY_FILE_READER_HPP
/**
 * @file InMemoryFileReader.hpp
 * @brief IFileReader backed by a path-to-content map.
 *
 * Used to feed captured /proc and cgroupfs content to parsers and sources
 * (tests, replaying a captured host, fixtures). Every read(), exists() and
 * list() call is counted per path so callers can verify caching behavior.
 *
 * @note NOT thread-safe: access counters are updated from const methods.
 */

#include "src/support/inc/FileReader.hpp"

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace headroom {

namespace support {

/* ----------------------------- InMemoryFileReader ----------------------------- */

class InMemoryFileReader final : public IFileReader {
public:
  /// Add or replace a file.
  void setFile(const std::string& path, std::string content) {
    files_[path] = std::move(content);
    unreadable_.erase(path);
  }

  /// Make an existing-but-unreadable file (read() gives INSUFFICIENT_PERMISSIONS).
  void setUnreadable(const std::string& path) {
    files_.erase(path);
    unreadable_.insert(path);
  }

  void removeFile(const std::string& path) {
    files_.erase(path);
    unreadable_.erase(path);
  }

  void clear() {
    files_.clear();
    unreadable_.clear();
    accesses_.clear();
  }

  [[nodiscard]] Result<std::string> read(const std::string& path) const override {
    ++accesses_[path];
    if (unreadable_.count(path) != 0) {
      return Result<std::string>::failure(ErrorCode::INSUFFICIENT_PERMISSIONS,
                                          fmt::format("Permission denied: {}", path));
    }
    const auto IT = files_.find(path);
    if (IT == files_.end()) {
      return Result<std::string>::failure(ErrorCode::FILE_NOT_FOUND,
                                          fmt::format("File not found: {}", path));
    }
    return Result<std::string>::success(IT->second);
  }

  [[nodiscard]] bool exists(const std::string& path) const override {
    ++accesses_[path];
    return files_.find(path) != files_.end();
  }

  /// Immediate children of @p path derived from the stored file paths.
  [[nodiscard]] Result<std::vector<std::string>> list(const std::string& path) const override {
    ++accesses_[path];
    const std::string PREFIX = (!path.empty() && path.back() == '/') ? path : path + "/";
    std::set<std::string> names;
    for (const auto& [file, content] : files_) {
      if (file.compare(0, PREFIX.size(), PREFIX) != 0) {
        continue;
      }
      const std::string REST = file.substr(PREFIX.size());
      names.insert(REST.substr(0, REST.find('/')));
    }
    if (names.empty()) {
      return Result<std::vector<std::string>>::failure(
          ErrorCode::FILE_NOT_FOUND, fmt::format("Directory not found: {}", path));
    }
    return Result<std::vector<std::string>>::success({names.begin(), names.end()});
  }

  /// Number of read/exists/list calls made for @p path.
  [[nodiscard]] std::size_t accessCount(const std::string& path) const {
    const auto IT = accesses_.find(path);
    return (IT == accesses_.end()) ? 0 : IT->second;
  }

  /// Number of calls across all paths.
  [[nodiscard]] std::size_t totalAccessCount() const {
    std::size_t total = 0;
    for (const auto& [path, count] : accesses_) {
      total += count;
    }
    return total;
  }

private:
  std::map<std::string, std::string> files_;
  std::set<std::string> unreadable_;
  mutable std::unordered_map<std::string, std::size_t> accesses_;
};

} // namespace support

} // namespace headroom

#endif // HEADROOM_SUPPORT_IN_MEMORY_FILE_READER_HPP
