#ifndef HEADROOM_SUPPORT_FILE_READER_HPP
#define HEADROOM_SUPPORT_FILE_READER_HPP
/**
 * @file FileReader.hpp
 * @brief Allow-listed access to kernel pseudo-files.
 *
 * Every parser in headroom reads through an IFileReader. The production
 * implementation (FileReader) refuses any path outside its allow-list,
 * including paths that try to escape it with "..", and can remap /proc and /sys
 * onto another directory tree.
 *
 * @note Thread-safe: FileReader holds only immutable configuration.
 */

#include "src/helpers/inc/Result.hpp"
#include "src/support/inc/Config.hpp"

#include <string>
#include <vector>

namespace headroom {

namespace support {

/* ----------------------------- IFileReader ----------------------------- */

/**
 * @brief Read-only view of a file system.
 */
class IFileReader {
public:
  virtual ~IFileReader() = default;

  /**
   * @brief Read an entire file.
   * @return Content, or FILE_NOT_FOUND / INSUFFICIENT_PERMISSIONS /
   *         ACCESS_DENIED / SYSTEM_ERROR.
   */
  [[nodiscard]] virtual Result<std::string> read(const std::string& path) const = 0;

  /// True if the file exists and is readable. Never fails.
  [[nodiscard]] virtual bool exists(const std::string& path) const = 0;

  /**
   * @brief Entry names of a directory, sorted, without "." and "..".
   */
  [[nodiscard]] virtual Result<std::vector<std::string>> list(const std::string& path) const = 0;

  /// Content split into lines (trailing whitespace removed, empty lines dropped).
  [[nodiscard]] Result<std::vector<std::string>> readLines(const std::string& path) const;
};

/* ----------------------------- FileReader ----------------------------- */

/**
 * @brief POSIX-backed IFileReader with allow-list and root remapping.
 */
class FileReader final : public IFileReader {
public:
  /// Default allow-list, no remapping.
  FileReader();

  explicit FileReader(const Config& config);

  [[nodiscard]] Result<std::string> read(const std::string& path) const override;
  [[nodiscard]] bool exists(const std::string& path) const override;
  [[nodiscard]] Result<std::vector<std::string>> list(const std::string& path) const override;

  /// True if @p path is absolute, free of ".." components and under an allowed prefix.
  [[nodiscard]] bool isAllowed(const std::string& path) const;

  /// Physical path @p path resolves to after root remapping.
  [[nodiscard]] std::string mapPath(const std::string& path) const;

private:
  std::vector<std::string> allowedPrefixes_;
  std::string procRoot_;
  std::string sysRoot_;
};

} // namespace support

} // namespace headroom

#endif // HEADROOM_SUPPORT_FILE_READER_HPP
