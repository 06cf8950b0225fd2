#ifndef HEADROOM_HELPERS_FILES_HPP
#define HEADROOM_HELPERS_FILES_HPP
/**
 * @file Files.hpp
 * @brief Thin POSIX wrappers for reading kernel pseudo-files and directories.
 *
 * Uses open/read/close directly: procfs and sysfs files report a size of 0 (or
 * a page) in stat(), so content is read until EOF rather than by size.
 *
 * @note Thread-safe: No shared state. Each call owns its descriptors.
 */

#include <dirent.h>   // opendir, readdir, closedir
#include <fcntl.h>    // open, O_RDONLY, O_CLOEXEC
#include <unistd.h>   // read, close, access

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstddef>
#include <cstring> // strcmp
#include <new>
#include <string>
#include <vector>

namespace headroom {
namespace helpers {
namespace files {

/* ----------------------------- Constants ----------------------------- */

/// Chunk size for pseudo-file reads.
inline constexpr std::size_t READ_CHUNK_SIZE = 4096;

/// Upper bound on a single file read (guards against runaway special files).
inline constexpr std::size_t MAX_FILE_SIZE = 16U * 1024U * 1024U;

/* ----------------------------- File Reading ----------------------------- */

/**
 * @brief Read an entire file into @p out.
 * @param path File path.
 * @param out  Destination; cleared first, holds partial content on error.
 * @return 0 on success, otherwise the errno of the failing call.
 */
[[nodiscard]] inline int readTextFile(const char* path, std::string& out) noexcept {
  out.clear();
  if (path == nullptr) {
    return EINVAL;
  }

  const int FD = ::open(path, O_RDONLY | O_CLOEXEC);
  if (FD < 0) {
    return errno;
  }

  std::array<char, READ_CHUNK_SIZE> chunk{};
  int status = 0;
  try {
    while (out.size() < MAX_FILE_SIZE) {
      const ssize_t N = ::read(FD, chunk.data(), chunk.size());
      if (N < 0) {
        if (errno == EINTR) {
          continue;
        }
        status = errno;
        break;
      }
      if (N == 0) {
        break;
      }
      out.append(chunk.data(), static_cast<std::size_t>(N));
    }
  } catch (const std::bad_alloc&) {
    status = ENOMEM;
  }

  ::close(FD);
  return status;
}

/**
 * @brief List directory entry names, excluding "." and "..", sorted.
 * @return 0 on success, otherwise errno.
 */
[[nodiscard]] inline int listDirectory(const char* path, std::vector<std::string>& out) noexcept {
  out.clear();
  if (path == nullptr) {
    return EINVAL;
  }

  DIR* dir = ::opendir(path);
  if (dir == nullptr) {
    return errno;
  }

  int status = 0;
  try {
    while (const struct dirent* ent = ::readdir(dir)) {
      if (std::strcmp(ent->d_name, ".") == 0 || std::strcmp(ent->d_name, "..") == 0) {
        continue;
      }
      out.emplace_back(ent->d_name);
    }
    std::sort(out.begin(), out.end());
  } catch (const std::bad_alloc&) {
    status = ENOMEM;
  }

  ::closedir(dir);
  return status;
}

/* ----------------------------- Path Utilities ----------------------------- */

/// True if the path exists and the calling process may read it.
[[nodiscard]] inline bool isReadable(const char* path) noexcept {
  if (path == nullptr) {
    return false;
  }
  return ::access(path, R_OK) == 0;
}

} // namespace files
} // namespace helpers
} // namespace headroom

#endif // HEADROOM_HELPERS_FILES_HPP
