#ifndef HEADROOM_CGROUP_CGROUP_MEMORY_PARSER_HPP
#define HEADROOM_CGROUP_CGROUP_MEMORY_PARSER_HPP
/**
 * @file CgroupMemoryParser.hpp
 * @brief Memory limit, usage and OOM counters from cgroup v1 and v2 files.
 * @note Linux-only.
 *
 * Files:
 *  - v1: memory.limit_in_bytes, memory.usage_in_bytes, memory.oom_control (under_oom)
 *  - v2: memory.max, memory.current, memory.events (oom_kill)
 *
 * Unlimited values (v1 >= V1_MEMORY_UNLIMITED_THRESHOLD, v2 "max") and any
 * read or parse failure yield nullopt.
 */

#include "src/cgroup/inc/CgroupPathResolver.hpp"
#include "src/support/inc/FileReader.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace headroom {

namespace cgroup {

/* ----------------------------- Parsing ----------------------------- */

/// v1 memory.limit_in_bytes: nullopt when non-numeric, <= 0, or the "no limit" sentinel.
[[nodiscard]] std::optional<std::int64_t> parseV1MemoryLimit(std::string_view content) noexcept;

/// v2 memory.max: nullopt for "max", non-numeric, or <= 0.
[[nodiscard]] std::optional<std::int64_t> parseV2MemoryLimit(std::string_view content) noexcept;

/// memory.usage_in_bytes / memory.current, floored at 0; nullopt when non-numeric.
[[nodiscard]] std::optional<std::int64_t> parseMemoryUsage(std::string_view content) noexcept;

/* ----------------------------- CgroupV1MemoryParser ----------------------------- */

class CgroupV1MemoryParser {
public:
  CgroupV1MemoryParser(std::shared_ptr<const support::IFileReader> reader,
                       std::shared_ptr<CgroupV1PathResolver> resolver);

  [[nodiscard]] std::optional<std::int64_t> parseLimit();
  [[nodiscard]] std::optional<std::int64_t> parseUsage();
  [[nodiscard]] std::optional<std::uint64_t> parseOomKills();

private:
  [[nodiscard]] std::optional<std::string> readFile(std::string_view file);

  std::shared_ptr<const support::IFileReader> reader_;
  std::shared_ptr<CgroupV1PathResolver> resolver_;
};

/* ----------------------------- CgroupV2MemoryParser ----------------------------- */

class CgroupV2MemoryParser {
public:
  CgroupV2MemoryParser(std::shared_ptr<const support::IFileReader> reader,
                       std::shared_ptr<CgroupV2PathResolver> resolver);

  [[nodiscard]] std::optional<std::int64_t> parseLimit();
  [[nodiscard]] std::optional<std::int64_t> parseUsage();
  [[nodiscard]] std::optional<std::uint64_t> parseOomKills();

private:
  [[nodiscard]] std::optional<std::string> readFile(std::string_view file);

  std::shared_ptr<const support::IFileReader> reader_;
  std::shared_ptr<CgroupV2PathResolver> resolver_;
};

} // namespace cgroup

} // namespace headroom

#endif // HEADROOM_CGROUP_CGROUP_MEMORY_PARSER_HPP
