#ifndef HEADROOM_MEMORY_MEMORY_SOURCE_HPP
#define HEADROOM_MEMORY_MEMORY_SOURCE_HPP
/**
 * @file MemorySource.hpp
 * @brief Memory snapshot sources and their fallback chain.
 *
 * Chain:
 *  1. ProcMeminfoSource   - /proc/meminfo (buffers and cache broken out)
 *  2. SysinfoMemorySource - sysinfo(2); no cache figure, MemAvailable ~ freeram
 */

#include "src/helpers/inc/Result.hpp"
#include "src/memory/inc/MemorySnapshot.hpp"
#include "src/source/inc/Source.hpp"
#include "src/support/inc/FileReader.hpp"

#include <memory>

namespace headroom {

namespace memory {

inline constexpr const char* PROC_MEMINFO_PATH = "/proc/meminfo";

class ProcMeminfoSource final : public source::Source<MemorySnapshot> {
public:
  explicit ProcMeminfoSource(std::shared_ptr<const support::IFileReader> reader);

  [[nodiscard]] Result<MemorySnapshot> read() override;

  [[nodiscard]] const char* name() const noexcept override { return "proc-meminfo"; }

private:
  std::shared_ptr<const support::IFileReader> reader_;
};

class SysinfoMemorySource final : public source::Source<MemorySnapshot> {
public:
  [[nodiscard]] Result<MemorySnapshot> read() override;

  [[nodiscard]] const char* name() const noexcept override { return "sysinfo"; }
};

/// Memory chain for the compiled platform.
[[nodiscard]] std::unique_ptr<source::Source<MemorySnapshot>>
createMemorySource(std::shared_ptr<const support::IFileReader> reader);

} // namespace memory

} // namespace headroom

#endif // HEADROOM_MEMORY_MEMORY_SOURCE_HPP
