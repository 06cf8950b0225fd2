#ifndef HEADROOM_CONTEXT_SYSTEM_OVERVIEW_HPP
#define HEADROOM_CONTEXT_SYSTEM_OVERVIEW_HPP
/**
 * @file SystemOverview.hpp
 * @brief One-shot picture of the host: identity, effective limits and the
 *        current CPU, memory, storage and network snapshots.
 */

#include "src/cpu/inc/CpuSnapshot.hpp"
#include "src/environment/inc/EnvironmentSnapshot.hpp"
#include "src/memory/inc/MemorySnapshot.hpp"
#include "src/network/inc/NetworkSnapshot.hpp"
#include "src/storage/inc/StorageSnapshot.hpp"
#include "src/system/inc/SystemLimits.hpp"

#include <string>

namespace headroom {

namespace context {

struct SystemOverview {
  headroom::environment::EnvironmentSnapshot environment{};
  headroom::system::SystemLimits limits{};
  headroom::cpu::CpuSnapshot cpu{};
  headroom::memory::MemorySnapshot memory{};
  headroom::storage::StorageSnapshot storage{};
  headroom::network::NetworkSnapshot network{};

  /// Sectioned multi-line report.
  [[nodiscard]] std::string toString() const;
};

} // namespace context

} // namespace headroom

#endif // HEADROOM_CONTEXT_SYSTEM_OVERVIEW_HPP
