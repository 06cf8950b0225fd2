/**
 * @file SystemOverview.cpp
 * @brief SystemOverview formatting.
 */

#include "src/context/inc/SystemOverview.hpp"

namespace headroom {

namespace context {

std::string SystemOverview::toString() const {
  std::string out;
  out += "=== Environment ===\n";
  out += environment.toString();
  out += "\n=== Limits ===\n";
  out += limits.toString();
  out += "\n=== CPU ===\n";
  out += cpu.toString();
  out += "\n=== Memory ===\n";
  out += memory.toString();
  out += "\n=== Storage ===\n";
  out += storage.toString();
  out += "\n=== Network ===\n";
  out += network.toString();
  return out;
}

} // namespace context

} // namespace headroom
