#ifndef HEADROOM_HELPERS_ARGS_HPP
#define HEADROOM_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief Fixed-arity flag parsing for the headroom CLI tools.
 *
 * Each flag maps to a small integer key and consumes a fixed number of values.
 * Unknown tokens are ignored so tools stay tolerant of wrapper scripts.
 *
 * @note Cold-path only. Allocates.
 */

#include <algorithm>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "src/helpers/inc/Strings.hpp"

namespace headroom {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI argument flag.
 */
struct ArgDef {
  std::string_view flag;   ///< Flag string, e.g. "--pid"
  std::uint8_t nargs;      ///< Number of values consumed after the flag
  bool required;           ///< True if the flag must be present
  std::string_view desc{}; ///< Help text (optional)
};

/// Key to definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Key to parsed values (flags with nargs == 0 map to an empty vector).
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse arguments according to @p map.
 * @param args  Tokens after the program name (views must outlive @p pargs).
 * @param map   Accepted flags.
 * @param pargs Output; entries are overwritten when a flag repeats.
 * @param error Set to a description on failure.
 * @return true on success.
 */
[[nodiscard]] inline bool parseArgs(std::span<const std::string_view> args, const ArgMap& map,
                                    ParsedArgs& pargs, std::string& error) {
  std::unordered_map<std::string_view, std::uint8_t> byFlag;
  for (const auto& [key, def] : map) {
    byFlag.emplace(def.flag, key);
  }

  std::unordered_set<std::uint8_t> seen;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const auto IT = byFlag.find(args[i]);
    if (IT == byFlag.end()) {
      continue;
    }
    const ArgDef& DEF = map.at(IT->second);
    if (DEF.nargs > 0 && i + DEF.nargs >= args.size()) {
      error = fmt::format("Flag '{}' expects {} value(s)", DEF.flag, DEF.nargs);
      return false;
    }

    auto& values = pargs[IT->second];
    values.assign(args.begin() + static_cast<std::ptrdiff_t>(i + 1),
                  args.begin() + static_cast<std::ptrdiff_t>(i + 1 + DEF.nargs));
    seen.insert(IT->second);
    i += DEF.nargs;
  }

  for (const auto& [key, def] : map) {
    if (def.required && seen.count(key) == 0) {
      error = fmt::format("Missing required argument '{}'", def.flag);
      return false;
    }
  }
  return true;
}

/// True if @p key was given on the command line.
[[nodiscard]] inline bool has(const ParsedArgs& pargs, std::uint8_t key) noexcept {
  return pargs.find(key) != pargs.end();
}

/// First value of @p key parsed as an integer, or nullopt when absent or invalid.
[[nodiscard]] inline std::optional<std::int64_t> intValue(const ParsedArgs& pargs,
                                                          std::uint8_t key) {
  const auto IT = pargs.find(key);
  if (IT == pargs.end() || IT->second.empty()) {
    return std::nullopt;
  }
  return strings::parseInt64(IT->second.front());
}

/// First value of @p key parsed as a double, or nullopt when absent or invalid.
[[nodiscard]] inline std::optional<double> doubleValue(const ParsedArgs& pargs,
                                                       std::uint8_t key) {
  const auto IT = pargs.find(key);
  if (IT == pargs.end() || IT->second.empty()) {
    return std::nullopt;
  }
  return strings::parseDouble(IT->second.front());
}

/**
 * @brief Print generated help text.
 * @param progName    Program name (argv[0]).
 * @param description One-paragraph tool description.
 * @param map         Accepted flags.
 */
inline void printUsage(const char* progName, std::string_view description, const ArgMap& map) {
  fmt::print("Usage: {} [OPTIONS]\n\n", progName);
  if (!description.empty()) {
    fmt::print("{}\n\n", description);
  }
  fmt::print("Options:\n");

  std::vector<const ArgDef*> defs;
  defs.reserve(map.size());
  for (const auto& [key, def] : map) {
    defs.push_back(&def);
  }
  std::sort(defs.begin(), defs.end(),
            [](const ArgDef* a, const ArgDef* b) { return a->flag < b->flag; });

  for (const ArgDef* def : defs) {
    const std::string LEFT =
        def->nargs == 0 ? std::string(def->flag) : fmt::format("{} <value>", def->flag);
    fmt::print("  {:<18}  {}{}\n", LEFT, def->desc, def->required ? " (required)" : "");
  }
}

} // namespace args
} // namespace helpers
} // namespace headroom

#endif // HEADROOM_HELPERS_ARGS_HPP
