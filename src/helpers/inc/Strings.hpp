#ifndef HEADROOM_HELPERS_STRINGS_HPP
#define HEADROOM_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief Tokenizing and numeric parsing helpers for kernel text files.
 *
 * Kernel interface files (/proc, /sys, cgroupfs) are small, line oriented and
 * whitespace separated. These helpers operate on std::string_view so parsers
 * can walk a file's content without copying it.
 *
 * @note Thread-safe: All functions are pure.
 */

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <cstdlib> // strtod
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace headroom {
namespace helpers {
namespace strings {

/* ----------------------------- Predicates ----------------------------- */

/// True for space, tab, newline, carriage return, vertical tab, form feed.
[[nodiscard]] constexpr bool isSpace(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

[[nodiscard]] constexpr bool isDigit(char c) noexcept { return c >= '0' && c <= '9'; }

/// True when every character is a decimal digit (and the view is non-empty).
[[nodiscard]] constexpr bool isAllDigits(std::string_view s) noexcept {
  if (s.empty()) {
    return false;
  }
  for (const char C : s) {
    if (!isDigit(C)) {
      return false;
    }
  }
  return true;
}

[[nodiscard]] constexpr bool startsWith(std::string_view s, std::string_view prefix) noexcept {
  return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

/* ----------------------------- Trimming ----------------------------- */

[[nodiscard]] constexpr std::string_view trimLeft(std::string_view s) noexcept {
  std::size_t i = 0;
  while (i < s.size() && isSpace(s[i])) {
    ++i;
  }
  return s.substr(i);
}

[[nodiscard]] constexpr std::string_view trimRight(std::string_view s) noexcept {
  std::size_t n = s.size();
  while (n > 0 && isSpace(s[n - 1])) {
    --n;
  }
  return s.substr(0, n);
}

[[nodiscard]] constexpr std::string_view trim(std::string_view s) noexcept {
  return trimRight(trimLeft(s));
}

/// Strip every trailing occurrence of @p c ("/a/b//" -> "/a/b").
[[nodiscard]] constexpr std::string_view trimRightChar(std::string_view s, char c) noexcept {
  std::size_t n = s.size();
  while (n > 0 && s[n - 1] == c) {
    --n;
  }
  return s.substr(0, n);
}

/* ----------------------------- Splitting ----------------------------- */

/**
 * @brief Split into lines on '\n'. A trailing newline does not yield an empty
 *        final line; interior empty lines are preserved.
 */
[[nodiscard]] inline std::vector<std::string_view> splitLines(std::string_view s) {
  std::vector<std::string_view> out;
  std::size_t start = 0;
  while (start < s.size()) {
    const std::size_t POS = s.find('\n', start);
    if (POS == std::string_view::npos) {
      out.push_back(s.substr(start));
      break;
    }
    out.push_back(s.substr(start, POS - start));
    start = POS + 1;
  }
  return out;
}

/// Split on runs of whitespace, dropping empty tokens.
[[nodiscard]] inline std::vector<std::string_view> splitWhitespace(std::string_view s) {
  std::vector<std::string_view> out;
  std::size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && isSpace(s[i])) {
      ++i;
    }
    const std::size_t BEGIN = i;
    while (i < s.size() && !isSpace(s[i])) {
      ++i;
    }
    if (i > BEGIN) {
      out.push_back(s.substr(BEGIN, i - BEGIN));
    }
  }
  return out;
}

/**
 * @brief Split on a delimiter into at most @p maxParts pieces; the final piece
 *        keeps any remaining delimiters ("a:b:c:d", ':', 3 -> "a","b","c:d").
 *        Empty pieces are preserved.
 */
[[nodiscard]] inline std::vector<std::string_view> split(std::string_view s, char delim,
                                                         std::size_t maxParts = 0) {
  std::vector<std::string_view> out;
  std::size_t start = 0;
  while (true) {
    if (maxParts != 0 && out.size() + 1 == maxParts) {
      out.push_back(s.substr(start));
      break;
    }
    const std::size_t POS = s.find(delim, start);
    if (POS == std::string_view::npos) {
      out.push_back(s.substr(start));
      break;
    }
    out.push_back(s.substr(start, POS - start));
    start = POS + 1;
  }
  return out;
}

/* ----------------------------- Numbers ----------------------------- */

/**
 * @brief Parse a signed decimal integer occupying the whole (trimmed) view.
 * @return Value, or nullopt on empty input, trailing garbage or overflow.
 */
[[nodiscard]] inline std::optional<std::int64_t> parseInt64(std::string_view s) noexcept {
  s = trim(s);
  if (s.empty()) {
    return std::nullopt;
  }
  std::int64_t value = 0;
  const char* const END = s.data() + s.size();
  const auto RES = std::from_chars(s.data(), END, value);
  if (RES.ec != std::errc{} || RES.ptr != END) {
    return std::nullopt;
  }
  return value;
}

/// Unsigned counterpart of parseInt64. A leading '-' is rejected.
[[nodiscard]] inline std::optional<std::uint64_t> parseUint64(std::string_view s) noexcept {
  s = trim(s);
  if (s.empty()) {
    return std::nullopt;
  }
  std::uint64_t value = 0;
  const char* const END = s.data() + s.size();
  const auto RES = std::from_chars(s.data(), END, value);
  if (RES.ec != std::errc{} || RES.ptr != END) {
    return std::nullopt;
  }
  return value;
}

/**
 * @brief Parse a floating-point number occupying the whole (trimmed) view.
 * @note Allocates a short copy for strtod's null-terminated input.
 */
[[nodiscard]] inline std::optional<double> parseDouble(std::string_view s) {
  s = trim(s);
  if (s.empty()) {
    return std::nullopt;
  }
  const std::string BUF(s);
  char* end = nullptr;
  const double VALUE = std::strtod(BUF.c_str(), &end);
  if (end != BUF.c_str() + BUF.size()) {
    return std::nullopt;
  }
  return VALUE;
}

/**
 * @brief Find a "<key> <number>" line and return the number.
 *
 * Matches flat-keyed kernel files such as cgroup cpu.stat, memory.events and
 * memory.oom_control. The key must be the first token of its line.
 *
 * @param content File content.
 * @param key     Key to search for (e.g. "nr_throttled").
 * @return Parsed value, or nullopt if the key is absent or its value non-numeric.
 */
[[nodiscard]] inline std::optional<std::uint64_t> findKeyedValue(std::string_view content,
                                                                 std::string_view key) {
  for (const std::string_view LINE : splitLines(content)) {
    const auto TOKENS = splitWhitespace(LINE);
    if (TOKENS.size() >= 2 && TOKENS[0] == key) {
      return parseUint64(TOKENS[1]);
    }
  }
  return std::nullopt;
}

} // namespace strings
} // namespace helpers
} // namespace headroom

#endif // HEADROOM_HELPERS_STRINGS_HPP
