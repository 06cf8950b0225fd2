#ifndef HEADROOM_HELPERS_RESULT_HPP
#define HEADROOM_HELPERS_RESULT_HPP
/**
 * @file Result.hpp
 * @brief Success-or-error return type used by every headroom entry point.
 *
 * Runtime conditions (missing files, unsupported platforms, malformed content,
 * tracker misuse) are reported as values, never thrown. Accessing the wrong
 * alternative is a programming error and throws std::logic_error.
 */

#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include <fmt/core.h>

namespace headroom {

/* ----------------------------- ErrorCode ----------------------------- */

/**
 * @brief Failure classification.
 */
enum class ErrorCode : std::uint8_t {
  FILE_NOT_FOUND = 0,       ///< Path does not exist
  INSUFFICIENT_PERMISSIONS, ///< Path or command exists but may not be used
  PARSE_FAILURE,            ///< Content malformed or unexpected
  UNSUPPORTED_PLATFORM,     ///< No implementation for this OS
  ACCESS_DENIED,            ///< Rejected by a path or command allow-list
  INVALID_STATE,            ///< Operation not valid in the object's current state
  COMMAND_NOT_FOUND,        ///< External command missing (exit 127)
  SYSTEM_ERROR,             ///< Any other syscall or command failure
};

/// Human-readable name for an ErrorCode.
[[nodiscard]] constexpr const char* toString(ErrorCode code) noexcept {
  switch (code) {
  case ErrorCode::FILE_NOT_FOUND:
    return "file not found";
  case ErrorCode::INSUFFICIENT_PERMISSIONS:
    return "insufficient permissions";
  case ErrorCode::PARSE_FAILURE:
    return "parse failure";
  case ErrorCode::UNSUPPORTED_PLATFORM:
    return "unsupported platform";
  case ErrorCode::ACCESS_DENIED:
    return "access denied";
  case ErrorCode::INVALID_STATE:
    return "invalid state";
  case ErrorCode::COMMAND_NOT_FOUND:
    return "command not found";
  case ErrorCode::SYSTEM_ERROR:
    return "system error";
  }
  return "unknown";
}

/* ----------------------------- Error ----------------------------- */

/**
 * @brief Classified failure with a descriptive message.
 */
struct Error {
  ErrorCode code{ErrorCode::SYSTEM_ERROR};
  std::string message{};

  /// "parse failure: No total CPU line found".
  [[nodiscard]] std::string toString() const {
    return fmt::format("{}: {}", headroom::toString(code), message);
  }
};

/* ----------------------------- Result ----------------------------- */

/**
 * @brief Holds either a value of type T or an Error.
 *
 * Usage:
 * @code
 *   auto res = source.read();
 *   if (res.isFailure()) {
 *     return Result<Out>::failure(res.error());
 *   }
 *   use(res.value());
 * @endcode
 */
template <typename T> class Result {
public:
  using value_type = T;

  [[nodiscard]] static Result success(T value) { return Result(std::move(value)); }

  [[nodiscard]] static Result failure(Error error) { return Result(std::move(error)); }

  [[nodiscard]] static Result failure(ErrorCode code, std::string message) {
    return Result(Error{code, std::move(message)});
  }

  [[nodiscard]] bool isSuccess() const noexcept { return std::holds_alternative<T>(data_); }
  [[nodiscard]] bool isFailure() const noexcept { return !isSuccess(); }
  explicit operator bool() const noexcept { return isSuccess(); }

  /// @throws std::logic_error if this holds an error.
  [[nodiscard]] const T& value() const& {
    requireSuccess();
    return std::get<T>(data_);
  }

  [[nodiscard]] T& value() & {
    requireSuccess();
    return std::get<T>(data_);
  }

  [[nodiscard]] T&& value() && {
    requireSuccess();
    return std::get<T>(std::move(data_));
  }

  /// @throws std::logic_error if this holds a value.
  [[nodiscard]] const Error& error() const {
    if (isSuccess()) {
      throw std::logic_error("Result::error() called on a success");
    }
    return std::get<Error>(data_);
  }

  /// Value on success, @p fallback on failure.
  [[nodiscard]] T valueOr(T fallback) const& {
    if (isSuccess()) {
      return std::get<T>(data_);
    }
    return fallback;
  }

  /**
   * @brief Transform the value, passing an error through unchanged.
   * @param fn Callable taking const T& and returning the new value type.
   */
  template <typename F>
  [[nodiscard]] auto map(F&& fn) const -> Result<std::decay_t<std::invoke_result_t<F, const T&>>> {
    using U = std::decay_t<std::invoke_result_t<F, const T&>>;
    if (isFailure()) {
      return Result<U>::failure(std::get<Error>(data_));
    }
    return Result<U>::success(std::forward<F>(fn)(std::get<T>(data_)));
  }

private:
  explicit Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}
  explicit Result(Error error) : data_(std::in_place_index<1>, std::move(error)) {}

  void requireSuccess() const {
    if (isFailure()) {
      throw std::logic_error("Result::value() called on a failure: " +
                             std::get<Error>(data_).toString());
    }
  }

  std::variant<T, Error> data_;
};

} // namespace headroom

#endif // HEADROOM_HELPERS_RESULT_HPP
