#ifndef HEADROOM_SOURCE_SOURCE_HPP
#define HEADROOM_SOURCE_SOURCE_HPP
/**
 * @file Source.hpp
 * @brief Common interface for every metric source.
 *
 * A Source<T> produces one T per read(). Concrete sources are platform
 * specific (a /proc parser, a syscall wrapper, an external command) and are
 * combined into fallback chains by FallbackSource<T>.
 *
 * read() is non-const: some sources keep rate caches between calls.
 */

#include "src/helpers/inc/Result.hpp"

namespace headroom {

namespace source {

/* ----------------------------- Source ----------------------------- */

template <typename T> class Source {
public:
  using value_type = T;

  virtual ~Source() = default;

  /// Capture a fresh value, or a classified failure.
  [[nodiscard]] virtual Result<T> read() = 0;

  /// Short identifier for diagnostics and aggregated errors.
  [[nodiscard]] virtual const char* name() const noexcept = 0;
};

} // namespace source

} // namespace headroom

#endif // HEADROOM_SOURCE_SOURCE_HPP
