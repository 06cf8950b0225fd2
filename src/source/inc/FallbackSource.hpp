#ifndef HEADROOM_SOURCE_FALLBACK_SOURCE_HPP
#define HEADROOM_SOURCE_FALLBACK_SOURCE_HPP
/**
 * @file FallbackSource.hpp
 * @brief Ordered chain of interchangeable sources; first success wins.
 *
 * Candidates are tried strictly in construction order. When all fail, the
 * returned error lists every candidate's failure:
 *
 *   "All cpu sources failed: Source 0 (proc-stat): ...; Source 1 (minimal): ..."
 *
 * The error code is the candidates' common code when they agree, otherwise
 * SYSTEM_ERROR.
 */

#include "src/helpers/inc/Log.hpp"
#include "src/helpers/inc/Result.hpp"
#include "src/source/inc/Source.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>

namespace headroom {

namespace source {

/* ----------------------------- FallbackSource ----------------------------- */

template <typename T> class FallbackSource final : public Source<T> {
public:
  using SourcePtr = std::unique_ptr<Source<T>>;

  /**
   * @param family  Metric family name used in messages ("cpu", "memory", ...).
   * @param sources Candidates, most preferred first. Null entries are dropped.
   */
  FallbackSource(std::string family, std::vector<SourcePtr> sources)
      : family_(std::move(family)) {
    for (auto& src : sources) {
      if (src) {
        sources_.push_back(std::move(src));
      }
    }
  }

  [[nodiscard]] Result<T> read() override {
    if (sources_.empty()) {
      return Result<T>::failure(ErrorCode::UNSUPPORTED_PLATFORM,
                                fmt::format("No {} sources available", family_));
    }

    std::string detail;
    ErrorCode commonCode = ErrorCode::SYSTEM_ERROR;
    bool codesAgree = true;

    for (std::size_t i = 0; i < sources_.size(); ++i) {
      Result<T> res = sources_[i]->read();
      if (res.isSuccess()) {
        if (i > 0) {
          helpers::log::logger()->info("{} metrics served by fallback source {} ({})", family_, i,
                                       sources_[i]->name());
        }
        return res;
      }

      const Error& ERR = res.error();
      helpers::log::logger()->debug("{} source {} ({}) failed: {}", family_, i,
                                    sources_[i]->name(), ERR.toString());
      if (i == 0) {
        commonCode = ERR.code;
      } else if (ERR.code != commonCode) {
        codesAgree = false;
      }
      if (!detail.empty()) {
        detail += "; ";
      }
      detail += fmt::format("Source {} ({}): {}", i, sources_[i]->name(), ERR.message);
    }

    helpers::log::logger()->warn("All {} sources failed", family_);
    return Result<T>::failure(codesAgree ? commonCode : ErrorCode::SYSTEM_ERROR,
                              fmt::format("All {} sources failed: {}", family_, detail));
  }

  [[nodiscard]] const char* name() const noexcept override { return "fallback"; }

  [[nodiscard]] std::size_t size() const noexcept { return sources_.size(); }

  [[nodiscard]] const std::string& family() const noexcept { return family_; }

private:
  std::string family_;
  std::vector<SourcePtr> sources_;
};

} // namespace source

} // namespace headroom

#endif // HEADROOM_SOURCE_FALLBACK_SOURCE_HPP
