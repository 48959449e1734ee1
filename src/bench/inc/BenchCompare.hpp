#ifndef BRUNCH_BENCHCOMPARE_HPP
#define BRUNCH_BENCHCOMPARE_HPP
/**
 * @file BenchCompare.hpp
 * @brief Significance-gated comparison of a run against its history entry.
 *
 * A change is reported only when |current.mean - previous.mean| exceeds
 * SIGNIFICANCE_SIGMAS times the *current* run's standard deviation.
 */

#include <cmath>
#include <optional>

#include "src/bench/inc/BenchConfig.hpp"
#include "src/bench/inc/BenchHistory.hpp"
#include "src/bench/inc/BenchStats.hpp"

namespace brunch {
namespace bench {

/* --------------------------- ComparisonResult --------------------------- */

/** @brief Per-entry comparison outcome. */
struct ComparisonResult {
  enum class Kind {
    NoHistory, ///< Nothing usable to compare against
    Unchanged, ///< Difference within the significance gate
    Changed    ///< Significant difference; see deltaPct
  };

  Kind kind{Kind::NoHistory};
  double deltaPct{}; ///< Signed percent change of the mean (Changed only)

  [[nodiscard]] bool changed() const noexcept { return kind == Kind::Changed; }
};

/* --------------------------------- API --------------------------------- */

/**
 * @brief Compare @p current with the previous run, if any.
 *
 * The significance gate runs first, so a difference inside it is Unchanged whatever the
 * baseline. A significant difference against a previous mean of zero (or less) has no
 * meaningful percentage and is treated as NoHistory.
 *
 * @note RT-safe (pure computation).
 */
inline ComparisonResult compare(const Statistics& current,
                                const std::optional<HistoryEntry>& previous) noexcept {
  if (!previous) {
    return {};
  }

  const double DIFF = current.meanNs - previous->meanNs;
  if (!(std::fabs(DIFF) > SIGNIFICANCE_SIGMAS * current.stddevNs)) {
    return {ComparisonResult::Kind::Unchanged, 0.0};
  }
  if (!(previous->meanNs > 0.0)) {
    return {};
  }
  return {ComparisonResult::Kind::Changed, DIFF * 100.0 / previous->meanNs};
}

} // namespace bench
} // namespace brunch

#endif // BRUNCH_BENCHCOMPARE_HPP
