#ifndef BRUNCH_BENCHSTATS_HPP
#define BRUNCH_BENCHSTATS_HPP
/**
 * @file BenchStats.hpp
 * @brief Outlier-trimmed summaries of raw per-call durations (mean, stddev, valid/total).
 */

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "src/bench/inc/BenchConfig.hpp"

namespace brunch {
namespace bench {

/** @brief Per-call durations in nanoseconds, in collection order. */
using RawSamples = std::vector<std::uint64_t>;

/* ----------------------------- Statistics ----------------------------- */

/** @brief Summary of one benchmark run (nanoseconds per call). */
struct Statistics {
  double meanNs{};      ///< arithmetic mean of the valid samples
  double stddevNs{};    ///< population standard deviation of the valid samples
  std::uint32_t valid{}; ///< samples kept after trimming
  std::uint32_t total{}; ///< samples collected
};

/* --------------------------------- API --------------------------------- */

/**
 * @brief Inclusive [lo, hi] index window kept after trimming @p total sorted samples.
 *
 * Below TRIM_MIN_SAMPLES every sample is kept. Otherwise the cut points are the
 * nearest-rank 5th and 95th percentiles: index = round(p * (total - 1)).
 *
 * @pre total >= 1
 * @note RT-safe (pure computation).
 */
inline std::pair<std::size_t, std::size_t> trimWindow(std::size_t total) noexcept {
  if (total < TRIM_MIN_SAMPLES) {
    return {0, total - 1};
  }
  const double LAST = static_cast<double>(total - 1);
  const auto LO = static_cast<std::size_t>(std::llround(TRIM_LOW * LAST));
  const auto HI = static_cast<std::size_t>(std::llround(TRIM_HIGH * LAST));
  return {LO, HI};
}

/**
 * @brief Sort, trim and summarize raw samples.
 * @param samples Raw durations (consumed: sorted in place).
 * @return Statistics, or nullopt when there are no samples at all.
 * @note NOT RT-safe (sort over a heap-allocated vector).
 */
inline std::optional<Statistics> aggregate(RawSamples samples) {
  if (samples.empty()) {
    return std::nullopt;
  }
  std::sort(samples.begin(), samples.end());

  const auto [LO, HI] = trimWindow(samples.size());
  const std::size_t COUNT = HI - LO + 1;

  // Mean
  double sum = 0.0;
  for (std::size_t i = LO; i <= HI; ++i) {
    sum += static_cast<double>(samples[i]);
  }
  const double MEAN = sum / static_cast<double>(COUNT);

  // Standard deviation (population formula, second pass around the mean)
  double sumSquaredDiff = 0.0;
  for (std::size_t i = LO; i <= HI; ++i) {
    const double DIFF = static_cast<double>(samples[i]) - MEAN;
    sumSquaredDiff += DIFF * DIFF;
  }
  const double STDDEV = std::sqrt(sumSquaredDiff / static_cast<double>(COUNT));

  return Statistics{MEAN, STDDEV, static_cast<std::uint32_t>(COUNT),
                    static_cast<std::uint32_t>(samples.size())};
}

} // namespace bench
} // namespace brunch

#endif // BRUNCH_BENCHSTATS_HPP
