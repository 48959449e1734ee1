#ifndef BRUNCH_SAMPLER_HPP
#define BRUNCH_SAMPLER_HPP
/**
 * @file Sampler.hpp
 * @brief Budgeted sampling loop: time one callable until the sample target or timeout is hit.
 *
 * Each iteration:
 *   1. stage the input (SeededClone: copy the seed, SeededFactory: call the factory) -- untimed
 *   2. read the clock, invoke the callable behind an optimization barrier, read the clock
 *   3. record the difference in nanoseconds
 *   4. stop if `sampleTarget` samples exist or the loop has run longer than `timeout`
 *
 * The budget is checked between calls only, so the loop can overrun the timeout by at most
 * one in-flight call. The first call always completes, so a valid spec yields >= 1 sample.
 */

#include "src/bench/inc/BenchSpec.hpp"
#include "src/bench/inc/BenchStats.hpp"

namespace brunch {
namespace bench {

/**
 * @brief Collect raw per-call durations for @p spec.
 *
 * Spacers produce an empty result. Exceptions thrown by the benchmark callable (or its
 * factory) propagate to the caller; samples gathered before the throw are discarded.
 *
 * @note NOT RT-safe (heap allocation, runs arbitrary user code).
 */
RawSamples collectSamples(const BenchmarkSpec& spec);

} // namespace bench
} // namespace brunch

#endif // BRUNCH_SAMPLER_HPP
