#ifndef BRUNCH_BENCHUTILS_HPP
#define BRUNCH_BENCHUTILS_HPP
/**
 * @file BenchUtils.hpp
 * @brief Internal utility functions for the benchmark engine.
 *
 * Consolidates small utility pieces:
 * - Clock utilities (monotonic clock for per-call timing)
 * - Optimization barriers (keep benchmark results alive)
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <type_traits>
#include <utility>

namespace brunch {
namespace bench {

/* ---------------------------- Clock Utilities ---------------------------- */

/** @brief Monotonic clock used for every timed interval. */
using Clock = std::chrono::steady_clock;

/**
 * @brief Nanoseconds between two clock readings, clamped at zero.
 * @note RT-safe (pure computation).
 */
inline std::uint64_t elapsedNs(Clock::time_point start, Clock::time_point end) noexcept {
  const auto NS = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count();
  return NS > 0 ? static_cast<std::uint64_t>(NS) : 0;
}

/* ------------------------- Optimization Barriers ------------------------- */

/**
 * @brief Force the compiler to treat @p value as observed.
 *
 * Empty asm with the value as an input operand and a memory clobber: the value must be
 * materialized, and no load/store may be moved across the barrier.
 *
 * @note RT-safe (no instructions emitted on GCC/Clang).
 */
template <typename T> inline void doNotOptimize(const T& value) {
#if defined(__GNUC__) || defined(__clang__)
  asm volatile("" : : "r,m"(value) : "memory");
#else
  static volatile const void* sink;
  sink = &value;
#endif
}

/** @brief Compiler-level memory barrier (for callables without a result). */
inline void clobberMemory() {
#if defined(__GNUC__) || defined(__clang__)
  asm volatile("" : : : "memory");
#else
  std::atomic_signal_fence(std::memory_order_seq_cst);
#endif
}

/**
 * @brief Invoke @p fn and keep whatever it returns alive.
 *
 * Void callables get a memory clobber instead.
 */
template <typename Fn, typename... Args> inline void invokeOpaque(Fn& fn, Args&&... args) {
  if constexpr (std::is_void_v<std::invoke_result_t<Fn&, Args...>>) {
    std::invoke(fn, std::forward<Args>(args)...);
    clobberMemory();
  } else {
    auto&& result = std::invoke(fn, std::forward<Args>(args)...);
    doNotOptimize(result);
  }
}

} // namespace bench
} // namespace brunch

#endif // BRUNCH_BENCHUTILS_HPP
