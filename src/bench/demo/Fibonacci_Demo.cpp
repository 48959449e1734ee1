/**
 * @file Fibonacci_Demo.cpp
 * @brief Demo: recursive vs iterative Fibonacci, compared against the previous run.
 *
 * Shows the whole workflow in one program:
 *  1. Define benchmarks with the Bench builder
 *  2. Group them with a spacer
 *  3. finish() measures, prints the table and remembers the results
 *
 * Run it twice: the second run shows a Change column wherever a mean moved by more
 * than two standard deviations.
 *
 * Usage:
 *   @code{.sh}
 *   ./BrunchDemo_Fibonacci
 *   BRUNCH_HISTORY=/tmp/fib.last ./BrunchDemo_Fibonacci
 *   NO_BRUNCH_HISTORY=1 ./BrunchDemo_Fibonacci
 *   @endcode
 */

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <utility>
#include <vector>

#include "src/bench/inc/Brunch.hpp"

namespace bb = brunch::bench;

namespace {

/* ----------------------------- Workloads ----------------------------- */

std::uint64_t fibRecursive(std::uint32_t n) {
  return n < 2 ? n : fibRecursive(n - 1) + fibRecursive(n - 2);
}

std::uint64_t fibLoop(std::uint32_t n) {
  std::uint64_t a = 0;
  std::uint64_t b = 1;
  for (std::uint32_t i = 0; i < n; ++i) {
    const std::uint64_t NEXT = a + b;
    a = b;
    b = NEXT;
  }
  return a;
}

/** @brief First @p n Fibonacci numbers, memoized bottom-up. */
std::vector<std::uint64_t> fibTable(std::vector<std::uint64_t> table, std::uint32_t n) {
  table.clear();
  table.push_back(0);
  table.push_back(1);
  for (std::uint32_t i = 2; i < n; ++i) {
    table.push_back(table[i - 1] + table[i - 2]);
  }
  return table;
}

} // namespace

/* ------------------------------- Main ------------------------------- */

int main() {
  using namespace std::chrono_literals;

  bb::Suite suite;
  try {
    suite.extend({
        bb::Bench("fibonacci_recursive(30)").withSamples(200).run([] { return fibRecursive(30); }),
        bb::Bench("fibonacci_loop(30)").run([] { return fibLoop(30); }),
        bb::Bench::spacer(),
        bb::Bench("fibonacci_table(90)")
            .withTimeout(2s)
            .runSeeded(std::vector<std::uint64_t>(90), [](std::vector<std::uint64_t> v) {
              return fibTable(std::move(v), 90).back();
            }),
    });
  } catch (const bb::ConfigurationError& e) {
    std::fprintf(stderr, "  [ERROR] %s\n", e.what());
    return 2;
  }

  return suite.finish() ? 0 : 1;
}
