#ifndef BRUNCH_BRUNCH_HPP
#define BRUNCH_BRUNCH_HPP
/**
 * @file Brunch.hpp
 * @brief All-in-one convenience header for writing benchmark suites.
 *
 * Scope: Includes every public-facing header needed to define benchmarks and run a suite.
 * Users can include only this file instead of individual component headers.
 *
 * Typical usage:
 * @code{.cpp}
 *   #include "src/bench/inc/Brunch.hpp"
 *
 *   int main() {
 *     namespace bb = brunch::bench;
 *     bb::Suite suite;
 *     suite.push(bb::Bench("hash(\"abc\")").run([] { return std::hash<std::string>{}("abc"); }));
 *     return suite.finish() ? 0 : 1;
 *   }
 * @endcode
 */

// Defaults and history configuration (BRUNCH_HISTORY, NO_BRUNCH_HISTORY)
#include "src/bench/inc/BenchConfig.hpp"

// Errors (ConfigurationError, EntryFailure)
#include "src/bench/inc/BenchError.hpp"

// Benchmark definitions and the Bench builder
#include "src/bench/inc/BenchSpec.hpp"

// Orchestrator (measure, compare, render, persist)
#include "src/bench/inc/BenchSuite.hpp"

#endif // BRUNCH_BRUNCH_HPP
