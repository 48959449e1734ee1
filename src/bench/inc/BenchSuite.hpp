#ifndef BRUNCH_BENCHSUITE_HPP
#define BRUNCH_BENCHSUITE_HPP
/**
 * @file BenchSuite.hpp
 * @brief Ordered collection of benchmarks run, compared, reported and persisted together.
 *
 * Typical usage:
 * @code{.cpp}
 *   brunch::bench::Suite suite;
 *   suite.push(Bench("fib_loop(30)").run([] { return fibLoop(30); }));
 *   suite.push(Bench::spacer());
 *   suite.push(Bench("fib_rec(30)").withSamples(200).run([] { return fibRec(30); }));
 *   return suite.finish() ? 0 : 1;
 * @endcode
 *
 * finish() phases:
 *  1. warn about duplicate names (both still run; the later one wins in history)
 *  2. load history
 *  3. sample + aggregate each entry in insertion order, one at a time
 *  4. compare measured entries against history
 *  5. render the table to the output stream
 *  6. save the new history (unless disabled)
 *
 * Anything that goes wrong after construction degrades to a warning or a failed row;
 * the remaining entries, the report and the save still happen.
 */

#include <cstddef>
#include <cstdio>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "src/bench/inc/BenchCompare.hpp"
#include "src/bench/inc/BenchConfig.hpp"
#include "src/bench/inc/BenchError.hpp"
#include "src/bench/inc/BenchSpec.hpp"
#include "src/bench/inc/BenchStats.hpp"

namespace brunch {
namespace bench {

/* ------------------------------ EntryResult ------------------------------ */

/** @brief Lifecycle of one entry inside finish(). */
enum class EntryState {
  Pending,  ///< not yet run
  Sampling, ///< sampler running
  Measured, ///< statistics available
  Failed    ///< no statistics; see failure
};

/** @brief What finish() produced for one entry. */
struct EntryResult {
  std::string name;
  bool spacer = false;
  EntryState state = EntryState::Pending;
  std::optional<Statistics> stats{};
  ComparisonResult comparison{};
  std::optional<EntryFailure> failure{};
  std::string failureDetail{}; ///< exception text for EntryFailure::Threw
};

/* ----------------------------- SuiteOptions ----------------------------- */

/** @brief Where output goes and how history is located. */
struct SuiteOptions {
  std::FILE* out = stdout;                    ///< rendered table
  std::FILE* err = stderr;                    ///< [WARN]/[ERROR] diagnostics
  std::optional<HistoryConfig> history{};     ///< nullopt: read BRUNCH_HISTORY/NO_BRUNCH_HISTORY
  ColorMode color = ColorMode::Auto;
};

/* --------------------------------- Suite --------------------------------- */

/**
 * @brief The benchmark orchestrator.
 *
 * Entries run strictly sequentially on the calling thread.
 * @note NOT RT-safe (heap allocation, console and file I/O, runs arbitrary user code).
 */
class Suite {
public:
  Suite() = default;
  explicit Suite(SuiteOptions opts) : opts_(std::move(opts)) {}

  /** @brief Append one entry (benchmark or spacer). */
  void push(BenchmarkSpec spec) { specs_.push_back(std::move(spec)); }

  /** @brief Append entries in order. */
  void extend(std::initializer_list<BenchmarkSpec> specs) {
    for (const BenchmarkSpec& s : specs) {
      push(s);
    }
  }

  /** @brief Append entries from any range of BenchmarkSpec, in order. */
  template <typename Range> void extend(Range&& specs) {
    for (auto&& s : specs) {
      push(std::forward<decltype(s)>(s));
    }
  }

  /**
   * @brief Run everything, print the report, persist history.
   *
   * Terminal: a second call does not re-run anything and returns the first outcome.
   *
   * @return false if any entry failed to produce statistics, or if there was nothing to run.
   */
  [[nodiscard]] bool finish();

  [[nodiscard]] std::size_t size() const noexcept { return specs_.size(); }
  [[nodiscard]] bool finished() const noexcept { return finished_; }

  /** @brief Per-entry outcomes in insertion order (filled by finish()). */
  [[nodiscard]] const std::vector<EntryResult>& results() const noexcept { return results_; }

  /** @brief Every diagnostic emitted by finish(), in order, without the tag prefix. */
  [[nodiscard]] const std::vector<std::string>& warnings() const noexcept { return warnings_; }

  /** @brief The rendered table (empty until finish()). */
  [[nodiscard]] const std::string& report() const noexcept { return report_; }

private:
  void warn(const std::string& msg);
  void error(const std::string& msg);
  void warnDuplicates();
  void measure(const BenchmarkSpec& spec, EntryResult& result);
  [[nodiscard]] bool useColor() const;

  SuiteOptions opts_{};
  std::vector<BenchmarkSpec> specs_{};
  std::vector<EntryResult> results_{};
  std::vector<std::string> warnings_{};
  std::string report_{};
  bool finished_ = false;
  bool outcome_ = false;
};

} // namespace bench
} // namespace brunch

#endif // BRUNCH_BENCHSUITE_HPP
