/**
 * @file BenchSuite.cpp
 * @brief Suite orchestration: measure, compare, render, persist.
 */

#include "src/bench/inc/BenchSuite.hpp"

#include <exception>
#include <set>
#include <string_view>

#include <unistd.h> // isatty

#include "src/bench/inc/BenchHistory.hpp"
#include "src/bench/inc/BenchTable.hpp"
#include "src/bench/inc/Sampler.hpp"

namespace brunch {
namespace bench {

/* ----------------------------- Diagnostics ----------------------------- */

void Suite::warn(const std::string& msg) {
  std::fprintf(opts_.err, "  [WARN] %s\n", msg.c_str());
  warnings_.push_back(msg);
}

void Suite::error(const std::string& msg) {
  std::fprintf(opts_.err, "  [ERROR] %s\n", msg.c_str());
  warnings_.push_back(msg);
}

void Suite::warnDuplicates() {
  std::set<std::string_view> seen;
  for (const BenchmarkSpec& spec : specs_) {
    if (spec.isSpacer()) {
      continue;
    }
    if (!seen.insert(spec.name()).second) {
      warn("duplicate benchmark name \"" + spec.name() +
           "\"; both entries run, the later one is kept in history");
    }
  }
}

bool Suite::useColor() const {
  switch (opts_.color) {
  case ColorMode::Always:
    return true;
  case ColorMode::Never:
    return false;
  case ColorMode::Auto:
    break;
  }
  const int FD = ::fileno(opts_.out);
  return FD >= 0 && ::isatty(FD) != 0;
}

/* ------------------------------ Measurement ------------------------------ */

void Suite::measure(const BenchmarkSpec& spec, EntryResult& result) {
  result.state = EntryState::Sampling;
  try {
    result.stats = aggregate(collectSamples(spec));
  } catch (const std::exception& e) {
    result.failure = EntryFailure::Threw;
    result.failureDetail = e.what();
  } catch (...) {
    result.failure = EntryFailure::Threw;
    result.failureDetail = "unknown exception";
  }

  if (result.stats) {
    result.state = EntryState::Measured;
    return;
  }

  if (!result.failure) {
    result.failure = EntryFailure::NoSamples;
  }
  result.state = EntryState::Failed;

  std::string msg = "\"" + result.name + "\": " + toString(*result.failure);
  if (!result.failureDetail.empty()) {
    msg += ": " + result.failureDetail;
  }
  error(msg);
}

/* -------------------------------- finish -------------------------------- */

bool Suite::finish() {
  if (finished_) {
    return outcome_;
  }
  finished_ = true;

  std::size_t measurable = 0;
  for (const BenchmarkSpec& spec : specs_) {
    measurable += spec.isSpacer() ? 0 : 1;
  }
  if (measurable == 0) {
    error("suite has no benchmarks to run");
    outcome_ = false;
    return outcome_;
  }

  // 1. Duplicates
  warnDuplicates();

  // 2. History
  const HistoryStore STORE(opts_.history ? *opts_.history : resolveHistoryConfig());
  HistoryLoadResult loaded = STORE.load();
  for (const std::string& w : loaded.warnings) {
    warn(w);
  }

  // 3. + 4. Measure and compare, strictly in insertion order
  results_.clear();
  results_.reserve(specs_.size());
  bool allMeasured = true;
  for (const BenchmarkSpec& spec : specs_) {
    EntryResult result;
    result.name = spec.name();
    result.spacer = spec.isSpacer();
    if (!result.spacer) {
      measure(spec, result);
      if (result.stats) {
        const auto IT = loaded.records.find(result.name);
        const std::optional<HistoryEntry> PREVIOUS =
            IT == loaded.records.end() ? std::nullopt : std::optional<HistoryEntry>(IT->second);
        result.comparison = compare(*result.stats, PREVIOUS);
      } else {
        allMeasured = false;
      }
    }
    results_.push_back(std::move(result));
  }

  // 5. Render
  std::vector<ReportEntry> entries;
  entries.reserve(results_.size());
  for (const EntryResult& r : results_) {
    entries.push_back(ReportEntry{r.name, r.spacer, r.stats, r.comparison});
  }
  report_ = renderTable(entries, TableStyle{useColor()});
  std::fputs(report_.c_str(), opts_.out);
  std::fflush(opts_.out);

  // 6. Persist (later duplicates overwrite earlier ones)
  if (STORE.enabled()) {
    HistoryRecord fresh;
    for (const EntryResult& r : results_) {
      if (r.stats) {
        fresh.insert_or_assign(r.name, HistoryEntry{r.stats->meanNs, r.stats->stddevNs});
      }
    }
    if (const auto ERR = STORE.save(fresh)) {
      warn(*ERR);
    }
  }

  outcome_ = allMeasured;
  return outcome_;
}

} // namespace bench
} // namespace brunch
