#ifndef BRUNCH_BENCHTABLE_HPP
#define BRUNCH_BENCHTABLE_HPP
/**
 * @file BenchTable.hpp
 * @brief Renders a finished suite as an aligned, unit-scaled table.
 *
 * Format:
 * @code
 * Method                        Mean    Change        Samples
 * -----------------------------------------------------------
 * fibonacci_recursive(30)    2.22 ms    +1.02%    2,408/2,500
 * fibonacci_loop(30)        56.17 ns       ---    2,499/2,500
 *
 * broken()                         —                        —
 * @endcode
 *
 * Column widths come from the display width of every cell (header included) except
 * spacer rows, which print as blank lines. The Change column is dropped entirely
 * when no entry changed significantly.
 */

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "src/bench/inc/BenchCompare.hpp"
#include "src/bench/inc/BenchStats.hpp"

namespace brunch {
namespace bench {

/* ------------------------------ ReportEntry ------------------------------ */

/** @brief Presenter input for one suite entry. */
struct ReportEntry {
  std::string name;                ///< normalized name (empty for spacers)
  bool spacer = false;             ///< layout break only
  std::optional<Statistics> stats; ///< nullopt for spacers and failed entries
  ComparisonResult comparison{};   ///< NoHistory unless compared
};

/** @brief Rendered cells for one row, before padding. */
struct ReportRow {
  std::array<std::string, 4> cells{}; ///< name, mean, change, samples
  bool spacer = false;
};

/** @brief Presenter knobs. */
struct TableStyle {
  bool color = false; ///< Emit ANSI styling
};

/* --------------------------------- API --------------------------------- */

/** @brief True when at least one entry has a significant change. */
bool hasChangeColumn(const std::vector<ReportEntry>& entries);

/** @brief Header row followed by one row per entry (cells unpadded). */
std::vector<ReportRow> buildRows(const std::vector<ReportEntry>& entries, const TableStyle& style);

/**
 * @brief Full table text, newline-terminated. Empty input renders as an empty string.
 * @note NOT RT-safe (heap allocation).
 */
std::string renderTable(const std::vector<ReportEntry>& entries, const TableStyle& style = {});

} // namespace bench
} // namespace brunch

#endif // BRUNCH_BENCHTABLE_HPP
