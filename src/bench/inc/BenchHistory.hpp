#ifndef BRUNCH_BENCHHISTORY_HPP
#define BRUNCH_BENCHHISTORY_HPP
/**
 * @file BenchHistory.hpp
 * @brief Persisted "last run" statistics used for run-to-run comparison.
 *
 * File format: newline-delimited UTF-8, one record per line:
 * @code
 *   <normalized name>\t<mean ns>\t<stddev ns>
 * @endcode
 * Numbers use the shortest decimal form that round-trips exactly. Blank lines are ignored;
 * malformed lines are skipped and counted. The file is always rewritten whole.
 */

#include <cstddef>
#include <filesystem>
#include <functional> // std::less<>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "src/bench/inc/BenchConfig.hpp"

namespace brunch {
namespace bench {

/* ----------------------------- HistoryRecord ----------------------------- */

/** @brief What is remembered about one benchmark between runs. */
struct HistoryEntry {
  double meanNs{};   ///< previous mean (ns per call)
  double stddevNs{}; ///< previous population standard deviation
};

/** @brief Normalized name -> previous statistics. */
using HistoryRecord = std::map<std::string, HistoryEntry, std::less<>>;

/** @brief Outcome of HistoryStore::load(); never an error, at worst empty plus warnings. */
struct HistoryLoadResult {
  HistoryRecord records{};
  std::vector<std::string> warnings{};
};

/* ------------------------------ Text Codec ------------------------------ */

/**
 * @brief Render @p history in the line format described above (sorted by name).
 * @note NOT RT-safe (heap allocation).
 */
std::string serializeHistory(const HistoryRecord& history);

/**
 * @brief Parse one line. Returns false (leaving outputs untouched) on any defect:
 * wrong field count, non-normalized or empty name, unparsable, negative or
 * non-finite numbers.
 */
bool parseHistoryLine(std::string_view line, std::string& name, HistoryEntry& entry);

/**
 * @brief Parse a whole history file body.
 * @param skipped Optional count of non-blank lines that failed to parse.
 */
HistoryRecord parseHistory(std::string_view text, std::size_t* skipped = nullptr);

/* ----------------------------- HistoryStore ----------------------------- */

/**
 * @brief Resolves the history location once and performs whole-file load/save.
 *
 * Location: BRUNCH_HISTORY override if set, else `<temp dir>/__brunch.last`. An override
 * naming an existing directory disables history for the run (reported on load).
 *
 * @note NOT RT-safe (filesystem access).
 */
class HistoryStore {
public:
  explicit HistoryStore(const HistoryConfig& cfg);

  /** @brief False when disabled by flag or by an unusable location. */
  [[nodiscard]] bool enabled() const noexcept { return path_.has_value(); }

  /** @brief Resolved file path, if enabled. */
  [[nodiscard]] const std::optional<std::filesystem::path>& path() const noexcept {
    return path_;
  }

  /**
   * @brief Read the previous run. A missing file is an empty history; an unreadable or
   * partly malformed file degrades with warnings but never fails.
   */
  [[nodiscard]] HistoryLoadResult load() const;

  /**
   * @brief Replace the file with @p history (write temp file, then rename over).
   * @return Error description on failure, nullopt on success or when disabled.
   */
  [[nodiscard]] std::optional<std::string> save(const HistoryRecord& history) const;

private:
  std::string resolveWarning_{}; // declared first: filled while path_ is resolved
  std::optional<std::filesystem::path> path_{};
};

} // namespace bench
} // namespace brunch

#endif // BRUNCH_BENCHHISTORY_HPP
