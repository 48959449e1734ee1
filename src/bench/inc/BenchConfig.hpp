#ifndef BRUNCH_BENCHCONFIG_HPP
#define BRUNCH_BENCHCONFIG_HPP
/**
 * @file BenchConfig.hpp
 * @brief Suite tunables and the environment-driven history configuration.
 *
 * Recognized environment variables:
 *   BRUNCH_HISTORY       Path of the history file (overrides the temp-dir default)
 *   NO_BRUNCH_HISTORY=1  Disable history load and save for the run
 */

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib> // std::getenv
#include <filesystem>
#include <optional>
#include <string_view>

namespace brunch {
namespace bench {

/* ------------------------------- Defaults ------------------------------- */

using Duration = std::chrono::nanoseconds;

inline constexpr std::uint32_t DEFAULT_SAMPLES = 2500;                 ///< Per-bench sample target
inline constexpr Duration DEFAULT_TIMEOUT = std::chrono::seconds(10); ///< Per-bench time budget
inline constexpr std::size_t MAX_NAME_BYTES = 65535;                  ///< Encoded name length cap

inline constexpr std::uint32_t TRIM_MIN_SAMPLES = 20; ///< Below this, no outlier trimming
inline constexpr double TRIM_LOW = 0.05;              ///< Lower trim quantile
inline constexpr double TRIM_HIGH = 0.95;             ///< Upper trim quantile
inline constexpr double SIGNIFICANCE_SIGMAS = 2.0;    ///< Change gate, in current-run stddevs

inline constexpr const char* HISTORY_FILE_NAME = "__brunch.last";
inline constexpr const char* HISTORY_PATH_ENV = "BRUNCH_HISTORY";
inline constexpr const char* NO_HISTORY_ENV = "NO_BRUNCH_HISTORY";

/* ----------------------------- HistoryConfig ----------------------------- */

/** @brief Where (and whether) run-to-run history is kept. */
struct HistoryConfig {
  std::optional<std::filesystem::path> overridePath{}; ///< Explicit file path, if any
  bool disabled = false;                               ///< Skip both load and save
};

/** @brief When the rendered table carries ANSI styling. */
enum class ColorMode {
  Auto,   ///< Styled only when the output stream is a terminal
  Always, ///< Always styled
  Never   ///< Plain text
};

/* --------------------------------- API --------------------------------- */

/**
 * @brief Build a HistoryConfig from raw environment values.
 *
 * Either pointer may be null (variable unset). The disable flag counts only when
 * its value is exactly "1"; an empty path is ignored.
 *
 * @note RT-safe (no allocation beyond the optional path).
 */
inline HistoryConfig historyConfigFromValues(const char* historyPath, const char* noHistory) {
  HistoryConfig cfg;
  if (noHistory != nullptr && std::string_view(noHistory) == "1") {
    cfg.disabled = true;
  }
  if (historyPath != nullptr && *historyPath != '\0') {
    cfg.overridePath = std::filesystem::path(historyPath);
  }
  return cfg;
}

/**
 * @brief Read BRUNCH_HISTORY / NO_BRUNCH_HISTORY from the process environment.
 * @note NOT RT-safe (environment access).
 */
inline HistoryConfig resolveHistoryConfig() {
  return historyConfigFromValues(std::getenv(HISTORY_PATH_ENV), std::getenv(NO_HISTORY_ENV));
}

} // namespace bench
} // namespace brunch

#endif // BRUNCH_BENCHCONFIG_HPP
