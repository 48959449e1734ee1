#ifndef BRUNCH_BENCHTEXT_HPP
#define BRUNCH_BENCHTEXT_HPP
/**
 * @file BenchText.hpp
 * @brief Terminal text helpers: display width, padding and number formatting.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace brunch {
namespace bench {

/* ----------------------------- Display Width ----------------------------- */

/**
 * @brief Terminal columns occupied by one code point.
 *
 * 0 for control characters, combining marks and zero-width formatting characters;
 * 2 for East Asian wide/fullwidth characters and emoji; 1 otherwise.
 *
 * @note RT-safe (table lookup).
 */
int codepointWidth(char32_t cp) noexcept;

/**
 * @brief Terminal columns occupied by UTF-8 text.
 *
 * ANSI escape sequences (ESC [ ... final byte) contribute nothing. Invalid UTF-8 bytes
 * count as one column each.
 *
 * @note RT-safe (no allocation).
 */
std::size_t displayWidth(std::string_view utf8) noexcept;

/** @brief Left-align @p cell in @p width columns. */
std::string padRight(std::string_view cell, std::size_t width);

/** @brief Right-align @p cell in @p width columns. */
std::string padLeft(std::string_view cell, std::size_t width);

/* --------------------------- Number Formatting --------------------------- */

/** @brief Decimal with comma thousands separators: 2500 -> "2,500". */
std::string groupDigits(std::uint64_t value);

/**
 * @brief Scale a nanosecond duration to ns, μs, ms or s with two decimals.
 *
 * The unit is the largest one whose mantissa (after rounding to two decimals) is at
 * least 1: 56.17 -> "56.17 ns", 2220000 -> "2.22 ms", 1234567890123 -> "1,234.57 s".
 */
std::string formatDuration(double ns);

/** @brief Signed percentage with two decimals: 30 -> "+30.00%", -4.5 -> "-4.50%". */
std::string formatPercent(double pct);

} // namespace bench
} // namespace brunch

#endif // BRUNCH_BENCHTEXT_HPP
