/**
 * @file BenchText.cpp
 * @brief Display width tables, padding and number formatting.
 */

#include "src/bench/inc/BenchText.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>
#include <iterator>

namespace brunch {
namespace bench {

namespace {

struct Range {
  char32_t lo;
  char32_t hi;
};

// Combining marks and zero-width formatting characters (sorted, non-overlapping).
constexpr std::array<Range, 38> ZERO_WIDTH{{
    {0x0300, 0x036F},   {0x0483, 0x0489},   {0x0591, 0x05BD},   {0x05BF, 0x05BF},
    {0x05C1, 0x05C2},   {0x05C4, 0x05C5},   {0x05C7, 0x05C7},   {0x0610, 0x061A},
    {0x064B, 0x065F},   {0x0670, 0x0670},   {0x06D6, 0x06DC},   {0x06DF, 0x06E4},
    {0x0900, 0x0902},   {0x093A, 0x093A},   {0x093C, 0x093C},   {0x0941, 0x0948},
    {0x094D, 0x094D},   {0x0E31, 0x0E31},   {0x0E34, 0x0E3A},   {0x0E47, 0x0E4E},
    {0x1160, 0x11FF},   {0x1AB0, 0x1AFF},   {0x1DC0, 0x1DFF},   {0x200B, 0x200F},
    {0x2028, 0x202E},   {0x2060, 0x2064},   {0x20D0, 0x20FF},   {0x302A, 0x302D},
    {0x3099, 0x309A},   {0xFE00, 0xFE0F},   {0xFE20, 0xFE2F},   {0xFEFF, 0xFEFF},
    {0x1D167, 0x1D169}, {0x1D173, 0x1D182}, {0x1F3FB, 0x1F3FF}, {0xE0001, 0xE0001},
    {0xE0020, 0xE007F}, {0xE0100, 0xE01EF},
}};

// East Asian Wide / Fullwidth blocks and emoji presentation ranges.
constexpr std::array<Range, 24> DOUBLE_WIDTH{{
    {0x1100, 0x115F},   {0x231A, 0x231B},   {0x2329, 0x232A},   {0x23E9, 0x23EC},
    {0x2614, 0x2615},   {0x2E80, 0x3029},   {0x302E, 0x303E},   {0x3041, 0x3098},
    {0x309B, 0x33FF},   {0x3400, 0x4DBF},   {0x4E00, 0x9FFF},   {0xA000, 0xA4CF},
    {0xA960, 0xA97F},   {0xAC00, 0xD7A3},   {0xF900, 0xFAFF},   {0xFE10, 0xFE19},
    {0xFE30, 0xFE6F},   {0xFF00, 0xFF60},   {0xFFE0, 0xFFE6},   {0x1F300, 0x1F3FA},
    {0x1F400, 0x1F64F}, {0x1F900, 0x1F9FF}, {0x20000, 0x2FFFD}, {0x30000, 0x3FFFD},
}};

template <std::size_t N> bool inTable(const std::array<Range, N>& table, char32_t cp) noexcept {
  const auto IT = std::upper_bound(table.begin(), table.end(), cp,
                                   [](char32_t v, const Range& r) { return v < r.lo; });
  return IT != table.begin() && cp <= std::prev(IT)->hi;
}

/**
 * @brief Decode one UTF-8 sequence at @p s[i].
 * @return Bytes consumed (>= 1). On malformed input consumes one byte and reports U+FFFD.
 */
std::size_t decodeUtf8(std::string_view s, std::size_t i, char32_t& cp) noexcept {
  const auto B0 = static_cast<unsigned char>(s[i]);
  std::size_t len = 0;
  char32_t value = 0;
  if (B0 < 0x80) {
    cp = B0;
    return 1;
  } else if ((B0 & 0xE0) == 0xC0) {
    len = 2;
    value = B0 & 0x1F;
  } else if ((B0 & 0xF0) == 0xE0) {
    len = 3;
    value = B0 & 0x0F;
  } else if ((B0 & 0xF8) == 0xF0) {
    len = 4;
    value = B0 & 0x07;
  } else {
    cp = 0xFFFD;
    return 1;
  }

  if (i + len > s.size()) {
    cp = 0xFFFD;
    return 1;
  }
  for (std::size_t k = 1; k < len; ++k) {
    const auto BK = static_cast<unsigned char>(s[i + k]);
    if ((BK & 0xC0) != 0x80) {
      cp = 0xFFFD;
      return 1;
    }
    value = (value << 6) | (BK & 0x3F);
  }
  cp = value;
  return len;
}

} // namespace

/* ----------------------------- Display Width ----------------------------- */

int codepointWidth(char32_t cp) noexcept {
  if (cp == 0) {
    return 0;
  }
  if (cp < 0x20 || (cp >= 0x7F && cp < 0xA0)) {
    return 0;
  }
  if (cp < 0x300) {
    return 1;
  }
  if (inTable(ZERO_WIDTH, cp)) {
    return 0;
  }
  if (inTable(DOUBLE_WIDTH, cp)) {
    return 2;
  }
  return 1;
}

std::size_t displayWidth(std::string_view utf8) noexcept {
  std::size_t width = 0;
  std::size_t i = 0;
  while (i < utf8.size()) {
    // ANSI CSI sequence: ESC '[' parameters... final byte in 0x40..0x7E.
    if (utf8[i] == '\x1b') {
      ++i;
      if (i < utf8.size() && utf8[i] == '[') {
        ++i;
        while (i < utf8.size() && (utf8[i] < 0x40 || utf8[i] > 0x7E)) {
          ++i;
        }
        if (i < utf8.size()) {
          ++i;
        }
      }
      continue;
    }

    char32_t cp = 0;
    i += decodeUtf8(utf8, i, cp);
    width += static_cast<std::size_t>(codepointWidth(cp));
  }
  return width;
}

std::string padRight(std::string_view cell, std::size_t width) {
  const std::size_t W = displayWidth(cell);
  std::string out(cell);
  if (W < width) {
    out.append(width - W, ' ');
  }
  return out;
}

std::string padLeft(std::string_view cell, std::size_t width) {
  const std::size_t W = displayWidth(cell);
  std::string out;
  if (W < width) {
    out.assign(width - W, ' ');
  }
  out.append(cell);
  return out;
}

/* --------------------------- Number Formatting --------------------------- */

std::string groupDigits(std::uint64_t value) {
  const std::string DIGITS = std::to_string(value);
  std::string out;
  out.reserve(DIGITS.size() + DIGITS.size() / 3);

  const std::size_t LEAD = DIGITS.size() % 3;
  for (std::size_t i = 0; i < DIGITS.size(); ++i) {
    if (i != 0 && (i % 3) == LEAD) {
      out.push_back(',');
    }
    out.push_back(DIGITS[i]);
  }
  return out;
}

std::string formatDuration(double ns) {
  struct Unit {
    double divisor;
    const char* suffix;
  };
  static constexpr std::array<Unit, 4> UNITS{{
      {1e9, "s"},
      {1e6, "ms"},
      {1e3, "\xCE\xBCs"}, // μs
      {1.0, "ns"},
  }};

  if (!std::isfinite(ns) || ns < 0.0) {
    ns = 0.0;
  }

  for (const Unit& u : UNITS) {
    const long long HUNDREDTHS = std::llround(ns / u.divisor * 100.0);
    if (HUNDREDTHS >= 100 || u.divisor == 1.0) {
      const auto WHOLE = static_cast<std::uint64_t>(HUNDREDTHS / 100);
      const auto FRAC = static_cast<int>(HUNDREDTHS % 100);
      char frac[8];
      std::snprintf(frac, sizeof(frac), ".%02d ", FRAC);
      return groupDigits(WHOLE) + frac + u.suffix;
    }
  }
  return "0.00 ns";
}

std::string formatPercent(double pct) {
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%+.2f%%", pct);
  return buf;
}

} // namespace bench
} // namespace brunch
