/**
 * @file BenchTable.cpp
 * @brief Implementation of the suite report table.
 */

#include "src/bench/inc/BenchTable.hpp"

#include <algorithm>
#include <cstddef>
#include <string_view>

#include "src/bench/inc/BenchText.hpp"

namespace brunch {
namespace bench {

namespace {

constexpr std::string_view COLUMN_GAP = "    ";
constexpr std::string_view EM_DASH = "\xE2\x80\x94"; // —
constexpr std::string_view NO_CHANGE = "---";

// ANSI styles.
constexpr std::string_view RESET = "\x1b[0m";
constexpr std::string_view BOLD = "\x1b[1m";
constexpr std::string_view DIM = "\x1b[2m";
constexpr std::string_view RED = "\x1b[91m";
constexpr std::string_view GREEN = "\x1b[92m";
constexpr std::string_view HEADER = "\x1b[1;38;5;13m";
constexpr std::string_view RULE = "\x1b[38;5;5m";
constexpr std::string_view FAILURE = "\x1b[1;38;5;208m";

std::string styled(std::string_view style, std::string_view text, bool color) {
  std::string out;
  if (color) {
    out.append(style);
  }
  out.append(text);
  if (color) {
    out.append(RESET);
  }
  return out;
}

/** @brief Dim the namespace part of a name: everything up to the last "::" before the last "(". */
std::string nameCell(const std::string& name, bool color) {
  if (!color) {
    return name;
  }
  const std::size_t PAREN = name.rfind('(');
  const std::string_view HEAD =
      std::string_view(name).substr(0, PAREN == std::string::npos ? name.size() : PAREN);
  const std::size_t SCOPE = HEAD.rfind("::");
  if (SCOPE == std::string_view::npos) {
    return name;
  }
  return styled(DIM, std::string_view(name).substr(0, SCOPE + 2), true) + name.substr(SCOPE + 2);
}

std::string changeCell(const ComparisonResult& cmp, bool color) {
  switch (cmp.kind) {
  case ComparisonResult::Kind::NoHistory:
    return {};
  case ComparisonResult::Kind::Unchanged:
    return styled(DIM, NO_CHANGE, color);
  case ComparisonResult::Kind::Changed:
    return styled(cmp.deltaPct > 0.0 ? RED : GREEN, formatPercent(cmp.deltaPct), color);
  }
  return {};
}

std::string samplesCell(const Statistics& s, bool color) {
  if (!color) {
    return groupDigits(s.valid) + "/" + groupDigits(s.total);
  }
  return std::string(DIM) + groupDigits(s.valid) + "\x1b[0;38;5;5m/\x1b[0;2m" +
         groupDigits(s.total) + std::string(RESET);
}

} // namespace

/* --------------------------------- API --------------------------------- */

bool hasChangeColumn(const std::vector<ReportEntry>& entries) {
  return std::any_of(entries.begin(), entries.end(), [](const ReportEntry& e) {
    return !e.spacer && e.stats && e.comparison.changed();
  });
}

std::vector<ReportRow> buildRows(const std::vector<ReportEntry>& entries, const TableStyle& style) {
  const bool COLOR = style.color;

  std::vector<ReportRow> rows;
  rows.reserve(entries.size() + 1);
  rows.push_back(ReportRow{{styled(HEADER, "Method", COLOR), styled(HEADER, "Mean", COLOR),
                            styled(HEADER, "Change", COLOR), styled(HEADER, "Samples", COLOR)},
                           false});

  for (const ReportEntry& e : entries) {
    if (e.spacer) {
      rows.push_back(ReportRow{{}, true});
    } else if (e.stats) {
      rows.push_back(ReportRow{{nameCell(e.name, COLOR),
                                styled(BOLD, formatDuration(e.stats->meanNs), COLOR),
                                changeCell(e.comparison, COLOR), samplesCell(*e.stats, COLOR)},
                               false});
    } else {
      rows.push_back(ReportRow{{nameCell(e.name, COLOR), styled(FAILURE, EM_DASH, COLOR),
                                std::string{}, styled(FAILURE, EM_DASH, COLOR)},
                               false});
    }
  }
  return rows;
}

std::string renderTable(const std::vector<ReportEntry>& entries, const TableStyle& style) {
  if (entries.empty()) {
    return {};
  }

  const bool SHOW_CHANGE = hasChangeColumn(entries);
  const std::vector<ReportRow> ROWS = buildRows(entries, style);

  // Widths are settled before any row is emitted; spacer rows do not take part.
  std::array<std::size_t, 4> widths{};
  for (const ReportRow& row : ROWS) {
    if (row.spacer) {
      continue;
    }
    for (std::size_t c = 0; c < widths.size(); ++c) {
      widths[c] = std::max(widths[c], displayWidth(row.cells[c]));
    }
  }

  std::size_t tableWidth =
      widths[0] + COLUMN_GAP.size() + widths[1] + COLUMN_GAP.size() + widths[3];
  if (SHOW_CHANGE) {
    tableWidth += widths[2] + COLUMN_GAP.size();
  }

  std::string out;
  for (std::size_t r = 0; r < ROWS.size(); ++r) {
    const ReportRow& row = ROWS[r];
    if (row.spacer) {
      out += '\n';
      continue;
    }

    out += padRight(row.cells[0], widths[0]);
    out += COLUMN_GAP;
    out += padLeft(row.cells[1], widths[1]);
    if (SHOW_CHANGE) {
      out += COLUMN_GAP;
      out += padLeft(row.cells[2], widths[2]);
    }
    out += COLUMN_GAP;
    out += padLeft(row.cells[3], widths[3]);
    out += '\n';

    if (r == 0) {
      out += styled(RULE, std::string(tableWidth, '-'), style.color);
      out += '\n';
    }
  }
  return out;
}

} // namespace bench
} // namespace brunch
