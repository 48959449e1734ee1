/**
 * @file BenchHistory.cpp
 * @brief History file location, text codec, and whole-file load/save.
 */

#include "src/bench/inc/BenchHistory.hpp"

#include <charconv>
#include <cmath>
#include <fstream>
#include <sstream>
#include <system_error>

#include "src/bench/inc/BenchSpec.hpp" // collapseWhitespace

namespace brunch {
namespace bench {

namespace fs = std::filesystem;

namespace {

/** @brief Shortest round-trip decimal text for @p value. */
void appendNumber(std::string& out, double value) {
  char buf[64];
  const auto RES = std::to_chars(buf, buf + sizeof(buf), value);
  out.append(buf, RES.ptr);
}

bool parseNumber(std::string_view text, double& out) {
  if (text.empty()) {
    return false;
  }
  double value = 0.0;
  const char* const END = text.data() + text.size();
  const auto RES = std::from_chars(text.data(), END, value);
  if (RES.ec != std::errc{} || RES.ptr != END) {
    return false;
  }
  if (!std::isfinite(value) || value < 0.0) {
    return false;
  }
  out = value;
  return true;
}

bool isStorableName(std::string_view name) {
  return !name.empty() && name.size() <= MAX_NAME_BYTES && collapseWhitespace(name) == name;
}

bool isBlank(std::string_view line) {
  for (const char C : line) {
    if (C != ' ' && C != '\t' && C != '\r') {
      return false;
    }
  }
  return true;
}

/**
 * @brief Decide the file location for @p cfg. Sets @p warning when an override is unusable.
 */
std::optional<fs::path> resolveHistoryPath(const HistoryConfig& cfg, std::string& warning) {
  if (cfg.disabled) {
    return std::nullopt;
  }

  std::error_code ec;
  if (cfg.overridePath) {
    if (fs::is_directory(*cfg.overridePath, ec)) {
      warning = std::string(HISTORY_PATH_ENV) + " names a directory (" +
                cfg.overridePath->string() + "); history is disabled for this run";
      return std::nullopt;
    }
    return *cfg.overridePath;
  }

  const fs::path DIR = fs::temp_directory_path(ec);
  if (ec) {
    warning = "no usable temporary directory (" + ec.message() +
              "); history is disabled for this run";
    return std::nullopt;
  }
  return DIR / HISTORY_FILE_NAME;
}

} // namespace

/* ------------------------------ Text Codec ------------------------------ */

std::string serializeHistory(const HistoryRecord& history) {
  std::string out;
  for (const auto& [name, entry] : history) {
    // Names that could not be read back are not written.
    if (!isStorableName(name)) {
      continue;
    }
    out += name;
    out += '\t';
    appendNumber(out, entry.meanNs);
    out += '\t';
    appendNumber(out, entry.stddevNs);
    out += '\n';
  }
  return out;
}

bool parseHistoryLine(std::string_view line, std::string& name, HistoryEntry& entry) {
  if (!line.empty() && line.back() == '\r') {
    line.remove_suffix(1);
  }

  const std::size_t TAB1 = line.find('\t');
  if (TAB1 == std::string_view::npos) {
    return false;
  }
  const std::size_t TAB2 = line.find('\t', TAB1 + 1);
  if (TAB2 == std::string_view::npos || line.find('\t', TAB2 + 1) != std::string_view::npos) {
    return false;
  }

  const std::string_view NAME = line.substr(0, TAB1);
  if (!isStorableName(NAME)) {
    return false;
  }

  HistoryEntry parsed;
  if (!parseNumber(line.substr(TAB1 + 1, TAB2 - TAB1 - 1), parsed.meanNs) ||
      !parseNumber(line.substr(TAB2 + 1), parsed.stddevNs)) {
    return false;
  }

  name.assign(NAME);
  entry = parsed;
  return true;
}

HistoryRecord parseHistory(std::string_view text, std::size_t* skipped) {
  HistoryRecord out;
  std::size_t bad = 0;

  std::size_t start = 0;
  while (start < text.size()) {
    std::size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    const std::string_view LINE = text.substr(start, end - start);
    start = end + 1;

    if (isBlank(LINE)) {
      continue;
    }
    std::string name;
    HistoryEntry entry;
    if (parseHistoryLine(LINE, name, entry)) {
      out.insert_or_assign(std::move(name), entry);
    } else {
      ++bad;
    }
  }

  if (skipped != nullptr) {
    *skipped = bad;
  }
  return out;
}

/* ----------------------------- HistoryStore ----------------------------- */

HistoryStore::HistoryStore(const HistoryConfig& cfg)
    : path_(resolveHistoryPath(cfg, resolveWarning_)) {}

HistoryLoadResult HistoryStore::load() const {
  HistoryLoadResult out;
  if (!resolveWarning_.empty()) {
    out.warnings.push_back(resolveWarning_);
  }
  if (!path_) {
    return out;
  }

  std::error_code ec;
  if (!fs::exists(*path_, ec)) {
    if (ec) {
      out.warnings.push_back("unable to inspect history file " + path_->string() + " (" +
                             ec.message() + "); continuing without history");
    }
    return out;
  }

  std::ifstream in(*path_, std::ios::binary);
  if (!in) {
    out.warnings.push_back("unable to open history file " + path_->string() +
                           "; continuing without history");
    return out;
  }

  std::ostringstream body;
  body << in.rdbuf();
  if (in.bad()) {
    out.warnings.push_back("read error in history file " + path_->string() +
                           "; continuing without history");
    return out;
  }

  std::size_t skipped = 0;
  out.records = parseHistory(body.str(), &skipped);
  if (skipped > 0) {
    out.warnings.push_back("ignored " + std::to_string(skipped) + " malformed line(s) in " +
                           path_->string());
  }
  return out;
}

std::optional<std::string> HistoryStore::save(const HistoryRecord& history) const {
  if (!path_) {
    return std::nullopt;
  }
  const fs::path& TARGET = *path_;

  std::error_code ec;
  if (TARGET.has_parent_path()) {
    fs::create_directories(TARGET.parent_path(), ec);
    if (ec) {
      return "unable to create " + TARGET.parent_path().string() + " (" + ec.message() + ")";
    }
  }

  fs::path tmp = TARGET;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      return "unable to open " + tmp.string() + " for writing";
    }
    out << serializeHistory(history);
    out.flush();
    if (!out) {
      out.close();
      fs::remove(tmp, ec);
      return "write to " + tmp.string() + " failed";
    }
  }

  fs::rename(tmp, TARGET, ec);
  if (ec) {
    const std::string REASON = ec.message();
    fs::remove(tmp, ec);
    return "unable to replace " + TARGET.string() + " (" + REASON + ")";
  }
  return std::nullopt;
}

} // namespace bench
} // namespace brunch
