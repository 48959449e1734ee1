/**
 * @file BenchHistory_uTest.cpp
 * @brief Unit tests for the history text codec and HistoryStore load/save.
 *
 * Tests line parsing, malformed input handling, location resolution, disabled mode
 * and whole-file replacement.
 */

#include "src/bench/inc/BenchHistory.hpp"
#include "src/bench/utst/helpers/TestHelpers.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <optional>
#include <string>

namespace fs = std::filesystem;

using brunch::bench::HistoryConfig;
using brunch::bench::HistoryEntry;
using brunch::bench::HistoryLoadResult;
using brunch::bench::HistoryRecord;
using brunch::bench::HistoryStore;
using brunch::bench::parseHistory;
using brunch::bench::parseHistoryLine;
using brunch::bench::serializeHistory;
using brunch::bench::test::readFile;
using brunch::bench::test::TempPath;

namespace {

HistoryConfig overrideAt(const fs::path& p) {
  HistoryConfig cfg;
  cfg.overridePath = p;
  return cfg;
}

} // namespace

/* ----------------------------- Line Codec ----------------------------- */

/** @test A well-formed line parses into name, mean and stddev. */
TEST(BenchHistoryTest, ParseLine) {
  std::string name;
  HistoryEntry e;
  ASSERT_TRUE(parseHistoryLine("fib(30)\t2215000.5\t1234.25", name, e));
  EXPECT_EQ(name, "fib(30)");
  EXPECT_DOUBLE_EQ(e.meanNs, 2215000.5);
  EXPECT_DOUBLE_EQ(e.stddevNs, 1234.25);
}

/** @test Names with inner spaces and UTF-8 are fine; CRLF endings are tolerated. */
TEST(BenchHistoryTest, ParseLineNameForms) {
  std::string name;
  HistoryEntry e;
  EXPECT_TRUE(parseHistoryLine("std::sort(1k, asc)\t10\t1\r", name, e));
  EXPECT_EQ(name, "std::sort(1k, asc)");
  EXPECT_TRUE(parseHistoryLine("漢字\t3e2\t0", name, e));
  EXPECT_EQ(name, "漢字");
  EXPECT_DOUBLE_EQ(e.meanNs, 300.0);
}

/** @test Every defect rejects the line and leaves outputs untouched. */
TEST(BenchHistoryTest, ParseLineRejectsDefects) {
  const char* const BAD[] = {
      "no tabs at all",
      "name\t1",                // too few fields
      "name\t1\t2\t3",          // too many fields
      "\t1\t2",                 // empty name
      " padded\t1\t2",          // not normalized
      "two  spaces\t1\t2",      // not normalized
      "name\tabc\t2",           // not a number
      "name\t1\t",              // empty number
      "name\t-1\t2",            // negative mean
      "name\t1\t-0.5",          // negative stddev
      "name\tinf\t2",           // non-finite
      "name\tnan\t2",           // non-finite
      "name\t1.0x\t2",          // trailing garbage
      "name\t 1\t2",            // leading space in number
  };
  for (const char* line : BAD) {
    std::string name = "untouched";
    HistoryEntry e{7.0, 8.0};
    EXPECT_FALSE(parseHistoryLine(line, name, e)) << line;
    EXPECT_EQ(name, "untouched");
    EXPECT_DOUBLE_EQ(e.meanNs, 7.0);
    EXPECT_DOUBLE_EQ(e.stddevNs, 8.0);
  }
}

/* ----------------------------- File Codec ----------------------------- */

/** @test Blank lines are ignored, malformed ones counted, later duplicates win. */
TEST(BenchHistoryTest, ParseWholeFile) {
  std::size_t skipped = 0;
  const HistoryRecord R = parseHistory("a\t1\t0.5\n"
                                       "\n"
                                       "garbage line\n"
                                       "b\t2\t0\n"
                                       "a\t3\t0.25\n"
                                       "   \n"
                                       "c\t-4\t0\n"
                                       "d\t5\t1", // no trailing newline
                                       &skipped);
  EXPECT_EQ(skipped, 2u);
  ASSERT_EQ(R.size(), 3u);
  EXPECT_DOUBLE_EQ(R.at("a").meanNs, 3.0);
  EXPECT_DOUBLE_EQ(R.at("b").meanNs, 2.0);
  EXPECT_DOUBLE_EQ(R.at("d").stddevNs, 1.0);
}

/** @test Serialized text parses back to the same values exactly. */
TEST(BenchHistoryTest, SerializeParsesBack) {
  HistoryRecord in;
  in["add(2, 2)"] = {0.123456789012345, 0.0};
  in["fib(30)"] = {2215000.0 / 3.0, 1e-9};
  in["huge"] = {1.7976931348623157e308, 12345.678};

  std::size_t skipped = 99;
  const HistoryRecord OUT = parseHistory(serializeHistory(in), &skipped);
  EXPECT_EQ(skipped, 0u);
  ASSERT_EQ(OUT.size(), in.size());
  for (const auto& [name, entry] : in) {
    ASSERT_EQ(OUT.count(name), 1u) << name;
    EXPECT_EQ(OUT.at(name).meanNs, entry.meanNs) << name;
    EXPECT_EQ(OUT.at(name).stddevNs, entry.stddevNs) << name;
  }
}

/** @test Names that could not be read back are not written. */
TEST(BenchHistoryTest, SerializeSkipsUnstorableNames) {
  HistoryRecord in;
  in[""] = {1.0, 0.0};
  in["tab\tname"] = {1.0, 0.0};
  in["ok"] = {1.0, 0.0};
  EXPECT_EQ(serializeHistory(in), "ok\t1\t0\n");
}

/* ----------------------------- Location ----------------------------- */

/** @test Default location is __brunch.last in the temp directory. */
TEST(BenchHistoryTest, DefaultLocation) {
  const HistoryStore STORE(HistoryConfig{});
  ASSERT_TRUE(STORE.enabled());
  EXPECT_EQ(*STORE.path(), fs::temp_directory_path() / "__brunch.last");
}

/** @test Disabled configuration resolves to nothing and never touches the file. */
TEST(BenchHistoryTest, DisabledStore) {
  const TempPath HIST("history_disabled");
  HIST.write("a\t1\t0\n");

  HistoryConfig cfg = overrideAt(HIST.path());
  cfg.disabled = true;
  const HistoryStore STORE(cfg);
  EXPECT_FALSE(STORE.enabled());

  const HistoryLoadResult LOADED = STORE.load();
  EXPECT_TRUE(LOADED.records.empty());
  EXPECT_TRUE(LOADED.warnings.empty());

  HistoryRecord fresh;
  fresh["b"] = {2.0, 0.0};
  EXPECT_FALSE(STORE.save(fresh).has_value());
  EXPECT_EQ(readFile(HIST.path()), "a\t1\t0\n");
}

/** @test An override naming a directory disables history with a warning. */
TEST(BenchHistoryTest, DirectoryOverrideDisables) {
  const TempPath FOLDER("history_dir");
  fs::create_directories(FOLDER.path());

  const HistoryStore STORE(overrideAt(FOLDER.path()));
  EXPECT_FALSE(STORE.enabled());
  const HistoryLoadResult LOADED = STORE.load();
  EXPECT_TRUE(LOADED.records.empty());
  ASSERT_EQ(LOADED.warnings.size(), 1u);
  EXPECT_NE(LOADED.warnings[0].find("directory"), std::string::npos);
}

/* ----------------------------- Load / Save ----------------------------- */

/** @test A missing file is an empty history without warnings. */
TEST(BenchHistoryTest, MissingFileIsEmpty) {
  const TempPath HIST("history_missing");
  const HistoryLoadResult LOADED = HistoryStore(overrideAt(HIST.path())).load();
  EXPECT_TRUE(LOADED.records.empty());
  EXPECT_TRUE(LOADED.warnings.empty());
}

/** @test A corrupt file loads what it can and warns about the rest. */
TEST(BenchHistoryTest, CorruptFileDegrades) {
  const TempPath HIST("history_corrupt");
  HIST.write("\x01\x02 binary junk\nok\t10\t1\nmore junk\n");

  const HistoryLoadResult LOADED = HistoryStore(overrideAt(HIST.path())).load();
  ASSERT_EQ(LOADED.records.size(), 1u);
  EXPECT_DOUBLE_EQ(LOADED.records.at("ok").meanNs, 10.0);
  ASSERT_EQ(LOADED.warnings.size(), 1u);
  EXPECT_NE(LOADED.warnings[0].find("2 malformed"), std::string::npos);
}

/** @test save() then load() reproduces the same records. */
TEST(BenchHistoryTest, SaveLoadRoundTrip) {
  const TempPath HIST("history_roundtrip");
  const HistoryStore STORE(overrideAt(HIST.path()));

  HistoryRecord in;
  in["fibonacci_recursive(30)"] = {2215000.123, 4100.5};
  in["fibonacci_loop(30)"] = {56.17, 0.42};
  ASSERT_FALSE(STORE.save(in).has_value());

  const HistoryLoadResult LOADED = STORE.load();
  EXPECT_TRUE(LOADED.warnings.empty());
  ASSERT_EQ(LOADED.records.size(), 2u);
  EXPECT_EQ(LOADED.records.at("fibonacci_recursive(30)").meanNs, 2215000.123);
  EXPECT_EQ(LOADED.records.at("fibonacci_loop(30)").stddevNs, 0.42);
  EXPECT_FALSE(fs::exists(HIST.path().string() + ".tmp"));
}

/** @test save() replaces the whole file; records absent from this run are dropped. */
TEST(BenchHistoryTest, SaveReplacesPreviousContent) {
  const TempPath HIST("history_replace");
  HIST.write("old_one\t1\t0\nold_two\t2\t0\n");
  const HistoryStore STORE(overrideAt(HIST.path()));

  HistoryRecord fresh;
  fresh["new_one"] = {3.0, 0.5};
  ASSERT_FALSE(STORE.save(fresh).has_value());
  EXPECT_EQ(readFile(HIST.path()), "new_one\t3\t0.5\n");
}

/** @test A missing parent directory is created on save. */
TEST(BenchHistoryTest, SaveCreatesParentDirectory) {
  const TempPath FOLDER("history_parent");
  const fs::path TARGET = FOLDER.path() / "nested" / "bench.last";
  const HistoryStore STORE(overrideAt(TARGET));

  HistoryRecord fresh;
  fresh["x"] = {1.0, 0.0};
  ASSERT_FALSE(STORE.save(fresh).has_value());
  EXPECT_TRUE(fs::exists(TARGET));
}

/** @test An impossible location reports an error instead of throwing. */
TEST(BenchHistoryTest, SaveFailureIsReported) {
  const TempPath BLOCKER("history_blocker");
  BLOCKER.write("a regular file, not a directory");
  const HistoryStore STORE(overrideAt(BLOCKER.path() / "bench.last"));

  HistoryRecord fresh;
  fresh["x"] = {1.0, 0.0};
  std::optional<std::string> err;
  EXPECT_NO_THROW(err = STORE.save(fresh));
  EXPECT_TRUE(err.has_value());
}
