/**
 * @file TestHelpers.hpp
 * @brief Shared utilities for brunch unit tests
 *
 * Provides scoped temp paths for history files, captured output streams and
 * scoped environment overrides used across the unit test suite.
 */

#ifndef BRUNCH_TEST_HELPERS_HPP
#define BRUNCH_TEST_HELPERS_HPP

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <random>
#include <string>
#include <system_error>

namespace brunch {
namespace bench {
namespace test {

/**
 * @brief Read a whole file (binary mode).
 *
 * @param path File to read
 * @return File contents, empty if the file cannot be opened
 */
inline std::string readFile(const std::filesystem::path& path) {
  std::ifstream ifs(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

/* ------------------------------- TempPath ------------------------------- */

/**
 * @brief Unique path under the temp directory, removed on scope exit.
 *
 * The path is only reserved by name; nothing is created until a test writes it.
 * Removal also covers the ".tmp" sibling left by an interrupted history save.
 */
class TempPath {
public:
  /** @param stem Filename prefix, e.g. "history_roundtrip" */
  explicit TempPath(const std::string& stem) {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    path_ = std::filesystem::temp_directory_path() /
            ("brunch_" + stem + "_" + std::to_string(gen()) + ".last");
  }

  ~TempPath() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    std::filesystem::remove(path_.string() + ".tmp", ec);
  }

  TempPath(const TempPath&) = delete;
  TempPath& operator=(const TempPath&) = delete;

  const std::filesystem::path& path() const { return path_; }

  /** @brief Replace the file's content with @p text. */
  void write(const std::string& text) const {
    std::ofstream ofs(path_, std::ios::binary);
    ofs << text;
  }

private:
  std::filesystem::path path_;
};

/* ------------------------------- Capture ------------------------------- */

/** @brief Anonymous temp file standing in for stdout/stderr. */
class Capture {
public:
  Capture() : file_(std::tmpfile()) {}
  ~Capture() {
    if (file_ != nullptr) {
      std::fclose(file_);
    }
  }

  Capture(const Capture&) = delete;
  Capture& operator=(const Capture&) = delete;

  std::FILE* get() const { return file_; }

  /** @brief Everything written so far. */
  std::string text() const {
    std::string out;
    if (file_ == nullptr) {
      return out;
    }
    std::fflush(file_);
    std::rewind(file_);
    char buf[512];
    std::size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), file_)) > 0) {
      out.append(buf, n);
    }
    return out;
  }

private:
  std::FILE* file_;
};

/* ------------------------------- ScopedEnv ------------------------------- */

/** @brief Set (or unset, with nullptr) an environment variable for the object's lifetime. */
class ScopedEnv {
public:
  ScopedEnv(const char* name, const char* value) : name_(name) {
    if (const char* prev = std::getenv(name)) {
      previous_ = prev;
    }
    if (value != nullptr) {
      ::setenv(name, value, 1);
    } else {
      ::unsetenv(name);
    }
  }

  ~ScopedEnv() {
    if (previous_) {
      ::setenv(name_.c_str(), previous_->c_str(), 1);
    } else {
      ::unsetenv(name_.c_str());
    }
  }

  ScopedEnv(const ScopedEnv&) = delete;
  ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
  std::string name_;
  std::optional<std::string> previous_;
};

} // namespace test
} // namespace bench
} // namespace brunch

#endif // BRUNCH_TEST_HELPERS_HPP
