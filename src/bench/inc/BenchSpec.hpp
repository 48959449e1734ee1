#ifndef BRUNCH_BENCHSPEC_HPP
#define BRUNCH_BENCHSPEC_HPP
/**
 * @file BenchSpec.hpp
 * @brief Immutable benchmark definitions and the builder that produces them.
 *
 * Typical usage:
 * @code{.cpp}
 *   using namespace std::chrono_literals;
 *   namespace bb = brunch::bench;
 *
 *   bb::BenchmarkSpec add = bb::Bench("add(2,2)").withSamples(100).withTimeout(1s).run(
 *       [] { return 2 + 2; });
 *
 *   bb::BenchmarkSpec sort = bb::Bench("std::sort(1k)").runSeeded(
 *       makeShuffled(1000), [](std::vector<int> v) {
 *         std::sort(v.begin(), v.end());
 *         return v[0];
 *       });
 *
 *   bb::BenchmarkSpec gap = bb::Bench::spacer();
 * @endcode
 */

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "src/bench/inc/BenchConfig.hpp"
#include "src/bench/inc/BenchError.hpp"
#include "src/bench/inc/BenchUtils.hpp"

namespace brunch {
namespace bench {

/* ---------------------------- Callable Kinds ---------------------------- */

/** @brief Callable that takes no input. */
struct ZeroArg {
  std::function<void()> call; ///< Timed
};

/**
 * @brief Callable fed a fresh copy of a stored seed on every iteration.
 *
 * `stage` copies the seed into a private slot (untimed); `call` moves it into the
 * user callable (timed).
 */
struct SeededClone {
  std::function<void()> stage;
  std::function<void()> call;
};

/** @brief Callable fed the output of a factory invoked once per iteration (untimed). */
struct SeededFactory {
  std::function<void()> stage;
  std::function<void()> call;
};

/** @brief Closed set of callable shapes; std::monostate marks a spacer. */
using CallableKind = std::variant<std::monostate, ZeroArg, SeededClone, SeededFactory>;

/* ----------------------------- BenchmarkSpec ----------------------------- */

/**
 * @brief One suite entry: a named, budgeted callable or a spacer.
 *
 * Only the Bench builder constructs these, so every instance satisfies the
 * configuration invariants (normalized non-empty name, samples >= 1, timeout > 0).
 */
class BenchmarkSpec {
public:
  [[nodiscard]] const std::string& name() const noexcept { return name_; }
  [[nodiscard]] std::uint32_t sampleTarget() const noexcept { return samples_; }
  [[nodiscard]] Duration timeout() const noexcept { return timeout_; }
  [[nodiscard]] bool isSpacer() const noexcept {
    return std::holds_alternative<std::monostate>(callable_);
  }
  [[nodiscard]] const CallableKind& callable() const noexcept { return callable_; }

private:
  friend class Bench;

  BenchmarkSpec(std::string name, std::uint32_t samples, Duration timeout, CallableKind callable)
      : name_(std::move(name)), samples_(samples), timeout_(timeout),
        callable_(std::move(callable)) {}

  std::string name_;
  std::uint32_t samples_;
  Duration timeout_;
  CallableKind callable_;
};

/* --------------------------------- API --------------------------------- */

/**
 * @brief Collapse internal whitespace runs to single spaces and trim the ends.
 * @note NOT RT-safe (heap allocation).
 */
std::string collapseWhitespace(std::string_view raw);

/**
 * @brief Normalize a benchmark name and validate it.
 * @throws ConfigurationError if the result is empty or longer than MAX_NAME_BYTES.
 */
std::string normalizeName(std::string_view raw);

/* --------------------------------- Bench --------------------------------- */

/**
 * @brief Fluent builder for BenchmarkSpec.
 *
 * Start with the name, optionally adjust the budget, then finish with one of the
 * runners: run(), runSeeded() or runSeededWith(). Each setter validates immediately.
 */
class Bench {
public:
  /** @throws ConfigurationError on an empty or over-long name. */
  explicit Bench(std::string_view name) : name_(normalizeName(name)) {}

  /** @brief A layout break in the report; carries no callable and is never measured. */
  static BenchmarkSpec spacer() {
    return BenchmarkSpec(std::string{}, DEFAULT_SAMPLES, DEFAULT_TIMEOUT, std::monostate{});
  }

  /**
   * @brief Override the sample target (default 2500).
   * @throws ConfigurationError if @p samples is zero.
   */
  Bench& withSamples(std::uint32_t samples) {
    if (samples == 0) {
      throw ConfigurationError("benchmark \"" + name_ + "\": sample target must be at least 1");
    }
    samples_ = samples;
    return *this;
  }

  /**
   * @brief Override the time budget (default 10s).
   * @throws ConfigurationError if @p timeout is not positive.
   */
  Bench& withTimeout(Duration timeout) {
    if (timeout <= Duration::zero()) {
      throw ConfigurationError("benchmark \"" + name_ + "\": timeout must be positive");
    }
    timeout_ = timeout;
    return *this;
  }

  /** @brief Time `fn()` directly. */
  template <typename Fn> [[nodiscard]] BenchmarkSpec run(Fn fn) const {
    auto body = std::make_shared<Fn>(std::move(fn));
    return finish(ZeroArg{[body] { invokeOpaque(*body); }});
  }

  /**
   * @brief Time `fn(copy-of-seed)`; the copy is made before the clock starts.
   *
   * Mutation of the argument inside @p fn never leaks into the next iteration.
   */
  template <typename T, typename Fn> [[nodiscard]] BenchmarkSpec runSeeded(T seed, Fn fn) const {
    auto origin = std::make_shared<const T>(std::move(seed));
    auto slot = std::make_shared<std::optional<T>>();
    auto body = std::make_shared<Fn>(std::move(fn));
    return finish(SeededClone{[origin, slot] { slot->emplace(*origin); },
                              [slot, body] { invokeOpaque(*body, std::move(**slot)); }});
  }

  /** @brief Time `fn(factory())`; the factory runs before the clock starts. */
  template <typename Factory, typename Fn>
  [[nodiscard]] BenchmarkSpec runSeededWith(Factory factory, Fn fn) const {
    using Input = std::decay_t<std::invoke_result_t<Factory&>>;
    auto make = std::make_shared<Factory>(std::move(factory));
    auto slot = std::make_shared<std::optional<Input>>();
    auto body = std::make_shared<Fn>(std::move(fn));
    return finish(SeededFactory{[make, slot] { slot->emplace(std::invoke(*make)); },
                                [slot, body] { invokeOpaque(*body, std::move(**slot)); }});
  }

  [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
  BenchmarkSpec finish(CallableKind callable) const {
    return BenchmarkSpec(name_, samples_, timeout_, std::move(callable));
  }

  std::string name_;
  std::uint32_t samples_ = DEFAULT_SAMPLES;
  Duration timeout_ = DEFAULT_TIMEOUT;
};

} // namespace bench
} // namespace brunch

#endif // BRUNCH_BENCHSPEC_HPP
