#ifndef BRUNCH_BENCHERROR_HPP
#define BRUNCH_BENCHERROR_HPP
/**
 * @file BenchError.hpp
 * @brief Error taxonomy: construction-time configuration errors and per-entry failures.
 */

#include <stdexcept>

namespace brunch {
namespace bench {

/**
 * @brief Invalid benchmark definition (name too long or empty, zero samples, bad timeout).
 *
 * Thrown by the Bench builder at the offending call, before anything runs.
 */
class ConfigurationError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

/** @brief Why a measured entry produced no statistics. */
enum class EntryFailure {
  NoSamples, ///< The sampler returned without a single completed call
  Threw      ///< The benchmark callable raised an exception
};

/** @brief Short operator-facing description of a failure kind. */
inline const char* toString(EntryFailure f) noexcept {
  switch (f) {
  case EntryFailure::NoSamples:
    return "no samples collected";
  case EntryFailure::Threw:
    return "benchmark threw";
  }
  return "unknown failure";
}

} // namespace bench
} // namespace brunch

#endif // BRUNCH_BENCHERROR_HPP
