/**
 * @file Sampler.cpp
 * @brief Implementation of the budgeted sampling loop.
 */

#include "src/bench/inc/Sampler.hpp"

#include <variant>

namespace brunch {
namespace bench {

namespace {

template <typename... Ts> struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <typename... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

/**
 * @brief Shared loop body. @p stage runs outside the timed window, @p call inside.
 */
template <typename Stage, typename Call>
RawSamples sampleLoop(std::uint32_t target, Duration timeout, Stage&& stage, Call&& call) {
  RawSamples out;
  out.reserve(target);

  const auto LOOP_START = Clock::now();
  while (out.size() < target) {
    stage();

    const auto T0 = Clock::now();
    call();
    const auto T1 = Clock::now();
    out.push_back(elapsedNs(T0, T1));

    if (T1 - LOOP_START > timeout) {
      break;
    }
  }
  return out;
}

} // namespace

RawSamples collectSamples(const BenchmarkSpec& spec) {
  const std::uint32_t TARGET = spec.sampleTarget();
  const Duration TIMEOUT = spec.timeout();

  return std::visit(
      Overloaded{
          [](const std::monostate&) { return RawSamples{}; },
          [&](const ZeroArg& k) {
            return sampleLoop(TARGET, TIMEOUT, [] {}, [&] { k.call(); });
          },
          [&](const SeededClone& k) {
            return sampleLoop(TARGET, TIMEOUT, [&] { k.stage(); }, [&] { k.call(); });
          },
          [&](const SeededFactory& k) {
            return sampleLoop(TARGET, TIMEOUT, [&] { k.stage(); }, [&] { k.call(); });
          },
      },
      spec.callable());
}

} // namespace bench
} // namespace brunch
