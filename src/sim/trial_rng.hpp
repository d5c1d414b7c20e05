#pragma once

#include <cstdint>

namespace glancelab::sim {

// Seeded SplitMix64 sequence.
//
// Every value is derived with 64-bit integer arithmetic, so a given seed
// yields the same stream on every platform and standard library. Draw order
// is part of the simulator's contract; callers must not share one stream
// between concurrently simulated trials.
class TrialRng {
public:
  explicit TrialRng(std::uint64_t seed) : state_(seed) {}

  std::uint64_t NextU64() {
    state_ += kIncrement;
    std::uint64_t z = state_;
    z = (z ^ (z >> 30U)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27U)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31U);
  }

  // Uniform in [0, 1) with 53 bits of precision.
  double NextUnit() {
    return static_cast<double>(NextU64() >> 11U) * 0x1.0p-53;
  }

  // Uniform in [low, high).
  double Uniform(double low, double high) {
    return low + (high - low) * NextUnit();
  }

  bool Bernoulli(double probability) {
    return NextUnit() < probability;
  }

  std::uint64_t State() const {
    return state_;
  }

private:
  static constexpr std::uint64_t kIncrement = 0x9e3779b97f4a7c15ULL;

  std::uint64_t state_ = 0;
};

} // namespace glancelab::sim
