#pragma once

#include <cstdint>
#include <random>

namespace chaoslab::faults {

// Uniform sample source behind the probability gate.
//
// Implementations must return values in [0, 1). The injector serializes calls,
// so an implementation only needs to be safe for one caller at a time.
class IRandomSource {
public:
  virtual ~IRandomSource() = default;

  virtual double NextUnit() = 0;
};

// Mersenne-twister source. Equal seeds give equal sample sequences, which is
// what makes `chaoslab run --seed` replays reproducible.
class SeededRandomSource final : public IRandomSource {
public:
  explicit SeededRandomSource(std::uint64_t seed);

  // Seeds from std::random_device for non-reproducible runs.
  SeededRandomSource();

  double NextUnit() override;

private:
  std::mt19937_64 engine_;
  std::uniform_real_distribution<double> distribution_{0.0, 1.0};
};

} // namespace chaoslab::faults
