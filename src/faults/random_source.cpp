#include "faults/random_source.hpp"

namespace chaoslab::faults {

SeededRandomSource::SeededRandomSource(const std::uint64_t seed) : engine_(seed) {}

SeededRandomSource::SeededRandomSource() : engine_(std::random_device{}()) {}

double SeededRandomSource::NextUnit() {
  return distribution_(engine_);
}

} // namespace chaoslab::faults
