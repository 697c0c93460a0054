#ifndef CHAOSLAB_TESTS_COMMON_SCRIPTED_RANDOM_SOURCE_HPP_
#define CHAOSLAB_TESTS_COMMON_SCRIPTED_RANDOM_SOURCE_HPP_

#include "faults/random_source.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

namespace chaoslab::tests::common {

// Replays a fixed sample sequence, cycling when exhausted, and counts draws
// so tests can assert that the 0/1 probability extremes never sample.
class ScriptedRandomSource final : public faults::IRandomSource {
public:
  ScriptedRandomSource(std::vector<double> samples, std::shared_ptr<std::atomic<std::size_t>> draws)
      : samples_(std::move(samples)), draws_(std::move(draws)) {}

  double NextUnit() override {
    const std::size_t index = draws_->fetch_add(1U);
    if (samples_.empty()) {
      return 0.0;
    }
    return samples_[index % samples_.size()];
  }

private:
  std::vector<double> samples_;
  std::shared_ptr<std::atomic<std::size_t>> draws_;
};

inline std::unique_ptr<faults::IRandomSource> MakeScriptedSource(
    std::vector<double> samples, std::shared_ptr<std::atomic<std::size_t>> draws) {
  return std::make_unique<ScriptedRandomSource>(std::move(samples), std::move(draws));
}

} // namespace chaoslab::tests::common

#endif // CHAOSLAB_TESTS_COMMON_SCRIPTED_RANDOM_SOURCE_HPP_
