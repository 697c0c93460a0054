#include "../common/scripted_random_source.hpp"
#include "faults/fault_injector.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace {

using chaoslab::faults::FaultCategory;
using chaoslab::faults::FaultInjector;
using chaoslab::faults::FaultKind;
using chaoslab::faults::FaultSpec;
using chaoslab::faults::InjectionOutcome;

FaultSpec MakeSpec(FaultKind kind, double probability) {
  FaultSpec spec;
  spec.kind = kind;
  spec.probability = probability;
  return spec;
}

} // namespace

TEST_CASE("Probability extremes never consume a sample", "[faults][injector]") {
  auto draws = std::make_shared<std::atomic<std::size_t>>(0U);
  FaultInjector injector(chaoslab::tests::common::MakeScriptedSource({0.0}, draws));

  for (int i = 0; i < 100; ++i) {
    REQUIRE_FALSE(injector.ShouldFire(0.0));
    REQUIRE_FALSE(injector.ShouldFire(-0.5));
    REQUIRE(injector.ShouldFire(1.0));
    REQUIRE(injector.ShouldFire(1.5));
  }
  REQUIRE(draws->load() == 0U);
}

TEST_CASE("Intermediate probability fires when the sample is below it", "[faults][injector]") {
  auto draws = std::make_shared<std::atomic<std::size_t>>(0U);
  FaultInjector injector(chaoslab::tests::common::MakeScriptedSource({0.1, 0.5, 0.9}, draws));

  REQUIRE(injector.ShouldFire(0.5));
  REQUIRE_FALSE(injector.ShouldFire(0.5));
  REQUIRE_FALSE(injector.ShouldFire(0.5));
  REQUIRE(draws->load() == 3U);
}

TEST_CASE("Equal seeds produce equal firing sequences", "[faults][injector]") {
  FaultInjector first(42U);
  FaultInjector second(42U);

  std::vector<bool> first_sequence;
  std::vector<bool> second_sequence;
  for (int i = 0; i < 200; ++i) {
    first_sequence.push_back(first.ShouldFire(0.3));
    second_sequence.push_back(second.ShouldFire(0.3));
  }
  REQUIRE(first_sequence == second_sequence);
}

TEST_CASE("Error fault renders code and message", "[faults][injector]") {
  FaultInjector injector(1U);
  FaultSpec spec = MakeSpec(FaultKind::kError, 1.0);
  spec.error_code = 503;
  spec.error_message = "upstream unavailable";

  InjectionOutcome outcome;
  std::string error;
  REQUIRE(injector.Inject(spec, outcome, error));
  REQUIRE(outcome.fired);
  REQUIRE(outcome.failure.has_value());
  REQUIRE(outcome.failure->category == FaultCategory::kApplication);
  REQUIRE(outcome.failure->code == 503);
  REQUIRE(outcome.failure->message == "[503] upstream unavailable");
  REQUIRE(outcome.failure->IsA(FaultCategory::kRuntime));
}

TEST_CASE("Error fault falls back to the default message", "[faults][injector]") {
  FaultInjector injector(1U);
  FaultSpec spec = MakeSpec(FaultKind::kError, 1.0);
  spec.error_code = 500;

  InjectionOutcome outcome;
  std::string error;
  REQUIRE(injector.Inject(spec, outcome, error));
  REQUIRE(outcome.failure->message == "[500] Injected error");

  spec.error_message = "";
  REQUIRE(injector.Inject(spec, outcome, error));
  REQUIRE(outcome.failure->message == "[500] Injected error");
}

TEST_CASE("Timeout fault narrows the timeout category", "[faults][injector]") {
  FaultInjector injector(1U);
  InjectionOutcome outcome;
  std::string error;
  REQUIRE(injector.Inject(MakeSpec(FaultKind::kTimeout, 1.0), outcome, error));

  REQUIRE(outcome.failure.has_value());
  REQUIRE(outcome.failure->category == FaultCategory::kChaosTimeout);
  REQUIRE(outcome.failure->IsA(FaultCategory::kTimeout));
  REQUIRE_FALSE(outcome.failure->IsA(FaultCategory::kRuntime));
  REQUIRE(outcome.failure->message == "Simulated timeout injected by chaos framework.");
}

TEST_CASE("Prefixed failure kinds use their tag and default message", "[faults][injector]") {
  FaultInjector injector(1U);
  InjectionOutcome outcome;
  std::string error;

  REQUIRE(injector.Inject(MakeSpec(FaultKind::kPartialFailure, 1.0), outcome, error));
  REQUIRE(outcome.failure->message == "[partial_failure] Partial failure");
  REQUIRE(outcome.failure->IsA(FaultCategory::kRuntime));

  REQUIRE(injector.Inject(MakeSpec(FaultKind::kResourceExhaustion, 1.0), outcome, error));
  REQUIRE(outcome.failure->message == "[resource_exhaustion] Resource exhausted");
  REQUIRE(outcome.failure->category == FaultCategory::kResourceExhausted);
  REQUIRE(outcome.failure->IsA(FaultCategory::kRuntime));

  FaultSpec corrupt = MakeSpec(FaultKind::kDataCorruption, 1.0);
  corrupt.error_message = "checksum mismatch";
  REQUIRE(injector.Inject(corrupt, outcome, error));
  REQUIRE(outcome.failure->message == "[data_corruption] checksum mismatch");
  REQUIRE(outcome.failure->IsA(FaultCategory::kInvalidValue));
  REQUIRE_FALSE(outcome.failure->IsA(FaultCategory::kRuntime));
}

TEST_CASE("Latency fault blocks and produces no failure", "[faults][injector]") {
  FaultInjector injector(1U);
  FaultSpec spec = MakeSpec(FaultKind::kLatency, 1.0);
  spec.duration_ms = 30U;

  InjectionOutcome outcome;
  std::string error;
  const auto begin = std::chrono::steady_clock::now();
  REQUIRE(injector.Inject(spec, outcome, error));
  const auto elapsed = std::chrono::steady_clock::now() - begin;

  REQUIRE(outcome.fired);
  REQUIRE_FALSE(outcome.failure.has_value());
  REQUIRE(elapsed >= std::chrono::milliseconds(30));
}

TEST_CASE("Missing required fields fail regardless of probability", "[faults][injector]") {
  auto draws = std::make_shared<std::atomic<std::size_t>>(0U);
  FaultInjector injector(chaoslab::tests::common::MakeScriptedSource({0.99}, draws));

  for (const double probability : {0.0, 0.01, 0.5, 1.0}) {
    InjectionOutcome outcome;
    std::string error;
    REQUIRE_FALSE(injector.Inject(MakeSpec(FaultKind::kLatency, probability), outcome, error));
    REQUIRE(error.find("duration_ms") != std::string::npos);
    REQUIRE_FALSE(outcome.fired);

    REQUIRE_FALSE(injector.Inject(MakeSpec(FaultKind::kError, probability), outcome, error));
    REQUIRE(error.find("error_code") != std::string::npos);
  }
  REQUIRE(draws->load() == 0U);
}

TEST_CASE("A gate that does not fire leaves the outcome empty", "[faults][injector]") {
  FaultInjector injector(7U);
  FaultSpec spec = MakeSpec(FaultKind::kError, 0.0);
  spec.error_code = 500;

  InjectionOutcome outcome;
  std::string error;
  REQUIRE(injector.Inject(spec, outcome, error));
  REQUIRE_FALSE(outcome.fired);
  REQUIRE_FALSE(outcome.failure.has_value());
}
