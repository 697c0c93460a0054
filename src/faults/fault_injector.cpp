#include "faults/fault_injector.hpp"

#include <chrono>
#include <thread>
#include <utility>

namespace chaoslab::faults {

namespace {

std::string_view MessageOr(const std::optional<std::string>& message, std::string_view fallback) {
  if (message.has_value() && !message->empty()) {
    return *message;
  }
  return fallback;
}

} // namespace

FaultInjector::FaultInjector() : source_(std::make_unique<SeededRandomSource>()) {}

FaultInjector::FaultInjector(const std::uint64_t seed)
    : source_(std::make_unique<SeededRandomSource>(seed)) {}

FaultInjector::FaultInjector(std::unique_ptr<IRandomSource> source) : source_(std::move(source)) {
  if (source_ == nullptr) {
    source_ = std::make_unique<SeededRandomSource>();
  }
}

bool FaultInjector::ShouldFire(const double probability) {
  // Extremes bypass sampling so 0 and 1 are deterministic regardless of the
  // source, and so they do not shift a seeded sequence.
  if (probability <= 0.0) {
    return false;
  }
  if (probability >= 1.0) {
    return true;
  }

  std::lock_guard<std::mutex> lock(mu_);
  return source_->NextUnit() < probability;
}

void FaultInjector::FireLatency(const std::uint64_t duration_ms) const {
  std::this_thread::sleep_for(std::chrono::milliseconds(duration_ms));
}

FaultError FaultInjector::FireError(const int code, std::string_view message) const {
  return FaultError{
      .category = FaultCategory::kApplication,
      .code = code,
      .message = "[" + std::to_string(code) + "] " + std::string(message),
  };
}

FaultError FaultInjector::FireTimeout() const {
  return FaultError{
      .category = FaultCategory::kChaosTimeout,
      .code = std::nullopt,
      .message = std::string(kTimeoutMessage),
  };
}

FaultError FaultInjector::FirePartialFailure(std::string_view message) const {
  return FaultError{
      .category = FaultCategory::kPartialFailure,
      .code = std::nullopt,
      .message = "[partial_failure] " + std::string(message),
  };
}

FaultError FaultInjector::FireResourceExhaustion(std::string_view message) const {
  return FaultError{
      .category = FaultCategory::kResourceExhausted,
      .code = std::nullopt,
      .message = "[resource_exhaustion] " + std::string(message),
  };
}

FaultError FaultInjector::FireDataCorruption(std::string_view message) const {
  return FaultError{
      .category = FaultCategory::kDataCorruption,
      .code = std::nullopt,
      .message = "[data_corruption] " + std::string(message),
  };
}

bool FaultInjector::Inject(const FaultSpec& spec, InjectionOutcome& outcome, std::string& error) {
  outcome = InjectionOutcome{};

  // Required fields are checked before the gate: a misconfigured spec must
  // fail every time, not only on the calls where the dice say "fire".
  if (!ValidateForDispatch(spec, error)) {
    return false;
  }

  if (!ShouldFire(spec.probability)) {
    return true;
  }
  outcome.fired = true;

  switch (spec.kind) {
  case FaultKind::kLatency:
    FireLatency(spec.duration_ms.value());
    break;
  case FaultKind::kError:
    outcome.failure =
        FireError(spec.error_code.value(), MessageOr(spec.error_message, kDefaultErrorMessage));
    break;
  case FaultKind::kTimeout:
    outcome.failure = FireTimeout();
    break;
  case FaultKind::kPartialFailure:
    outcome.failure =
        FirePartialFailure(MessageOr(spec.error_message, kDefaultPartialFailureMessage));
    break;
  case FaultKind::kResourceExhaustion:
    outcome.failure = FireResourceExhaustion(
        MessageOr(spec.error_message, kDefaultResourceExhaustionMessage));
    break;
  case FaultKind::kDataCorruption:
    outcome.failure =
        FireDataCorruption(MessageOr(spec.error_message, kDefaultDataCorruptionMessage));
    break;
  }

  return true;
}

} // namespace chaoslab::faults
