#pragma once

#include "faults/fault_error.hpp"
#include "faults/fault_model.hpp"
#include "faults/random_source.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace chaoslab::faults {

inline constexpr std::string_view kDefaultErrorMessage = "Injected error";
inline constexpr std::string_view kDefaultPartialFailureMessage = "Partial failure";
inline constexpr std::string_view kDefaultResourceExhaustionMessage = "Resource exhausted";
inline constexpr std::string_view kDefaultDataCorruptionMessage = "Data corrupted";
inline constexpr std::string_view kTimeoutMessage =
    "Simulated timeout injected by chaos framework.";

// What one Inject() call did.
//
// - fired=false: the probability gate said no; nothing happened.
// - fired=true, failure empty: a side-effect-only fault ran (latency).
// - fired=true, failure set: the simulated failure for the caller to surface.
struct InjectionOutcome {
  bool fired = false;
  std::optional<FaultError> failure;
};

// Applies one FaultSpec at a time.
//
// The probability gate is evaluated once per Inject() call, so a spec yields
// at most one effect per invocation. Fired failures are returned to the caller
// and never swallowed here. The injector may be shared across threads; sample
// draws are serialized by `mu_`, the effects themselves run unlocked.
class FaultInjector {
public:
  // Non-reproducible source seeded from std::random_device.
  FaultInjector();
  explicit FaultInjector(std::uint64_t seed);
  explicit FaultInjector(std::unique_ptr<IRandomSource> source);

  FaultInjector(const FaultInjector&) = delete;
  FaultInjector& operator=(const FaultInjector&) = delete;

  // 0 never fires and 1 always fires; neither consumes a sample.
  bool ShouldFire(double probability);

  void FireLatency(std::uint64_t duration_ms) const;
  FaultError FireError(int code, std::string_view message) const;
  FaultError FireTimeout() const;
  FaultError FirePartialFailure(std::string_view message = kDefaultPartialFailureMessage) const;
  FaultError FireResourceExhaustion(
      std::string_view message = kDefaultResourceExhaustionMessage) const;
  FaultError FireDataCorruption(std::string_view message = kDefaultDataCorruptionMessage) const;

  // Contract:
  // - false: `spec` is missing a field its kind requires (configuration
  //   error, independent of probability); `error` names the field and
  //   `outcome` is reset.
  // - true: `outcome` describes what happened.
  bool Inject(const FaultSpec& spec, InjectionOutcome& outcome, std::string& error);

private:
  std::mutex mu_;
  std::unique_ptr<IRandomSource> source_;
};

} // namespace chaoslab::faults
