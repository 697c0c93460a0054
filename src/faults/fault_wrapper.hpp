#pragma once

#include "faults/fault_injector.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace chaoslab::faults {

// Result of one wrapped invocation. `value` is set only when the body ran;
// `failure` is set only when a bound spec fired a simulated failure, in which
// case the body was skipped.
template <typename R>
struct CallResult {
  std::optional<R> value;
  std::optional<FaultError> failure;
};

template <>
struct CallResult<void> {
  bool ran = false;
  std::optional<FaultError> failure;
};

// Binds an ordered list of fault specs to call sites.
//
// Specs and the injector are fixed at construction; every invocation
// re-evaluates each spec in order before the body. The first simulated
// failure stops evaluation and the body never executes.
class FaultWrapper {
public:
  explicit FaultWrapper(FaultSpec spec)
      : FaultWrapper(std::vector<FaultSpec>{std::move(spec)}) {}

  explicit FaultWrapper(std::vector<FaultSpec> specs)
      : specs_(std::move(specs)), injector_(std::make_unique<FaultInjector>()) {}

  FaultWrapper(std::vector<FaultSpec> specs, std::uint64_t seed)
      : specs_(std::move(specs)), injector_(std::make_unique<FaultInjector>(seed)) {}

  FaultWrapper(std::vector<FaultSpec> specs, std::unique_ptr<IRandomSource> source)
      : specs_(std::move(specs)),
        injector_(std::make_unique<FaultInjector>(std::move(source))) {}

  const std::vector<FaultSpec>& specs() const {
    return specs_;
  }

  // Evaluates the bound specs only.
  //
  // Contract:
  // - false: a spec is misconfigured for its kind; `error` says which.
  // - true: `failure` holds the first simulated failure, or is empty.
  bool InjectAll(std::optional<FaultError>& failure, std::string& error) {
    failure.reset();
    for (std::size_t i = 0; i < specs_.size(); ++i) {
      InjectionOutcome outcome;
      if (!injector_->Inject(specs_[i], outcome, error)) {
        error = "fault spec #" + std::to_string(i) + ": " + error;
        return false;
      }
      if (outcome.failure.has_value()) {
        failure = std::move(outcome.failure);
        return true;
      }
    }
    return true;
  }

  template <typename Fn, typename... Args>
  bool Invoke(CallResult<std::invoke_result_t<Fn&, Args...>>& result, std::string& error,
              Fn& body, Args&&... args) {
    using R = std::invoke_result_t<Fn&, Args...>;
    result = CallResult<R>{};
    if (!InjectAll(result.failure, error)) {
      return false;
    }
    if (result.failure.has_value()) {
      return true;
    }

    if constexpr (std::is_void_v<R>) {
      std::invoke(body, std::forward<Args>(args)...);
      result.ran = true;
    } else {
      result.value.emplace(std::invoke(body, std::forward<Args>(args)...));
    }
    return true;
  }

private:
  std::vector<FaultSpec> specs_;
  std::unique_ptr<FaultInjector> injector_;
};

// A callable with its fault wrapper attached, so call sites keep the
// original argument list:
//
//   auto fetch = Bind(FaultWrapper(specs), [](int id) { return Lookup(id); });
//   CallResult<Row> row;
//   if (!fetch(row, error, 42)) { ... misconfigured spec ... }
template <typename Fn>
class WrappedCallable {
public:
  WrappedCallable(FaultWrapper wrapper, Fn fn)
      : wrapper_(std::move(wrapper)), fn_(std::move(fn)) {}

  template <typename... Args>
  bool operator()(CallResult<std::invoke_result_t<Fn&, Args...>>& result, std::string& error,
                  Args&&... args) {
    return wrapper_.Invoke(result, error, fn_, std::forward<Args>(args)...);
  }

  const FaultWrapper& wrapper() const {
    return wrapper_;
  }

private:
  FaultWrapper wrapper_;
  Fn fn_;
};

template <typename Fn>
WrappedCallable<std::decay_t<Fn>> Bind(FaultWrapper wrapper, Fn&& fn) {
  return WrappedCallable<std::decay_t<Fn>>(std::move(wrapper), std::forward<Fn>(fn));
}

// Single-spec wrapper with the classic chaos-monkey defaults: 10% chance,
// 500 ms latency, error 500 "Chaos monkey error". Every field is filled so the
// wrapper is usable whatever `kind` is chosen.
struct ChaosMonkeyOptions {
  FaultKind kind = FaultKind::kLatency;
  double probability = 0.1;
  std::uint64_t duration_ms = 500;
  int error_code = 500;
  std::string error_message = "Chaos monkey error";
  std::vector<std::string> affected_targets;
};

inline FaultWrapper MakeChaosMonkey(const ChaosMonkeyOptions& options) {
  FaultSpec spec;
  spec.kind = options.kind;
  spec.probability = options.probability;
  spec.duration_ms = options.duration_ms;
  spec.error_code = options.error_code;
  spec.error_message = options.error_message;
  spec.affected_targets = options.affected_targets;
  return FaultWrapper(std::move(spec));
}

} // namespace chaoslab::faults
