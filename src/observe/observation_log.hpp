#pragma once

#include "faults/fault_error.hpp"

#include <chrono>
#include <cstddef>
#include <exception>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace chaoslab::observe {

using ObservationDetails = std::map<std::string, std::string>;

// `category` recorded for scopes left by a C++ exception.
inline constexpr std::string_view kExceptionCategory = "exception";

// One timestamped record. Observations are immutable once appended; the log
// only ever grows or is cleared in bulk.
struct Observation {
  std::chrono::system_clock::time_point timestamp{};
  std::string target;
  std::string event;
  ObservationDetails details;
};

// Append-only, thread-safe observation sequence.
//
// Record/Snapshot/Clear are mutually exclusive under one mutex, so a snapshot
// is always a consistent prefix of the record order and concurrent writers
// never lose or reorder entries relative to each other.
class ObservationLog {
public:
  ObservationLog() = default;

  ObservationLog(const ObservationLog&) = delete;
  ObservationLog& operator=(const ObservationLog&) = delete;

  void Record(std::string_view target, std::string_view event, ObservationDetails details = {});

  std::vector<Observation> Snapshot() const;

  void Clear();

  std::size_t Size() const;

  // Runs `body` between paired scope events (see ObservationScope).
  //
  // `body` returns either void or std::optional<faults::FaultError>. A returned
  // failure is recorded as the `_error` event and handed back unchanged.
  template <typename Fn>
  std::optional<faults::FaultError> Scoped(std::string_view target, std::string_view event_prefix,
                                           Fn&& body);

private:
  mutable std::mutex mu_;
  std::vector<Observation> observations_;
};

// "start" when the prefix is empty, otherwise "<prefix>_start"; same for the
// `end` and `error` suffixes.
std::string ScopedEventName(std::string_view event_prefix, std::string_view suffix);

// RAII scope guard recording a paired enter/exit.
//
// Construction records the start event. Destruction records exactly one of:
// - the error event, when Fail() was called (details: category, message);
// - the error event with category "exception", when the scope is left by a
//   propagating C++ exception that was thrown after the scope was entered.
//   A bare scope cannot see the exception, so its message is generic;
//   ObservationLog::Scoped records the exception's what() instead;
// - the end event otherwise.
// The guard never catches anything; exceptions keep propagating.
class ObservationScope {
public:
  ObservationScope(ObservationLog& log, std::string target, std::string event_prefix = {});
  ~ObservationScope();

  ObservationScope(const ObservationScope&) = delete;
  ObservationScope& operator=(const ObservationScope&) = delete;

  void Fail(const faults::FaultError& failure);
  void Fail(std::string_view category, std::string_view message);

private:
  ObservationLog& log_;
  std::string target_;
  std::string event_prefix_;
  int uncaught_at_entry_ = 0;
  std::optional<ObservationDetails> failure_details_;
};

template <typename Fn>
std::optional<faults::FaultError> ObservationLog::Scoped(std::string_view target,
                                                         std::string_view event_prefix,
                                                         Fn&& body) {
  ObservationScope scope(*this, std::string(target), std::string(event_prefix));
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn&>>) {
      body();
      return std::nullopt;
    } else {
      std::optional<faults::FaultError> failure = body();
      if (failure.has_value()) {
        scope.Fail(*failure);
      }
      return failure;
    }
  } catch (const std::exception& e) {
    // Capture the text for the `_error` event; the exception itself
    // continues unchanged.
    scope.Fail(kExceptionCategory, e.what());
    throw;
  }
}

} // namespace chaoslab::observe
