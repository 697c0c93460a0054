#include "observe/observation_log.hpp"

namespace chaoslab::observe {

void ObservationLog::Record(std::string_view target, std::string_view event,
                            ObservationDetails details) {
  Observation observation;
  observation.target = std::string(target);
  observation.event = std::string(event);
  observation.details = std::move(details);

  std::lock_guard<std::mutex> lock(mu_);
  // Stamp under the lock so timestamps are monotonic in record order.
  observation.timestamp = std::chrono::system_clock::now();
  observations_.push_back(std::move(observation));
}

std::vector<Observation> ObservationLog::Snapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  return observations_;
}

void ObservationLog::Clear() {
  std::lock_guard<std::mutex> lock(mu_);
  observations_.clear();
}

std::size_t ObservationLog::Size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return observations_.size();
}

std::string ScopedEventName(std::string_view event_prefix, std::string_view suffix) {
  if (event_prefix.empty()) {
    return std::string(suffix);
  }
  return std::string(event_prefix) + "_" + std::string(suffix);
}

ObservationScope::ObservationScope(ObservationLog& log, std::string target,
                                   std::string event_prefix)
    : log_(log),
      target_(std::move(target)),
      event_prefix_(std::move(event_prefix)),
      uncaught_at_entry_(std::uncaught_exceptions()) {
  log_.Record(target_, ScopedEventName(event_prefix_, "start"));
}

ObservationScope::~ObservationScope() {
  if (failure_details_.has_value()) {
    log_.Record(target_, ScopedEventName(event_prefix_, "error"), std::move(*failure_details_));
    return;
  }
  if (std::uncaught_exceptions() > uncaught_at_entry_) {
    log_.Record(target_, ScopedEventName(event_prefix_, "error"),
                {{"category", std::string(kExceptionCategory)},
                 {"message", "scope exited by exception"}});
    return;
  }
  log_.Record(target_, ScopedEventName(event_prefix_, "end"));
}

void ObservationScope::Fail(const faults::FaultError& failure) {
  Fail(faults::ToString(failure.category), failure.message);
}

void ObservationScope::Fail(std::string_view category, std::string_view message) {
  failure_details_ = ObservationDetails{
      {"category", std::string(category)},
      {"message", std::string(message)},
  };
}

} // namespace chaoslab::observe
