#include "observe/observation_log.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using chaoslab::faults::FaultCategory;
using chaoslab::faults::FaultError;
using chaoslab::observe::Observation;
using chaoslab::observe::ObservationLog;
using chaoslab::observe::ObservationScope;

namespace {

std::vector<std::string> Events(const std::vector<Observation>& observations) {
  std::vector<std::string> events;
  for (const auto& observation : observations) {
    events.push_back(observation.event);
  }
  return events;
}

} // namespace

TEST_CASE("Record appends in order with details", "[observe][log]") {
  ObservationLog log;
  log.Record("db", "query_started");
  log.Record("db", "query_failed", {{"code", "503"}});

  const std::vector<Observation> snapshot = log.Snapshot();
  REQUIRE(snapshot.size() == 2U);
  REQUIRE(snapshot[0].target == "db");
  REQUIRE(snapshot[0].event == "query_started");
  REQUIRE(snapshot[0].details.empty());
  REQUIRE(snapshot[1].details.at("code") == "503");
  REQUIRE(snapshot[0].timestamp <= snapshot[1].timestamp);
}

TEST_CASE("Snapshot is independent of later records and Clear", "[observe][log]") {
  ObservationLog log;
  log.Record("svc", "one");
  const std::vector<Observation> before = log.Snapshot();

  log.Record("svc", "two");
  log.Clear();

  REQUIRE(before.size() == 1U);
  REQUIRE(log.Size() == 0U);
  REQUIRE(log.Snapshot().empty());
}

TEST_CASE("Concurrent writers lose no observations", "[observe][log][concurrency]") {
  constexpr int kThreads = 8;
  constexpr int kPerThread = 500;
  ObservationLog log;

  std::vector<std::thread> writers;
  for (int t = 0; t < kThreads; ++t) {
    writers.emplace_back([&log, t]() {
      for (int i = 0; i < kPerThread; ++i) {
        log.Record("writer-" + std::to_string(t), "tick", {{"i", std::to_string(i)}});
      }
    });
  }
  for (auto& writer : writers) {
    writer.join();
  }

  const std::vector<Observation> snapshot = log.Snapshot();
  REQUIRE(snapshot.size() == static_cast<std::size_t>(kThreads * kPerThread));

  std::set<std::string> seen;
  for (const auto& observation : snapshot) {
    seen.insert(observation.target + "/" + observation.details.at("i"));
  }
  REQUIRE(seen.size() == snapshot.size());

  for (std::size_t i = 1; i < snapshot.size(); ++i) {
    REQUIRE(snapshot[i - 1].timestamp <= snapshot[i].timestamp);
  }
}

TEST_CASE("Snapshot and Clear stay consistent while writers record",
          "[observe][log][concurrency]") {
  constexpr int kThreads = 4;
  constexpr int kPerThread = 2'000;
  ObservationLog log;

  std::atomic<int> writers_done{0};
  std::vector<std::thread> writers;
  for (int t = 0; t < kThreads; ++t) {
    writers.emplace_back([&log, &writers_done, t]() {
      for (int i = 0; i < kPerThread; ++i) {
        log.Record("writer-" + std::to_string(t), "tick", {{"i", std::to_string(i)}});
      }
      writers_done.fetch_add(1);
    });
  }

  // Assertions are collected here and checked after join; Catch2 macros are
  // not used off the main thread.
  bool per_writer_ordered = true;
  bool timestamps_monotonic = true;
  int snapshots_taken = 0;
  std::thread reader([&]() {
    int round = 0;
    while (writers_done.load() < kThreads) {
      const std::vector<Observation> snapshot = log.Snapshot();
      ++snapshots_taken;

      std::map<std::string, int> last_index;
      for (std::size_t k = 0; k < snapshot.size(); ++k) {
        if (k > 0U && snapshot[k].timestamp < snapshot[k - 1U].timestamp) {
          timestamps_monotonic = false;
        }
        const int index = std::stoi(snapshot[k].details.at("i"));
        const auto it = last_index.find(snapshot[k].target);
        if (it != last_index.end() && index <= it->second) {
          per_writer_ordered = false;
        }
        last_index[snapshot[k].target] = index;
      }

      if (++round % 4 == 0) {
        log.Clear();
      }
    }
  });

  for (auto& writer : writers) {
    writer.join();
  }
  reader.join();

  REQUIRE(snapshots_taken > 0);
  REQUIRE(per_writer_ordered);
  REQUIRE(timestamps_monotonic);
  REQUIRE(log.Size() <= static_cast<std::size_t>(kThreads * kPerThread));
}

TEST_CASE("Scoped body records start and end", "[observe][scope]") {
  ObservationLog log;
  bool ran = false;
  const std::optional<FaultError> failure = log.Scoped("cache", "", [&ran]() { ran = true; });

  REQUIRE(ran);
  REQUIRE_FALSE(failure.has_value());
  REQUIRE(Events(log.Snapshot()) == std::vector<std::string>{"start", "end"});
}

TEST_CASE("Scoped failure is recorded and returned unchanged", "[observe][scope]") {
  ObservationLog log;
  const FaultError injected{
      .category = FaultCategory::kPartialFailure,
      .code = std::nullopt,
      .message = "[partial_failure] degraded",
  };

  const std::optional<FaultError> failure =
      log.Scoped("payments", "charge", [&injected]() -> std::optional<FaultError> {
        return injected;
      });

  REQUIRE(failure.has_value());
  REQUIRE(failure->category == FaultCategory::kPartialFailure);
  REQUIRE(failure->message == injected.message);

  const std::vector<Observation> snapshot = log.Snapshot();
  REQUIRE(Events(snapshot) == std::vector<std::string>{"charge_start", "charge_error"});
  REQUIRE(snapshot[1].target == "payments");
  REQUIRE(snapshot[1].details.at("category") == "partial_failure");
  REQUIRE(snapshot[1].details.at("message") == "[partial_failure] degraded");
}

TEST_CASE("Scope records an error when an exception unwinds through it", "[observe][scope]") {
  ObservationLog log;
  auto failing_job = [&log]() {
    ObservationScope scope(log, "worker", "job");
    throw std::runtime_error("boom");
  };
  REQUIRE_THROWS_AS(failing_job(), std::runtime_error);

  const std::vector<Observation> snapshot = log.Snapshot();
  REQUIRE(Events(snapshot) == std::vector<std::string>{"job_start", "job_error"});
  REQUIRE(snapshot[1].details.at("category") == "exception");
  REQUIRE(snapshot[1].details.at("message") == "scope exited by exception");
}

TEST_CASE("Scoped records the thrown exception's message and rethrows it",
          "[observe][scope]") {
  ObservationLog log;
  bool rethrown = false;
  try {
    log.Scoped("worker", "job", []() { throw std::runtime_error("disk on fire"); });
  } catch (const std::runtime_error& e) {
    rethrown = std::string(e.what()) == "disk on fire";
  }
  REQUIRE(rethrown);

  const std::vector<Observation> snapshot = log.Snapshot();
  REQUIRE(Events(snapshot) == std::vector<std::string>{"job_start", "job_error"});
  REQUIRE(snapshot[1].target == "worker");
  REQUIRE(snapshot[1].details.at("category") == "exception");
  REQUIRE(snapshot[1].details.at("message") == "disk on fire");
}

TEST_CASE("Scope created during unwinding still records a normal end", "[observe][scope]") {
  ObservationLog log;
  struct Cleanup {
    ObservationLog* log;
    ~Cleanup() {
      ObservationScope scope(*log, "cleanup");
    }
  };

  bool caught = false;
  try {
    Cleanup cleanup{&log};
    throw std::runtime_error("outer");
  } catch (const std::runtime_error&) {
    caught = true;
  }

  REQUIRE(caught);
  REQUIRE(Events(log.Snapshot()) == std::vector<std::string>{"start", "end"});
}
