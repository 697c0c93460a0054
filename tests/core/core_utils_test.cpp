#include "core/json_dom.hpp"
#include "core/json_utils.hpp"
#include "core/logging/logger.hpp"
#include "core/time_utils.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <limits>
#include <sstream>
#include <string>

TEST_CASE("UTC timestamps carry millisecond precision", "[core][time]") {
  const auto ts = std::chrono::system_clock::time_point(std::chrono::milliseconds(1'700'000'000'042));
  REQUIRE(chaoslab::core::FormatUtcTimestamp(ts) == "2023-11-14T22:13:20.042Z");

  const auto begin = std::chrono::steady_clock::time_point(std::chrono::milliseconds(1'000));
  const auto end = std::chrono::steady_clock::time_point(std::chrono::milliseconds(2'500));
  REQUIRE(chaoslab::core::SecondsBetween(begin, end) == 1.5);
}

TEST_CASE("JSON helpers escape control characters and reject non-finite numbers",
          "[core][json]") {
  REQUIRE(chaoslab::core::QuoteJson("a\"b\\c\n") == R"("a\"b\\c\n")");
  REQUIRE(chaoslab::core::EscapeJson(std::string(1, '\x01')) == "\\u0001");
  REQUIRE(chaoslab::core::FormatJsonNumber(0.5) == "0.500");
  REQUIRE(chaoslab::core::FormatJsonNumber(std::numeric_limits<double>::infinity()) == "null");
}

TEST_CASE("JSON DOM parses nested documents and reports syntax errors", "[core][json]") {
  using chaoslab::core::json::Value;

  Value root;
  std::string error;
  REQUIRE(chaoslab::core::json::Parse(R"({"faults": [{"probability": 0.25}], "name": "x"})", root,
                                      error));
  const Value* faults = chaoslab::core::json::FindMember(root, "faults");
  REQUIRE(faults != nullptr);
  REQUIRE(faults->type == Value::Type::kArray);
  REQUIRE(faults->array_value.size() == 1U);
  const Value* probability =
      chaoslab::core::json::FindMember(faults->array_value.front(), "probability");
  REQUIRE(probability != nullptr);
  REQUIRE(probability->number_value == 0.25);
  REQUIRE(chaoslab::core::json::FindMember(*faults, "name") == nullptr);

  Value broken;
  REQUIRE_FALSE(chaoslab::core::json::Parse(R"({"name": })", broken, error));
  REQUIRE_FALSE(error.empty());
}

TEST_CASE("Log level parsing accepts names case-insensitively", "[core][logging]") {
  using chaoslab::core::logging::LogLevel;

  LogLevel level = LogLevel::kInfo;
  std::string error;
  REQUIRE(chaoslab::core::logging::ParseLogLevel("DEBUG", level, error));
  REQUIRE(level == LogLevel::kDebug);
  REQUIRE(chaoslab::core::logging::ParseLogLevel("warning", level, error));
  REQUIRE(level == LogLevel::kWarn);
  REQUIRE_FALSE(chaoslab::core::logging::ParseLogLevel("loud", level, error));
  REQUIRE(error.find("debug|info|warn|error") != std::string::npos);
}

TEST_CASE("Logger filters by level and quotes field values", "[core][logging]") {
  using chaoslab::core::logging::LogLevel;

  std::ostringstream out;
  chaoslab::core::logging::Logger logger(LogLevel::kInfo, out);
  logger.Debug("exp-1", "hidden");
  logger.Info("exp-1", "fault raised", {{"target", "db \"primary\""}});
  logger.Warn("", "no experiment");

  const std::string text = out.str();
  REQUIRE(text.find("hidden") == std::string::npos);
  REQUIRE(text.find(R"(level=INFO experiment_id="exp-1" msg="fault raised")") != std::string::npos);
  REQUIRE(text.find(R"(target="db \"primary\"")") != std::string::npos);
  REQUIRE(text.find(R"(experiment_id="-")") != std::string::npos);
}
