#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace chaoslab::experiments {

// Fields of a result JSON file needed to report on a finished run without
// the scheduler that produced it. Kind names stay strings: a file written by
// a newer build may carry kinds this build does not know.
struct ResultDigest {
  std::string experiment_id;
  std::string name;
  std::string status;
  std::string start_time_utc;
  std::optional<std::string> end_time_utc;
  std::uint64_t total_faults_fired = 0;
  std::map<std::string, std::uint64_t> faults_by_kind;
  std::map<std::string, std::uint64_t> errors_by_kind;
  double duration_seconds = 0.0;
  std::uint64_t ticks = 0;
  std::uint64_t observation_count = 0;
};

// Reads a document written by ToJson(RunResult).
//
// Contract:
// - false: the text is not valid JSON, a required field is missing or has
//   the wrong type, or total_faults_fired disagrees with faults_by_kind.
//   `error` names the offending field.
// - true: `digest` is populated.
bool ReadResultDigest(std::string_view json_text, ResultDigest& digest, std::string& error);

bool ReadResultDigestFile(const std::string& path, ResultDigest& digest, std::string& error);

std::string RenderDigestText(const ResultDigest& digest);
std::string ToJson(const ResultDigest& digest);

} // namespace chaoslab::experiments
