#ifndef CHAOSLAB_CORE_TIME_UTILS_HPP_
#define CHAOSLAB_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace chaoslab::core {

// Canonical UTC timestamp used by logs, observations and result JSON:
// `YYYY-MM-DDTHH:MM:SS.mmmZ`.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm utc_time{};
#if defined(_WIN32)
  if (gmtime_s(&utc_time, &epoch_seconds) != 0) {
    return "";
  }
#else
  if (gmtime_r(&epoch_seconds, &utc_time) == nullptr) {
    return "";
  }
#endif

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

// Fractional seconds between two instants of any one clock.
template <typename Clock, typename Duration>
double SecondsBetween(std::chrono::time_point<Clock, Duration> begin,
                      std::chrono::time_point<Clock, Duration> end) {
  return std::chrono::duration<double>(end - begin).count();
}

} // namespace chaoslab::core

#endif // CHAOSLAB_CORE_TIME_UTILS_HPP_
