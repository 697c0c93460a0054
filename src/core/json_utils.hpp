#ifndef CHAOSLAB_CORE_JSON_UTILS_HPP_
#define CHAOSLAB_CORE_JSON_UTILS_HPP_

#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace chaoslab::core {

// Shared JSON string escaping for result, observation and report writers.
inline std::string EscapeJson(std::string_view input) {
  std::ostringstream out;
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out << "\\\"";
      break;
    case '\\':
      out << "\\\\";
      break;
    case '\b':
      out << "\\b";
      break;
    case '\f':
      out << "\\f";
      break;
    case '\n':
      out << "\\n";
      break;
    case '\r':
      out << "\\r";
      break;
    case '\t':
      out << "\\t";
      break;
    default: {
      const auto as_unsigned = static_cast<unsigned char>(ch);
      if (as_unsigned < 0x20U) {
        out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
            << static_cast<int>(as_unsigned) << std::dec << std::setfill(' ');
      } else {
        out << ch;
      }
      break;
    }
    }
  }
  return out.str();
}

inline std::string QuoteJson(std::string_view input) {
  return "\"" + EscapeJson(input) + "\"";
}

// Fixed 3-decimal rendering keeps durations and probabilities diff-stable.
// Non-finite values have no JSON form and are emitted as null.
inline std::string FormatJsonNumber(double value) {
  if (!std::isfinite(value)) {
    return "null";
  }
  std::ostringstream out;
  out << std::fixed << std::setprecision(3) << value;
  return out.str();
}

} // namespace chaoslab::core

#endif // CHAOSLAB_CORE_JSON_UTILS_HPP_
