#ifndef GLANCELAB_CORE_JSON_UTILS_HPP_
#define GLANCELAB_CORE_JSON_UTILS_HPP_

#include <cmath>
#include <cstdio>
#include <string>
#include <string_view>

namespace glancelab::core {

// JSON string escaping shared by decision and summary writers.
inline std::string EscapeJson(std::string_view input) {
  std::string out;
  out.reserve(input.size() + 8);
  for (const char ch : input) {
    switch (ch) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default: {
      const auto as_unsigned = static_cast<unsigned char>(ch);
      if (as_unsigned < 0x20U) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(as_unsigned));
        out += buffer;
      } else {
        out.push_back(ch);
      }
      break;
    }
    }
  }
  return out;
}

// Fixed-precision JSON number. Non-finite values have no JSON spelling and are
// emitted as `null`; callers that need to distinguish +inf carry a flag.
inline std::string FormatJsonNumber(double value, int precision = 6) {
  if (!std::isfinite(value)) {
    return "null";
  }
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.*f", precision, value);
  return buffer;
}

} // namespace glancelab::core

#endif // GLANCELAB_CORE_JSON_UTILS_HPP_
