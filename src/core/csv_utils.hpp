#ifndef GLANCELAB_CORE_CSV_UTILS_HPP_
#define GLANCELAB_CORE_CSV_UTILS_HPP_

#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace glancelab::core::csv {

// Quotes a field only when it contains a delimiter, quote or line break
// (RFC 4180). Task titles are free text, everything else is plain tokens.
inline std::string QuoteField(std::string_view raw) {
  if (raw.find_first_of(",\"\r\n") == std::string_view::npos) {
    return std::string(raw);
  }

  std::string quoted;
  quoted.reserve(raw.size() + 2);
  quoted.push_back('"');
  for (const char c : raw) {
    if (c == '"') {
      quoted.push_back('"');
    }
    quoted.push_back(c);
  }
  quoted.push_back('"');
  return quoted;
}

// Reads one logical record, following quoted fields across physical lines.
//
// Contract:
// - returns true and sets `has_record=false` at clean end of input.
// - returns true and fills `fields` for each record; `line_number` advances by
//   the physical lines consumed.
// - returns false on an unterminated quoted field.
inline bool ReadRecord(std::istream& input, std::vector<std::string>& fields, bool& has_record,
                       std::size_t& line_number, std::string& error) {
  fields.clear();
  has_record = false;

  std::string line;
  if (!std::getline(input, line)) {
    return true;
  }
  ++line_number;
  has_record = true;

  std::string current;
  bool in_quotes = false;
  while (true) {
    if (!line.empty() && line.back() == '\r' && !in_quotes) {
      line.pop_back();
    }

    for (std::size_t i = 0; i < line.size(); ++i) {
      const char c = line[i];
      if (in_quotes) {
        if (c == '"') {
          if (i + 1 < line.size() && line[i + 1] == '"') {
            current.push_back('"');
            ++i;
          } else {
            in_quotes = false;
          }
        } else {
          current.push_back(c);
        }
        continue;
      }

      if (c == '"') {
        in_quotes = true;
      } else if (c == ',') {
        fields.push_back(std::move(current));
        current.clear();
      } else {
        current.push_back(c);
      }
    }

    if (!in_quotes) {
      break;
    }

    current.push_back('\n');
    if (!std::getline(input, line)) {
      error = "unterminated quoted field starting before line " + std::to_string(line_number);
      return false;
    }
    ++line_number;
  }

  fields.push_back(std::move(current));
  return true;
}

// Strict numeric parsing: the whole token must be consumed and the value
// must be finite.
inline bool ParseDouble(std::string_view text, double& value) {
  if (text.empty()) {
    return false;
  }
  const std::string owned(text);
  char* parse_end = nullptr;
  errno = 0;
  const double parsed = std::strtod(owned.c_str(), &parse_end);
  if (parse_end == nullptr || *parse_end != '\0' || errno == ERANGE || !std::isfinite(parsed)) {
    return false;
  }
  value = parsed;
  return true;
}

inline bool ParseInt64(std::string_view text, std::int64_t& value) {
  if (text.empty()) {
    return false;
  }
  const std::string owned(text);
  char* parse_end = nullptr;
  errno = 0;
  const long long parsed = std::strtoll(owned.c_str(), &parse_end, 10);
  if (parse_end == nullptr || *parse_end != '\0' || errno == ERANGE) {
    return false;
  }
  value = static_cast<std::int64_t>(parsed);
  return true;
}

} // namespace glancelab::core::csv

#endif // GLANCELAB_CORE_CSV_UTILS_HPP_
