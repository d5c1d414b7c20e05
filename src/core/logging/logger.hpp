#pragma once

#include "core/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <initializer_list>
#include <iostream>
#include <string>
#include <string_view>

namespace glancelab::core::logging {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

struct LogFieldView {
  std::string_view key;
  std::string_view value;
};

inline const char* ToString(LogLevel level) {
  switch (level) {
  case LogLevel::kDebug:
    return "DEBUG";
  case LogLevel::kInfo:
    return "INFO";
  case LogLevel::kWarn:
    return "WARN";
  case LogLevel::kError:
    return "ERROR";
  }

  return "INFO";
}

inline std::string ExpectedLogLevelList() {
  return "debug|info|warn|error";
}

inline bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  error.clear();

  if (raw.empty()) {
    error = "missing value for --log-level (expected " + ExpectedLogLevelList() + ")";
    return false;
  }

  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (normalized == "debug") {
    level = LogLevel::kDebug;
  } else if (normalized == "info") {
    level = LogLevel::kInfo;
  } else if (normalized == "warn" || normalized == "warning") {
    level = LogLevel::kWarn;
  } else if (normalized == "error") {
    level = LogLevel::kError;
  } else {
    error = "invalid --log-level '" + std::string(raw) + "' (expected " +
            ExpectedLogLevelList() + ")";
    return false;
  }
  return true;
}

// Single-line key="value" logger. Every line carries the UTC timestamp, level,
// the command that emitted it and the experiment run id (or "-" before one is
// assigned), followed by caller fields in the order given.
class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr)
      : min_level_(min_level), out_(&out) {}

  void SetCommand(std::string command) {
    command_ = std::move(command);
  }

  void SetRunId(std::string run_id) {
    run_id_ = std::move(run_id);
  }

  bool ShouldLog(LogLevel level) const {
    return static_cast<int>(level) >= static_cast<int>(min_level_);
  }

  void Log(LogLevel level, std::string_view message,
           std::initializer_list<LogFieldView> fields = {}) {
    if (!ShouldLog(level)) {
      return;
    }

    std::string line;
    line.reserve(128);
    line += "ts_utc=";
    line += core::FormatUtcTimestamp(std::chrono::system_clock::now());
    line += " level=";
    line += ToString(level);
    line += " cmd=";
    AppendQuoted(line, command_);
    line += " run_id=";
    AppendQuoted(line, run_id_);
    line += " msg=";
    AppendQuoted(line, message);
    for (const auto& field : fields) {
      line.push_back(' ');
      line.append(field.key);
      line.push_back('=');
      AppendQuoted(line, field.value);
    }
    line.push_back('\n');

    (*out_) << line;
    out_->flush();
  }

  void Debug(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kDebug, message, fields);
  }

  void Info(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kInfo, message, fields);
  }

  void Warn(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kWarn, message, fields);
  }

  void Error(std::string_view message, std::initializer_list<LogFieldView> fields = {}) {
    Log(LogLevel::kError, message, fields);
  }

private:
  static void AppendQuoted(std::string& line, std::string_view raw) {
    line.push_back('"');
    for (const char c : raw) {
      switch (c) {
      case '\\':
        line += "\\\\";
        break;
      case '"':
        line += "\\\"";
        break;
      case '\n':
        line += "\\n";
        break;
      case '\r':
        line += "\\r";
        break;
      case '\t':
        line += "\\t";
        break;
      default:
        line.push_back(c);
        break;
      }
    }
    line.push_back('"');
  }

  LogLevel min_level_ = LogLevel::kInfo;
  std::ostream* out_ = &std::cerr;
  std::string command_ = "-";
  std::string run_id_ = "-";
};

} // namespace glancelab::core::logging
