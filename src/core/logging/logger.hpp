#pragma once

#include "core/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tracr::core::logging {

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

inline bool ParseLogLevel(std::string_view raw, LogLevel& level, std::string& error) {
  std::string normalized(raw);
  std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  if (normalized == "debug") {
    level = LogLevel::kDebug;
  } else if (normalized == "info") {
    level = LogLevel::kInfo;
  } else if (normalized == "warn" || normalized == "warning") {
    level = LogLevel::kWarn;
  } else if (normalized == "error") {
    level = LogLevel::kError;
  } else {
    error = "expected one of debug|info|warn|error, got '" + std::string(raw) + "'";
    return false;
  }
  return true;
}

// Line-oriented key=value logger shared by the CLI, the LAN controller and
// the orchestrator's device workers. Context fields (for example the active
// run id) are prepended to every record until cleared. A record is formatted
// before the lock is taken and written whole, so lines from concurrent
// workers never interleave.
class Logger {
public:
  explicit Logger(LogLevel min_level = LogLevel::kInfo, std::ostream& out = std::cerr)
      : min_level_(min_level), out_(&out) {}

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void SetMinLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mu_);
    min_level_ = level;
  }

  bool Enabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mu_);
    return static_cast<int>(level) >= static_cast<int>(min_level_);
  }

  void SetContextField(std::string key, std::string value) {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto& field : context_) {
      if (field.first == key) {
        field.second = std::move(value);
        return;
      }
    }
    context_.emplace_back(std::move(key), std::move(value));
  }

  void ClearContextField(std::string_view key) {
    std::lock_guard<std::mutex> lock(mu_);
    context_.erase(std::remove_if(context_.begin(), context_.end(),
                                  [key](const auto& field) { return field.first == key; }),
                   context_.end());
  }

  void Log(LogLevel level, std::string_view message,
           std::initializer_list<LogFieldView> fields = {}) {
    if (!Enabled(level)) {
      return;
    }

    std::ostringstream line;
    line << "ts_utc=" << FormatUtcTimestamp(std::chrono::system_clock::now())
         << " level=" << ToString(level);
    for (const auto& [key, value] : Context()) {
      line << ' ' << key << '=' << Quote(value);
    }
    line << " msg=" << Quote(message);
    for (const auto& field : fields) {
      line << ' ' << field.key << '=' << Quote(field.value);
    }
    line << '\n';

    std::lock_guard<std::mutex> lock(mu_);
    (*out_) << line.str();
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
  std::vector<std::pair<std::string, std::string>> Context() const {
    std::lock_guard<std::mutex> lock(mu_);
    return context_;
  }

  static std::string Quote(std::string_view raw) {
    std::string quoted = "\"";
    for (const char c : raw) {
      switch (c) {
      case '\\':
      case '"':
        quoted.push_back('\\');
        quoted.push_back(c);
        break;
      case '\n':
        quoted += "\\n";
        break;
      case '\r':
        quoted += "\\r";
        break;
      case '\t':
        quoted += "\\t";
        break;
      default:
        quoted.push_back(c);
        break;
      }
    }
    quoted.push_back('"');
    return quoted;
  }

  mutable std::mutex mu_;
  LogLevel min_level_ = LogLevel::kInfo;
  std::ostream* out_ = &std::cerr;
  std::vector<std::pair<std::string, std::string>> context_;
};

// Sets a context field for the lifetime of the scope.
class ScopedLogField {
public:
  ScopedLogField(Logger& logger, std::string key, std::string value)
      : logger_(logger), key_(std::move(key)) {
    logger_.SetContextField(key_, std::move(value));
  }

  ~ScopedLogField() {
    logger_.ClearContextField(key_);
  }

  ScopedLogField(const ScopedLogField&) = delete;
  ScopedLogField& operator=(const ScopedLogField&) = delete;

private:
  Logger& logger_;
  std::string key_;
};

} // namespace tracr::core::logging
