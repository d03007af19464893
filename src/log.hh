#pragma once

// Functions for logging human-readable messages.
//
// Usage:
//
//   VERBOSE << "details useful only while debugging";
//   LOG << "regular message";
//   WARNING << "something recoverable went wrong";
//   ERROR << "error message";
//   FATAL << "stop the execution";
//
// Logging can also accept other types - integers, floats & anything with a
// ToStr overload.
//
// Logged messages can have multiple lines - the extra lines are not indented or
// treated in any special way.
//
// There is no need to add a new line character at the end of the logged message
// - it's added there automatically.
//
// Loggers may be called from any thread. Calls are serialized.

#include <chrono>
#include <functional>
#include <source_location>
#include <vector>

#include "status.hh"
#include "str.hh"

namespace portal {

enum class LogLevel { Ignore, Debug, Info, Warning, Error, Fatal };

// Appends the logged message when destroyed.
struct LogEntry {
  LogLevel log_level;
  std::chrono::system_clock::time_point timestamp;
  std::source_location location;
  mutable std::string buffer;
  mutable int errsv;  // saved errno (if any)

  LogEntry(LogLevel, const std::source_location location = std::source_location::current());
  ~LogEntry();
};

using Logger = std::function<void(const LogEntry&)>;

void DefaultLogger(const LogEntry& e);

// The default logger prints to stdout.
extern std::vector<Logger> loggers;

// Entries below this level are dropped before reaching any logger.
extern LogLevel min_log_level;

// Parses "debug", "info", "warning" or "error". Returns false for anything else.
bool ParseLogLevel(StrView, LogLevel&);

#define VERBOSE portal::LogEntry(portal::LogLevel::Debug, std::source_location::current())
#define LOG portal::LogEntry(portal::LogLevel::Info, std::source_location::current())
#define WARNING portal::LogEntry(portal::LogLevel::Warning, std::source_location::current())
#define ERROR portal::LogEntry(portal::LogLevel::Error, std::source_location::current())
#define FATAL portal::LogEntry(portal::LogLevel::Fatal, std::source_location::current())

const LogEntry& operator<<(const LogEntry&, StrView);
const LogEntry& operator<<(const LogEntry&, const Status& status);

const LogEntry& operator<<(const LogEntry& logger, const Stringer auto& t) {
  return logger << ToStr(t);
}

}  // namespace portal
