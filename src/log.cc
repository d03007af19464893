#include "log.hh"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <mutex>

#include "format.hh"

namespace portal {

std::vector<Logger> loggers;

LogLevel min_log_level = LogLevel::Info;

static std::mutex loggers_mutex;

LogEntry::LogEntry(LogLevel log_level, const std::source_location location)
    : log_level(log_level),
      timestamp(std::chrono::system_clock::now()),
      location(location),
      buffer(),
      errsv(errno) {}

LogEntry::~LogEntry() {
  if (log_level == LogLevel::Ignore) {
    return;
  }
  if (log_level < min_log_level && log_level != LogLevel::Fatal) {
    return;
  }

  if (log_level == LogLevel::Fatal) {
    buffer += f(". Crashing in %s:%d [%s].", location.file_name(), (int)location.line(),
                location.function_name());
  }

  {
    std::lock_guard<std::mutex> lock(loggers_mutex);
    for (auto& logger : loggers) {
      logger(*this);
    }
  }

  if (log_level == LogLevel::Fatal) {
    fflush(stdout);
    fflush(stderr);
    abort();
  }
}

void DefaultLogger(const LogEntry& e) {
  const char* tag = "";
  switch (e.log_level) {
    case LogLevel::Debug:
      tag = "[debug] ";
      break;
    case LogLevel::Warning:
      tag = "[warning] ";
      break;
    case LogLevel::Error:
      tag = "[error] ";
      break;
    case LogLevel::Fatal:
      tag = "[fatal] ";
      break;
    default:
      break;
  }
  printf("%s%s\n", tag, e.buffer.c_str());
  fflush(stdout);
}

void __attribute__((__constructor__)) InitDefaultLoggers() { loggers.emplace_back(DefaultLogger); }

bool ParseLogLevel(StrView name, LogLevel& level) {
  if (name == "debug") {
    level = LogLevel::Debug;
  } else if (name == "info") {
    level = LogLevel::Info;
  } else if (name == "warning") {
    level = LogLevel::Warning;
  } else if (name == "error") {
    level = LogLevel::Error;
  } else {
    return false;
  }
  return true;
}

const LogEntry& operator<<(const LogEntry& logger, StrView s) {
  logger.buffer += s;
  return logger;
}

const LogEntry& operator<<(const LogEntry& logger, const Status& status) {
  logger.buffer += status.ToStr();
  logger.errsv = status.errsv;
  return logger;
}

}  // namespace portal
