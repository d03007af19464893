#include "systemd.hh"

#define SD_JOURNAL_SUPPRESS_LOCATION

#include <cstdio>
#include <cstdlib>
#include <optional>
#include <sys/stat.h>
#include <syslog.h>
#include <systemd/sd-daemon.h>
#include <systemd/sd-journal.h>
#include <unistd.h>

#include "log.hh"
#include "timer.hh"

using namespace portal;

namespace systemd {

static bool under_systemd = false;

static void LogErrorAsStatus(const LogEntry &log_entry) {
  if (log_entry.log_level >= LogLevel::Error) {
    sd_notifyf(0, "STATUS=%s\nERRNO=%i", log_entry.buffer.c_str(),
               log_entry.errsv);
  }
}

static int Priority(LogLevel level) {
  switch (level) {
  case LogLevel::Ignore:
  case LogLevel::Debug:
    return LOG_DEBUG;
  case LogLevel::Info:
    return LOG_INFO;
  case LogLevel::Warning:
    return LOG_WARNING;
  case LogLevel::Error:
    return LOG_ERR;
  case LogLevel::Fatal:
    return LOG_CRIT;
  }
  return LOG_INFO;
}

static void StructuredLog(const LogEntry &log_entry) {
  Str code_file = "CODE_FILE=";
  code_file += log_entry.location.file_name();
  Str code_line = "CODE_LINE=" + std::to_string(log_entry.location.line());
  const char *code_func = log_entry.location.function_name();
  int r;
  if (log_entry.errsv) {
    r = sd_journal_send_with_location(
        code_file.c_str(), code_line.c_str(), code_func, "MESSAGE=%s",
        log_entry.buffer.c_str(), "PRIORITY=%i", Priority(log_entry.log_level),
        "SYSLOG_IDENTIFIER=wifi-portal", "ERRNO=%i", log_entry.errsv, nullptr);
  } else {
    r = sd_journal_send_with_location(
        code_file.c_str(), code_line.c_str(), code_func, "MESSAGE=%s",
        log_entry.buffer.c_str(), "PRIORITY=%i", Priority(log_entry.log_level),
        "SYSLOG_IDENTIFIER=wifi-portal", nullptr);
  }
  if (r < 0) {
    // The journal is gone. Fall back to stdout for this entry.
    DefaultLogger(log_entry);
  }
}

// Switches to structured logging when stdout is connected to the journal.
static void ConfigureLogging() {
  char *journal_stream = getenv("JOURNAL_STREAM");
  if (journal_stream == nullptr) {
    return;
  }
  unsigned long device, inode;
  if (sscanf(journal_stream, "%lu:%lu", &device, &inode) != 2) {
    ERROR << "Failed to parse JOURNAL_STREAM: " << journal_stream << ".";
    return;
  }
  struct stat stdout_stat = {};
  if (fstat(STDOUT_FILENO, &stdout_stat) != 0) {
    ERROR << "Failed to stat stdout.";
    return;
  }
  if (stdout_stat.st_dev == device && stdout_stat.st_ino == inode) {
    loggers.clear();
    loggers.push_back(StructuredLog);
  }
}

static std::optional<Timer> watchdog_timer;

// Sends watchdog pings at half of the configured interval. Requires
// `epoll::Loop` to run.
static void StartWatchdog() {
  uint64_t usec = 0;
  int r = sd_watchdog_enabled(0, &usec);
  if (r < 0) {
    errno = -r;
    ERROR << "Couldn't read the watchdog configuration";
    return;
  }
  if (r == 0) {
    return;
  }
  Status status;
  watchdog_timer.emplace(status);
  double interval_s = usec / 2.0 / 1000000.0;
  watchdog_timer->handler = []() { sd_notify(0, "WATCHDOG=1"); };
  watchdog_timer->Arm(interval_s, interval_s, status);
  if (!OK(status)) {
    ERROR << "Couldn't start the watchdog timer: " << status;
    watchdog_timer.reset();
  }
}

void Init() {
  if (getenv("NOTIFY_SOCKET") == nullptr) {
    return;
  }
  under_systemd = true;
  ConfigureLogging();
  loggers.push_back(LogErrorAsStatus);
  StartWatchdog();
}

void Ready() {
  if (under_systemd) {
    sd_notify(0, "READY=1");
  }
}

void SetStatus(StrView status) {
  if (under_systemd) {
    Str copy(status);
    sd_notifyf(0, "STATUS=%s", copy.c_str());
  }
}

void Stop() {
  if (!under_systemd) {
    return;
  }
  sd_notify(0, "STOPPING=1");
  watchdog_timer.reset();
}

} // namespace systemd
