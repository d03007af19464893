#pragma once

#include <memory>
#include <source_location>

#include "str.hh"

namespace portal {

// Chain of error messages, most recent first.
//
// Functions that can fail take a `Status&` and append a message when they do.
// Callers add their own context on the way up, so the final message reads like
// a backtrace of what was being attempted.
struct Status {
  struct Entry {
    std::unique_ptr<Entry> next;
    std::source_location location;
    Str message;
  };

  std::unique_ptr<Entry> entry;

  int errsv; // Saved errno value

  Status();
  Status(Status &&) = default;
  Status &operator=(Status &&) = default;

  Str &operator()(const std::source_location location_arg =
                      std::source_location::current());

  bool Ok() const;

  // Most recently appended message (without source location) or "".
  StrView Message() const;

  Str ToStr() const;
  void Reset();
};

inline bool OK(const Status &status) { return status.Ok(); }
inline Str &AppendErrorMessage(
    Status &status,
    const std::source_location location_arg = std::source_location::current()) {
  return status(location_arg);
}

#define RETURN_ON_ERROR(status)                                                \
  if (!OK(status)) {                                                           \
    AppendErrorMessage(status) += __FUNCTION__;                                \
    return;                                                                    \
  }

#define RETURN_VAL_ON_ERROR(status, value)                                     \
  if (!OK(status)) {                                                           \
    AppendErrorMessage(status) += __FUNCTION__;                                \
    return value;                                                              \
  }

} // namespace portal
