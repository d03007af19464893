#include "format.hh"

#include <cstdarg>
#include <cstdio>

namespace portal {

Str f(const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  va_list args2;
  va_copy(args2, args);
  int n = vsnprintf(nullptr, 0, fmt, args);
  va_end(args);
  Str out;
  if (n > 0) {
    out.resize(n + 1);
    vsnprintf(out.data(), out.size(), fmt, args2);
    out.resize(n);
  }
  va_end(args2);
  return out;
}

} // namespace portal
