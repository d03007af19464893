#pragma once

// Class for working with paths. Based on python's pathlib.

#include "status.hh"
#include "str.hh"

namespace portal {

struct Path {
  constexpr static char kSeparator = '/';

  Str str;

  Path(const char* str) : str(str) {}
  Path(Str str) : str(std::move(str)) {}
  Path(StrView path) : str(path) {}
  Path() = default;
  Path(const Path& other) = default;

  // Path to the currently executing binary.
  static Path ExecutablePath();

  Path Parent() const;

  // Final path component.
  Str Name() const;

  // Final path component suffix, including the dot (".html").
  Str Suffix() const;

  bool IsDirectory() const;
  bool IsRegularFile() const;

  // Reads the whole file.
  Str Read(Status&) const;

  Path operator/(StrView rhs) const;

  operator Str() const { return str; }
  operator StrView() const { return str; }
  operator const char*() const { return str.c_str(); }
};

}  // namespace portal
