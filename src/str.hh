#pragma once

#include <concepts>
#include <string>

namespace portal {

using Str = std::string;
using StrView = std::string_view;

using namespace std::literals;

// Returns true if `s` is a well-formed UTF-8 sequence.
//
// Overlong encodings, surrogate halves & code points above U+10FFFF are
// rejected.
bool IsValidUTF8(StrView s);

// Appends `pad` to `s` until it's at least `min_length` bytes long.
Str PadRight(StrView s, size_t min_length, char pad);

// ToStr function should be the default way of converting values to strings.
//
// It relies on ADL for lookup, so types declared in other namespaces can
// provide their own overloads next to the type.

inline Str ToStr(int val) { return std::to_string(val); }
inline Str ToStr(long val) { return std::to_string(val); }
inline Str ToStr(long long val) { return std::to_string(val); }
inline Str ToStr(unsigned val) { return std::to_string(val); }
inline Str ToStr(unsigned long val) { return std::to_string(val); }
inline Str ToStr(unsigned long long val) { return std::to_string(val); }
inline Str ToStr(double val) { return std::to_string(val); }

template <typename T>
  requires requires(T t) {
    { t.ToStr() } -> std::same_as<Str>;
  }
Str ToStr(const T &t) {
  return t.ToStr();
}

template <typename T>
concept Stringer = requires(T t) {
  { ToStr(t) } -> std::same_as<Str>;
};

} // namespace portal
