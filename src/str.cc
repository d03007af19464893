#include "str.hh"

#include "int.hh"

namespace portal {

bool IsValidUTF8(StrView s) {
  Size i = 0;
  while (i < s.size()) {
    U8 c = s[i];
    int extra;
    U32 code_point;
    if (c < 0x80) {
      ++i;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      extra = 1;
      code_point = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      extra = 2;
      code_point = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      extra = 3;
      code_point = c & 0x07;
    } else {
      return false;
    }
    if (i + extra >= s.size()) {
      return false;
    }
    for (int k = 1; k <= extra; ++k) {
      U8 cont = s[i + k];
      if ((cont & 0xC0) != 0x80) {
        return false;
      }
      code_point = (code_point << 6) | (cont & 0x3F);
    }
    static constexpr U32 kMinForLength[] = {0, 0x80, 0x800, 0x10000};
    if (code_point < kMinForLength[extra]) {
      return false; // overlong
    }
    if (code_point > 0x10FFFF) {
      return false;
    }
    if (code_point >= 0xD800 && code_point <= 0xDFFF) {
      return false;
    }
    i += extra + 1;
  }
  return true;
}

Str PadRight(StrView s, size_t min_length, char pad) {
  Str ret(s);
  while (ret.size() < min_length) {
    ret += pad;
  }
  return ret;
}

} // namespace portal
