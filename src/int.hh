#pragma once

#include <sys/types.h>

namespace portal {

using I32 = signed int;
using I64 = signed long long;

using U8 = unsigned char;
using U16 = unsigned short;
using U32 = unsigned int;
using U64 = unsigned long;

static_assert(sizeof(U64) == 8);

using Size = size_t;
using SSize = ssize_t;

} // namespace portal
