#pragma once

// JSON bodies of the HTTP API.

#include "command.hh"
#include "str.hh"

namespace portal {

// Appends `s` to `out`, escaping it for use inside a JSON string literal.
void EscapeJSONString(Str &out, StrView s);

// [{"ssid":"...","security":"wpa"}, ...]
Str NetworksJSON(const Vec<Network> &);

// {"apmode":true,"connected":false}
Str CurrentJSON(bool apmode, bool connected);

// {"result":true}
Str ResultJSON(bool result);

} // namespace portal
