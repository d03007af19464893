#include "ip.hh"

#include <charconv>

#include "format.hh"

namespace portal {

const IP IP::kZero;

bool IP::TryParse(StrView s) {
  U8 parsed[4];
  for (int i = 0; i < 4; ++i) {
    if (i > 0) {
      if (!s.starts_with('.')) {
        return false;
      }
      s.remove_prefix(1);
    }
    unsigned octet = 0;
    auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), octet);
    if (ec != std::errc() || end == s.data() || octet > 255) {
      return false;
    }
    s.remove_prefix(end - s.data());
    parsed[i] = octet;
  }
  if (!s.empty()) {
    return false;
  }
  for (int i = 0; i < 4; ++i) {
    bytes[i] = parsed[i];
  }
  return true;
}

Str ToStr(IP ip) {
  return f("%d.%d.%d.%d", ip.bytes[0], ip.bytes[1], ip.bytes[2], ip.bytes[3]);
}

bool Endpoint::TryParse(StrView s) {
  auto colon = s.rfind(':');
  if (colon == StrView::npos) {
    return false;
  }
  IP parsed_ip;
  if (!parsed_ip.TryParse(s.substr(0, colon))) {
    return false;
  }
  StrView port_str = s.substr(colon + 1);
  unsigned parsed_port = 0;
  auto [end, ec] = std::from_chars(port_str.data(),
                                   port_str.data() + port_str.size(), parsed_port);
  if (ec != std::errc() || end != port_str.data() + port_str.size() ||
      port_str.empty() || parsed_port > 65535) {
    return false;
  }
  ip = parsed_ip;
  port = parsed_port;
  return true;
}

Str Endpoint::ToStr() const { return portal::ToStr(ip) + ":" + std::to_string(port); }

} // namespace portal
