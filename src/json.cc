#include "json.hh"

#include "format.hh"

namespace portal {

void EscapeJSONString(Str &out, StrView s) {
  for (char c : s) {
    switch (c) {
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    default:
      if ((unsigned char)c < 0x20) {
        out += f("\\u%04x", (unsigned char)c);
      } else {
        out += c;
      }
      break;
    }
  }
}

static const char *Bool(bool b) { return b ? "true" : "false"; }

Str NetworksJSON(const Vec<Network> &networks) {
  Str json = "[";
  for (auto &network : networks) {
    if (json.size() > 1) {
      json += ",";
    }
    json += "{\"ssid\":\"";
    EscapeJSONString(json, network.ssid);
    json += "\",\"security\":\"";
    json += nm::SecurityName(network.security);
    json += "\"}";
  }
  json += "]";
  return json;
}

Str CurrentJSON(bool apmode, bool connected) {
  return f("{\"apmode\":%s,\"connected\":%s}", Bool(apmode), Bool(connected));
}

Str ResultJSON(bool result) { return f("{\"result\":%s}", Bool(result)); }

} // namespace portal
