#pragma once

// Settings resolved once at startup. Each value comes from (in order of
// precedence) a command line flag, an environment variable or a computed
// default.

#include "fn.hh"
#include "int.hh"
#include "ip.hh"
#include "log.hh"
#include "optional.hh"
#include "path.hh"
#include "status.hh"
#include "str.hh"
#include "timing.hh"

namespace portal {

extern const char *kVersion;

// Prefix of the SSID derived from the device UUID.
extern const char *kSSIDPrefix;

// WPA2 passphrases must be at least this long.
constexpr Size kMinPassphraseLength = 8;

struct Config {
  // Empty means "use the first WiFi device".
  Optional<Str> interface;
  Str ssid;
  // Empty means an open portal.
  Optional<Str> passphrase;
  IP gateway = IP(192, 168, 42, 1);
  Str dhcp_range = "192.168.42.2,192.168.42.254";
  Endpoint listening = {.ip = IP::kZero, .port = 80};
  // Zero disables the activity timeout.
  U32 activity_timeout_s = 0;
  Path ui_directory;
  LogLevel log_level = LogLevel::Info;
  Timing timing;
};

// Looks up an environment variable. Returns nullptr when it's not set.
using Environment = Fn<const char *(const char *)>;

// Environment of the current process.
Environment ProcessEnvironment();

enum class ConfigAction { Run, Help, Version };

// Parses `argv` & the environment.
//
// `action` is set to Help or Version when the user asked for it. The returned
// Config should be used only when `action` is Run & `status` is OK.
Config LoadConfig(int argc, char *argv[], const Environment &,
                  ConfigAction &action, Status &);

Str Usage(StrView program);

// "HalleyHub-" followed by the first 12 characters of BALENA_DEVICE_UUID (or
// RESIN_DEVICE_UUID). Empty when neither is set.
Str DeriveSSID(const Environment &);

// PAIRING_CODE right-padded with '_' to kMinPassphraseLength characters.
Optional<Str> DerivePassphrase(const Environment &);

} // namespace portal
