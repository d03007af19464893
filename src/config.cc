#include "config.hh"

#include <charconv>
#include <cstdlib>
#include <getopt.h>

#include "format.hh"

#ifndef PORTAL_VERSION
#define PORTAL_VERSION "dev"
#endif

namespace portal {

const char *kVersion = PORTAL_VERSION;

const char *kSSIDPrefix = "HalleyHub";

Environment ProcessEnvironment() {
  return [](const char *name) -> const char * { return getenv(name); };
}

static Optional<Str> GetEnv(const Environment &env, const char *name) {
  if (const char *value = env(name)) {
    return Str(value);
  }
  return std::nullopt;
}

Str DeriveSSID(const Environment &env) {
  auto uuid = GetEnv(env, "BALENA_DEVICE_UUID");
  if (!uuid) {
    uuid = GetEnv(env, "RESIN_DEVICE_UUID");
  }
  if (!uuid || uuid->empty()) {
    return "";
  }
  return Str(kSSIDPrefix) + "-" + uuid->substr(0, 12);
}

Optional<Str> DerivePassphrase(const Environment &env) {
  auto code = GetEnv(env, "PAIRING_CODE");
  if (!code) {
    return std::nullopt;
  }
  return PadRight(*code, kMinPassphraseLength, '_');
}

static const option kLongOptions[] = {
    {"portal-interface", required_argument, nullptr, 'i'},
    {"portal-ssid", required_argument, nullptr, 's'},
    {"portal-passphrase", required_argument, nullptr, 'p'},
    {"portal-gateway", required_argument, nullptr, 'g'},
    {"portal-dhcp-range", required_argument, nullptr, 'd'},
    {"portal-listening", required_argument, nullptr, 'o'},
    {"activity-timeout", required_argument, nullptr, 'a'},
    {"ui-directory", required_argument, nullptr, 'u'},
    {"help", no_argument, nullptr, 'h'},
    {"version", no_argument, nullptr, 'V'},
    {nullptr, 0, nullptr, 0},
};

Str Usage(StrView program) {
  Str usage = "Usage: ";
  usage += program;
  usage += R"( [OPTIONS]

WiFi configuration captive portal.

Options:
  -i, --portal-interface <name>     Wireless network interface to be used
                                    [env PORTAL_INTERFACE]
  -s, --portal-ssid <ssid>          SSID of the captive portal
                                    [env PORTAL_SSID]
  -p, --portal-passphrase <pass>    WPA2 passphrase of the captive portal
                                    [env PORTAL_PASSPHRASE]
  -g, --portal-gateway <ip>         Gateway of the captive portal
                                    [env PORTAL_GATEWAY, default 192.168.42.1]
  -d, --portal-dhcp-range <range>   DHCP range of the captive portal
                                    [env PORTAL_DHCP_RANGE,
                                     default 192.168.42.2,192.168.42.254]
  -o, --portal-listening <ip:port>  Listening address of the HTTP server
                                    [env PORTAL_LISTENING, default 0.0.0.0:80]
  -a, --activity-timeout <seconds>  Exit if no activity for the given time
                                    [env ACTIVITY_TIMEOUT, default 0 = never]
  -u, --ui-directory <dir>          Web UI directory location
                                    [env UI_DIRECTORY]
  -h, --help                        Print this message
  -V, --version                     Print the version
)";
  return usage;
}

static Path DefaultUIDirectory() {
  Path exe = Path::ExecutablePath();
  if (!exe.str.empty()) {
    Path installed = exe.Parent().Parent() / "share/wifi-portal/ui";
    if (installed.IsDirectory()) {
      return installed;
    }
  }
  return Path("ui");
}

static bool ParseSeconds(StrView s, U32 &out) {
  auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && end == s.data() + s.size() && !s.empty();
}

Config LoadConfig(int argc, char *argv[], const Environment &env,
                  ConfigAction &action, Status &status) {
  action = ConfigAction::Run;
  Config config;

  Optional<Str> flag_interface, flag_ssid, flag_passphrase, flag_gateway,
      flag_dhcp_range, flag_listening, flag_timeout, flag_ui_directory;

  opterr = 0;
  optind = 0; // glibc: full reinitialization, so LoadConfig can run again
  while (true) {
    int c = getopt_long(argc, argv, ":i:s:p:g:d:o:a:u:hV", kLongOptions, nullptr);
    if (c == -1) {
      break;
    }
    switch (c) {
    case 'i':
      flag_interface = optarg;
      break;
    case 's':
      flag_ssid = optarg;
      break;
    case 'p':
      flag_passphrase = optarg;
      break;
    case 'g':
      flag_gateway = optarg;
      break;
    case 'd':
      flag_dhcp_range = optarg;
      break;
    case 'o':
      flag_listening = optarg;
      break;
    case 'a':
      flag_timeout = optarg;
      break;
    case 'u':
      flag_ui_directory = optarg;
      break;
    case 'h':
      action = ConfigAction::Help;
      return config;
    case 'V':
      action = ConfigAction::Version;
      return config;
    case ':':
      AppendErrorMessage(status) += f("Option %s requires a value", argv[optind - 1]);
      return config;
    default:
      AppendErrorMessage(status) += f("Unknown option %s", argv[optind - 1]);
      return config;
    }
  }
  if (optind < argc) {
    AppendErrorMessage(status) += f("Unexpected argument \"%s\"", argv[optind]);
    return config;
  }

  auto pick = [&](Optional<Str> &flag, const char *env_name) -> Optional<Str> {
    if (flag) {
      return flag;
    }
    return GetEnv(env, env_name);
  };

  config.interface = pick(flag_interface, "PORTAL_INTERFACE");

  if (auto ssid = pick(flag_ssid, "PORTAL_SSID")) {
    config.ssid = *ssid;
  } else {
    config.ssid = DeriveSSID(env);
  }
  if (config.ssid.empty()) {
    AppendErrorMessage(status) +=
        "Portal SSID is not set. Pass --portal-ssid or set PORTAL_SSID, "
        "BALENA_DEVICE_UUID or RESIN_DEVICE_UUID";
    return config;
  }
  if (config.ssid.size() > 32) {
    AppendErrorMessage(status) +=
        f("Portal SSID \"%s\" is longer than 32 bytes", config.ssid.c_str());
    return config;
  }

  if (auto passphrase = pick(flag_passphrase, "PORTAL_PASSPHRASE")) {
    config.passphrase = *passphrase;
  } else {
    config.passphrase = DerivePassphrase(env);
  }
  if (config.passphrase && config.passphrase->empty()) {
    config.passphrase.reset();
  }
  if (config.passphrase && config.passphrase->size() < kMinPassphraseLength) {
    AppendErrorMessage(status) += f("Portal passphrase must be at least %zu characters long",
                                    kMinPassphraseLength);
    return config;
  }

  if (auto gateway = pick(flag_gateway, "PORTAL_GATEWAY")) {
    if (!config.gateway.TryParse(*gateway)) {
      AppendErrorMessage(status) += f("Invalid gateway address \"%s\"", gateway->c_str());
      return config;
    }
  }

  if (auto range = pick(flag_dhcp_range, "PORTAL_DHCP_RANGE")) {
    config.dhcp_range = *range;
  }

  if (auto listening = pick(flag_listening, "PORTAL_LISTENING")) {
    if (!config.listening.TryParse(*listening)) {
      AppendErrorMessage(status) += f("Invalid listening address \"%s\"", listening->c_str());
      return config;
    }
  }

  if (auto timeout = pick(flag_timeout, "ACTIVITY_TIMEOUT")) {
    if (!ParseSeconds(*timeout, config.activity_timeout_s)) {
      AppendErrorMessage(status) += f("Invalid activity timeout \"%s\"", timeout->c_str());
      return config;
    }
  }

  if (auto ui_directory = pick(flag_ui_directory, "UI_DIRECTORY")) {
    config.ui_directory = Path(*ui_directory);
  } else {
    config.ui_directory = DefaultUIDirectory();
  }

  if (auto level = GetEnv(env, "LOG_LEVEL")) {
    if (!ParseLogLevel(*level, config.log_level)) {
      AppendErrorMessage(status) += f("Invalid LOG_LEVEL \"%s\"", level->c_str());
      return config;
    }
  }

  return config;
}

} // namespace portal
