#include "config.hh"

#include <map>

#include <gtest/gtest.h>

#include "vec.hh"

using namespace portal;

namespace {

struct Args {
  Vec<Str> storage;
  Vec<char *> argv;

  Args(std::initializer_list<const char *> args) {
    storage.emplace_back("wifi-portal");
    for (auto arg : args) {
      storage.emplace_back(arg);
    }
    Rebuild();
  }

  // `argv` points into `storage`, so copies need their own pointers.
  Args(const Args &other) : storage(other.storage) { Rebuild(); }

  void Rebuild() {
    argv.clear();
    for (auto &s : storage) {
      argv.push_back(s.data());
    }
    argv.push_back(nullptr);
  }

  int argc() const { return storage.size(); }
};

Environment EnvOf(std::map<Str, Str> vars) {
  return [vars = std::move(vars)](const char *name) -> const char * {
    auto it = vars.find(name);
    return it == vars.end() ? nullptr : it->second.c_str();
  };
}

Config Load(const Args &args, const Environment &env, Status &status,
            ConfigAction &action) {
  Args copy(args);
  return LoadConfig(copy.argc(), copy.argv.data(), env, action, status);
}

Config Load(const Args &args, const Environment &env, Status &status) {
  ConfigAction action;
  return Load(args, env, status, action);
}

TEST(Config, DerivesPortalFromDeviceIdentity) {
  auto env = EnvOf({{"BALENA_DEVICE_UUID", "0123456789abcdef0123"},
                    {"PAIRING_CODE", "1234"}});
  Status status;
  auto config = Load({}, env, status);
  ASSERT_TRUE(OK(status)) << status.ToStr();
  EXPECT_EQ(config.ssid, "HalleyHub-0123456789ab");
  EXPECT_EQ(config.passphrase, "1234____");
}

TEST(Config, FallsBackToResinUUID) {
  auto env = EnvOf({{"RESIN_DEVICE_UUID", "fedcba"}});
  EXPECT_EQ(DeriveSSID(env), "HalleyHub-fedcba");
  EXPECT_FALSE(DerivePassphrase(env).has_value());
}

TEST(Config, Defaults) {
  Status status;
  auto config = Load({}, EnvOf({{"PORTAL_SSID", "Setup"}}), status);
  ASSERT_TRUE(OK(status)) << status.ToStr();
  EXPECT_FALSE(config.interface.has_value());
  EXPECT_FALSE(config.passphrase.has_value());
  EXPECT_EQ(ToStr(config.gateway), "192.168.42.1");
  EXPECT_EQ(config.dhcp_range, "192.168.42.2,192.168.42.254");
  EXPECT_EQ(config.listening.ToStr(), "0.0.0.0:80");
  EXPECT_EQ(config.activity_timeout_s, 0u);
  EXPECT_EQ(config.log_level, LogLevel::Info);
}

TEST(Config, FlagsOverrideEnvironment) {
  auto env = EnvOf({{"PORTAL_SSID", "FromEnv"},
                    {"PORTAL_GATEWAY", "10.0.0.1"},
                    {"PORTAL_INTERFACE", "wlan1"},
                    {"BALENA_DEVICE_UUID", "0123456789abcdef"}});
  Status status;
  auto config = Load({"-s", "FromFlag", "--portal-listening", "127.0.0.1:8080",
                      "-a", "600", "--portal-passphrase", "longenough"},
                     env, status);
  ASSERT_TRUE(OK(status)) << status.ToStr();
  EXPECT_EQ(config.ssid, "FromFlag");
  EXPECT_EQ(config.interface, "wlan1");
  EXPECT_EQ(ToStr(config.gateway), "10.0.0.1");
  EXPECT_EQ(config.listening.ToStr(), "127.0.0.1:8080");
  EXPECT_EQ(config.activity_timeout_s, 600u);
  EXPECT_EQ(config.passphrase, "longenough");
}

TEST(Config, UIDirectoryFromEnvironment) {
  Status status;
  auto config = Load({}, EnvOf({{"PORTAL_SSID", "S"}, {"UI_DIRECTORY", "/srv/ui"}}),
                     status);
  ASSERT_TRUE(OK(status)) << status.ToStr();
  EXPECT_EQ(config.ui_directory.str, "/srv/ui");
}

TEST(Config, HelpAndVersion) {
  Status status;
  ConfigAction action;
  Load({"--help"}, EnvOf({}), status, action);
  EXPECT_EQ(action, ConfigAction::Help);
  Load({"-V"}, EnvOf({}), status, action);
  EXPECT_EQ(action, ConfigAction::Version);
  EXPECT_TRUE(OK(status));
}

TEST(Config, RejectsInvalidValues) {
  auto env = EnvOf({{"PORTAL_SSID", "Setup"}});
  for (const Args &args : {
           Args{"-p", "short"},
           Args{"-g", "192.168.1"},
           Args{"-o", "0.0.0.0"},
           Args{"-o", "0.0.0.0:99999"},
           Args{"-a", "ten"},
           Args{"-s", "0123456789012345678901234567890123"},
           Args{"--bogus"},
           Args{"-s"},
           Args{"extra"},
       }) {
    Status status;
    Load(args, env, status);
    EXPECT_FALSE(OK(status)) << args.storage[1];
  }
}

TEST(Config, MissingSSID) {
  Status status;
  Load({}, EnvOf({}), status);
  EXPECT_FALSE(OK(status));
}

TEST(Config, InvalidLogLevel) {
  Status status;
  Load({}, EnvOf({{"PORTAL_SSID", "S"}, {"LOG_LEVEL", "loud"}}), status);
  EXPECT_FALSE(OK(status));

  status.Reset();
  auto config =
      Load({}, EnvOf({{"PORTAL_SSID", "S"}, {"LOG_LEVEL", "debug"}}), status);
  EXPECT_TRUE(OK(status));
  EXPECT_EQ(config.log_level, LogLevel::Debug);
}

} // namespace
