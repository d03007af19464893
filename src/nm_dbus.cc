#include "nm_dbus.hh"

#include <cstring>
#include <systemd/sd-bus.h>

#include "format.hh"
#include "log.hh"

using namespace portal;

namespace nm {

static constexpr const char *kService = "org.freedesktop.NetworkManager";
static constexpr const char *kPath = "/org/freedesktop/NetworkManager";
static constexpr const char *kInterface = "org.freedesktop.NetworkManager";
static constexpr const char *kDeviceInterface =
    "org.freedesktop.NetworkManager.Device";
static constexpr const char *kWirelessInterface =
    "org.freedesktop.NetworkManager.Device.Wireless";
static constexpr const char *kAccessPointInterface =
    "org.freedesktop.NetworkManager.AccessPoint";
static constexpr const char *kSettingsPath =
    "/org/freedesktop/NetworkManager/Settings";
static constexpr const char *kSettingsInterface =
    "org.freedesktop.NetworkManager.Settings";
static constexpr const char *kConnectionInterface =
    "org.freedesktop.NetworkManager.Settings.Connection";
static constexpr const char *kActiveInterface =
    "org.freedesktop.NetworkManager.Connection.Active";
static constexpr const char *kUnknownDeviceError =
    "org.freedesktop.NetworkManager.UnknownDevice";
static constexpr const char *kInvalidConnectionError =
    "org.freedesktop.NetworkManager.Settings.InvalidConnection";
static constexpr const char *kUnknownObjectError =
    "org.freedesktop.DBus.Error.UnknownObject";
static constexpr const char *kUnknownMethodError =
    "org.freedesktop.DBus.Error.UnknownMethod";

static constexpr const char *kSystemdService = "org.freedesktop.systemd1";
static constexpr const char *kSystemdPath = "/org/freedesktop/systemd1";
static constexpr const char *kSystemdManagerInterface =
    "org.freedesktop.systemd1.Manager";
static constexpr const char *kSystemdUnitInterface =
    "org.freedesktop.systemd1.Unit";
static constexpr const char *kUnitName = "NetworkManager.service";

// Reference to a message, released when destroyed.
struct Message {
  sd_bus_message *m = nullptr;

  Message() = default;
  Message(const Message &) = delete;
  ~Message() { sd_bus_message_unref(m); }
};

struct BusError {
  sd_bus_error e = SD_BUS_ERROR_NULL;

  BusError() = default;
  BusError(const BusError &) = delete;
  ~BusError() { sd_bus_error_free(&e); }
};

// Returns true when `r` indicates success. Otherwise records the failure (with
// the D-Bus error message, when there is one) in `status`.
static bool Check(int r, const BusError &error, Status &status, StrView what,
                  const std::source_location location =
                      std::source_location::current()) {
  if (r >= 0) {
    return true;
  }
  errno = -r;
  Str &message = AppendErrorMessage(status, location);
  message += what;
  if (sd_bus_error_is_set(&error.e) && error.e.message) {
    message += ": ";
    message += error.e.message;
  }
  return false;
}

static bool Check(int r, Status &status, StrView what,
                  const std::source_location location =
                      std::source_location::current()) {
  BusError no_error;
  return Check(r, no_error, status, what, location);
}

// Reads an "ao" array.
static int ReadObjectPaths(sd_bus_message *m, Vec<ObjectPath> &out) {
  int r = sd_bus_message_enter_container(m, 'a', "o");
  if (r < 0) {
    return r;
  }
  const char *path;
  while ((r = sd_bus_message_read(m, "o", &path)) > 0) {
    out.emplace_back(path);
  }
  if (r < 0) {
    return r;
  }
  return sd_bus_message_exit_container(m);
}

// Appends groups of NetworkManager connection settings (a{sa{sv}}).
//
// After the first failure all calls become no-ops & `r` holds the error.
struct SettingsWriter {
  sd_bus_message *m;
  int r = 0;

  SettingsWriter(sd_bus_message *m) : m(m) {
    r = sd_bus_message_open_container(m, 'a', "{sa{sv}}");
  }

  void BeginGroup(const char *name) {
    if (r < 0)
      return;
    r = sd_bus_message_open_container(m, 'e', "sa{sv}");
    if (r < 0)
      return;
    r = sd_bus_message_append(m, "s", name);
    if (r < 0)
      return;
    r = sd_bus_message_open_container(m, 'a', "{sv}");
  }

  void EndGroup() {
    if (r < 0)
      return;
    r = sd_bus_message_close_container(m);
    if (r < 0)
      return;
    r = sd_bus_message_close_container(m);
  }

  void String(const char *key, StrView value) {
    if (r < 0)
      return;
    Str copy(value);
    r = sd_bus_message_append(m, "{sv}", key, "s", copy.c_str());
  }

  void Bool(const char *key, bool value) {
    if (r < 0)
      return;
    r = sd_bus_message_append(m, "{sv}", key, "b", (int)value);
  }

  void Uint(const char *key, U32 value) {
    if (r < 0)
      return;
    r = sd_bus_message_append(m, "{sv}", key, "u", (uint32_t)value);
  }

  void Bytes(const char *key, StrView value) {
    if (r < 0)
      return;
    r = sd_bus_message_open_container(m, 'e', "sv");
    if (r < 0)
      return;
    r = sd_bus_message_append(m, "s", key);
    if (r < 0)
      return;
    r = sd_bus_message_open_container(m, 'v', "ay");
    if (r < 0)
      return;
    r = sd_bus_message_append_array(m, 'y', value.data(), value.size());
    if (r < 0)
      return;
    r = sd_bus_message_close_container(m);
    if (r < 0)
      return;
    r = sd_bus_message_close_container(m);
  }

  // Single-element string array (as).
  void StringList(const char *key, const char *value) {
    if (r < 0)
      return;
    r = sd_bus_message_open_container(m, 'e', "sv");
    if (r < 0)
      return;
    r = sd_bus_message_append(m, "s", key);
    if (r < 0)
      return;
    r = sd_bus_message_open_container(m, 'v', "as");
    if (r < 0)
      return;
    r = sd_bus_message_append(m, "as", 1, value);
    if (r < 0)
      return;
    r = sd_bus_message_close_container(m);
    if (r < 0)
      return;
    r = sd_bus_message_close_container(m);
  }

  // ipv4.address-data with a single address (aa{sv}).
  void AddressData(IP address, U32 prefix) {
    if (r < 0)
      return;
    Str address_str = ToStr(address);
    r = sd_bus_message_open_container(m, 'e', "sv");
    if (r < 0)
      return;
    r = sd_bus_message_append(m, "s", "address-data");
    if (r < 0)
      return;
    r = sd_bus_message_open_container(m, 'v', "aa{sv}");
    if (r < 0)
      return;
    r = sd_bus_message_open_container(m, 'a', "a{sv}");
    if (r < 0)
      return;
    r = sd_bus_message_append(m, "a{sv}", 2, "address", "s",
                              address_str.c_str(), "prefix", "u",
                              (uint32_t)prefix);
    if (r < 0)
      return;
    for (int i = 0; i < 3; ++i) {
      r = sd_bus_message_close_container(m);
      if (r < 0)
        return;
    }
  }

  void Finish() {
    if (r < 0)
      return;
    r = sd_bus_message_close_container(m);
  }
};

static void WriteHotspotSettings(SettingsWriter &w, const Device &device,
                                 const HotspotSettings &settings) {
  w.BeginGroup("connection");
  w.String("id", settings.ssid);
  w.String("type", "802-11-wireless");
  w.String("interface-name", device.interface);
  w.Bool("autoconnect", false);
  w.EndGroup();

  w.BeginGroup("802-11-wireless");
  w.Bytes("ssid", settings.ssid);
  w.String("mode", "ap");
  w.EndGroup();

  if (settings.passphrase) {
    w.BeginGroup("802-11-wireless-security");
    w.String("key-mgmt", "wpa-psk");
    w.String("psk", *settings.passphrase);
    w.EndGroup();
  }

  w.BeginGroup("ipv4");
  w.String("method", "manual");
  w.AddressData(settings.gateway, 24);
  w.EndGroup();

  w.BeginGroup("ipv6");
  w.String("method", "ignore");
  w.EndGroup();
}

// 5/13 characters are ASCII WEP keys, 10/26 hex WEP keys. Everything else is a
// passphrase that NetworkManager hashes into a key.
static U32 WepKeyType(StrView key) {
  switch (key.size()) {
  case 5:
  case 10:
  case 13:
  case 26:
    return 1;
  default:
    return 2;
  }
}

static void WriteJoinSettings(SettingsWriter &w, const AccessPoint &ap,
                              const Credentials &credentials) {
  w.BeginGroup("connection");
  w.String("id", ap.ssid);
  w.String("type", "802-11-wireless");
  w.EndGroup();

  w.BeginGroup("802-11-wireless");
  w.Bytes("ssid", ap.ssid);
  w.String("mode", "infrastructure");
  w.EndGroup();

  std::visit(overloaded{
                 [&](const credentials::Open &) {},
                 [&](const credentials::Wep &wep) {
                   w.BeginGroup("802-11-wireless-security");
                   w.String("key-mgmt", "none");
                   w.String("wep-key0", wep.key);
                   w.Uint("wep-key-type", WepKeyType(wep.key));
                   w.EndGroup();
                 },
                 [&](const credentials::Wpa &wpa) {
                   w.BeginGroup("802-11-wireless-security");
                   w.String("key-mgmt", "wpa-psk");
                   w.String("psk", wpa.passphrase);
                   w.EndGroup();
                 },
                 [&](const credentials::Enterprise &enterprise) {
                   w.BeginGroup("802-11-wireless-security");
                   w.String("key-mgmt", "wpa-eap");
                   w.EndGroup();
                   w.BeginGroup("802-1x");
                   w.StringList("eap", "peap");
                   w.String("identity", enterprise.identity);
                   w.String("password", enterprise.passphrase);
                   w.String("phase2-auth", "mschapv2");
                   w.EndGroup();
                 },
             },
             credentials);

  w.BeginGroup("ipv4");
  w.String("method", "auto");
  w.EndGroup();

  w.BeginGroup("ipv6");
  w.String("method", "auto");
  w.EndGroup();
}

// Reads the variant value of a setting if it has the expected signature.
// Otherwise skips it.
static int ReadSettingValue(sd_bus_message *m, Str &out, bool bytes) {
  char type;
  const char *contents = nullptr;
  int r = sd_bus_message_peek_type(m, &type, &contents);
  if (r < 0) {
    return r;
  }
  if (!bytes && contents && strcmp(contents, "s") == 0) {
    const char *value;
    r = sd_bus_message_read(m, "v", "s", &value);
    if (r >= 0) {
      out = value;
    }
    return r;
  }
  if (bytes && contents && strcmp(contents, "ay") == 0) {
    r = sd_bus_message_enter_container(m, 'v', "ay");
    if (r < 0) {
      return r;
    }
    const void *data;
    size_t size;
    r = sd_bus_message_read_array(m, 'y', &data, &size);
    if (r < 0) {
      return r;
    }
    out.assign((const char *)data, size);
    return sd_bus_message_exit_container(m);
  }
  return sd_bus_message_skip(m, "v");
}

// Parses the reply of Settings.Connection.GetSettings (a{sa{sv}}).
static int ReadProfile(sd_bus_message *m, Profile &profile) {
  int r = sd_bus_message_enter_container(m, 'a', "{sa{sv}}");
  if (r < 0) {
    return r;
  }
  while ((r = sd_bus_message_enter_container(m, 'e', "sa{sv}")) > 0) {
    const char *group;
    r = sd_bus_message_read(m, "s", &group);
    if (r < 0) {
      return r;
    }
    r = sd_bus_message_enter_container(m, 'a', "{sv}");
    if (r < 0) {
      return r;
    }
    while ((r = sd_bus_message_enter_container(m, 'e', "sv")) > 0) {
      const char *key;
      r = sd_bus_message_read(m, "s", &key);
      if (r < 0) {
        return r;
      }
      StrView g = group, k = key;
      if (g == "connection" && k == "id") {
        r = ReadSettingValue(m, profile.id, false);
      } else if (g == "connection" && k == "type") {
        r = ReadSettingValue(m, profile.type, false);
      } else if (g == "802-11-wireless" && k == "mode") {
        r = ReadSettingValue(m, profile.mode, false);
      } else if (g == "802-11-wireless" && k == "ssid") {
        r = ReadSettingValue(m, profile.ssid, true);
      } else {
        r = sd_bus_message_skip(m, "v");
      }
      if (r < 0) {
        return r;
      }
      r = sd_bus_message_exit_container(m);
      if (r < 0) {
        return r;
      }
    }
    if (r < 0) {
      return r;
    }
    r = sd_bus_message_exit_container(m);
    if (r < 0) {
      return r;
    }
    r = sd_bus_message_exit_container(m);
    if (r < 0) {
      return r;
    }
  }
  if (r < 0) {
    return r;
  }
  return sd_bus_message_exit_container(m);
}

DBusNetworkManager::DBusNetworkManager(Status &status) {
  int r = sd_bus_open_system(&bus);
  if (!Check(r, status, "Couldn't connect to the system bus")) {
    bus = nullptr;
    return;
  }
  VERBOSE << "Connected to the system bus";
}

DBusNetworkManager::~DBusNetworkManager() {
  if (bus) {
    sd_bus_flush_close_unref(bus);
  }
}

U32 DBusNetworkManager::GetU32(const char *destination, const ObjectPath &path,
                               const char *interface, const char *property,
                               Status &status) {
  BusError error;
  uint32_t value = 0;
  int r = sd_bus_get_property_trivial(bus, destination, path.c_str(), interface,
                                      property, &error.e, 'u', &value);
  Check(r, error, status, f("Couldn't read %s of %s", property, path.c_str()));
  return value;
}

Str DBusNetworkManager::GetString(const char *destination,
                                  const ObjectPath &path, const char *interface,
                                  const char *property, Status &status) {
  BusError error;
  char *value = nullptr;
  int r = sd_bus_get_property_string(bus, destination, path.c_str(), interface,
                                     property, &error.e, &value);
  if (!Check(r, error, status,
             f("Couldn't read %s of %s", property, path.c_str()))) {
    return "";
  }
  Str ret = value ? value : "";
  free(value);
  return ret;
}

Device DBusNetworkManager::DescribeDevice(const ObjectPath &path,
                                          Status &status) {
  Device device{.path = path};
  device.interface =
      GetString(kService, path, kDeviceInterface, "Interface", status);
  RETURN_VAL_ON_ERROR(status, device);
  device.type = (DeviceType)GetU32(kService, path, kDeviceInterface,
                                   "DeviceType", status);
  RETURN_VAL_ON_ERROR(status, device);
  return device;
}

Vec<Device> DBusNetworkManager::GetDevices(Status &status) {
  BusError error;
  Message reply;
  int r = sd_bus_call_method(bus, kService, kPath, kInterface, "GetDevices",
                             &error.e, &reply.m, "");
  if (!Check(r, error, status, "GetDevices failed")) {
    return {};
  }
  Vec<ObjectPath> paths;
  r = ReadObjectPaths(reply.m, paths);
  if (!Check(r, status, "Couldn't parse the device list")) {
    return {};
  }
  Vec<Device> devices;
  for (auto &path : paths) {
    devices.push_back(DescribeDevice(path, status));
    RETURN_VAL_ON_ERROR(status, {});
  }
  return devices;
}

Optional<Device> DBusNetworkManager::GetDeviceByInterface(StrView interface,
                                                          Status &status) {
  BusError error;
  Message reply;
  Str name(interface);
  int r = sd_bus_call_method(bus, kService, kPath, kInterface,
                             "GetDeviceByIpIface", &error.e, &reply.m, "s",
                             name.c_str());
  if (r < 0 && sd_bus_error_has_name(&error.e, kUnknownDeviceError)) {
    return std::nullopt;
  }
  if (!Check(r, error, status, "GetDeviceByIpIface(" + name + ") failed")) {
    return std::nullopt;
  }
  const char *path;
  r = sd_bus_message_read(reply.m, "o", &path);
  if (!Check(r, status, "Couldn't parse GetDeviceByIpIface reply")) {
    return std::nullopt;
  }
  auto device = DescribeDevice(path, status);
  RETURN_VAL_ON_ERROR(status, std::nullopt);
  return device;
}

DeviceState DBusNetworkManager::GetDeviceState(const Device &device,
                                               Status &status) {
  return (DeviceState)GetU32(kService, device.path, kDeviceInterface, "State",
                             status);
}

void DBusNetworkManager::RequestScan(const Device &device, Status &status) {
  BusError error;
  int r = sd_bus_call_method(bus, kService, device.path.c_str(),
                             kWirelessInterface, "RequestScan", &error.e,
                             nullptr, "a{sv}", 0);
  Check(r, error, status, "RequestScan on " + device.interface + " failed");
}

Vec<AccessPoint> DBusNetworkManager::GetAccessPoints(const Device &device,
                                                     Status &status) {
  BusError error;
  Message reply;
  int r = sd_bus_call_method(bus, kService, device.path.c_str(),
                             kWirelessInterface, "GetAllAccessPoints", &error.e,
                             &reply.m, "");
  if (!Check(r, error, status, "GetAllAccessPoints failed")) {
    return {};
  }
  Vec<ObjectPath> paths;
  r = ReadObjectPaths(reply.m, paths);
  if (!Check(r, status, "Couldn't parse the access point list")) {
    return {};
  }
  Vec<AccessPoint> access_points;
  for (auto &path : paths) {
    // Access points come & go while we read them. Those that vanished in the
    // meantime are skipped.
    Status ap_status;
    AccessPoint ap{.path = path};
    {
      BusError ssid_error;
      Message ssid_reply;
      r = sd_bus_get_property(bus, kService, path.c_str(),
                              kAccessPointInterface, "Ssid", &ssid_error.e,
                              &ssid_reply.m, "ay");
      if (!Check(r, ssid_error, ap_status, "Couldn't read Ssid")) {
        VERBOSE << "Skipping access point " << path << ": " << ap_status;
        continue;
      }
      const void *data;
      size_t size;
      r = sd_bus_message_read_array(ssid_reply.m, 'y', &data, &size);
      if (!Check(r, ap_status, "Couldn't parse Ssid")) {
        VERBOSE << "Skipping access point " << path << ": " << ap_status;
        continue;
      }
      ap.ssid.assign((const char *)data, size);
    }
    ap.flags = GetU32(kService, path, kAccessPointInterface, "Flags", ap_status);
    ap.wpa_flags =
        GetU32(kService, path, kAccessPointInterface, "WpaFlags", ap_status);
    ap.rsn_flags =
        GetU32(kService, path, kAccessPointInterface, "RsnFlags", ap_status);
    if (!OK(ap_status)) {
      VERBOSE << "Skipping access point " << path << ": " << ap_status;
      continue;
    }
    access_points.push_back(std::move(ap));
  }
  return access_points;
}

bool IsVanishedObject(StrView error_name) {
  return error_name == kInvalidConnectionError ||
         error_name == kUnknownObjectError ||
         error_name == kUnknownMethodError;
}

Vec<Profile> DBusNetworkManager::GetProfiles(Status &status) {
  BusError error;
  Message reply;
  int r = sd_bus_call_method(bus, kService, kSettingsPath, kSettingsInterface,
                             "ListConnections", &error.e, &reply.m, "");
  if (!Check(r, error, status, "ListConnections failed")) {
    return {};
  }
  Vec<ObjectPath> paths;
  r = ReadObjectPaths(reply.m, paths);
  if (!Check(r, status, "Couldn't parse the connection list")) {
    return {};
  }
  Vec<Profile> profiles;
  for (auto &path : paths) {
    BusError settings_error;
    Message settings;
    r = sd_bus_call_method(bus, kService, path.c_str(), kConnectionInterface,
                           "GetSettings", &settings_error.e, &settings.m, "");
    if (r < 0 && settings_error.e.name != nullptr &&
        IsVanishedObject(settings_error.e.name)) {
      VERBOSE << "Skipping connection " << path << ": "
              << settings_error.e.name;
      continue;
    }
    if (!Check(r, settings_error, status, "GetSettings of " + path + " failed")) {
      return {};
    }
    Profile profile{.path = path};
    r = ReadProfile(settings.m, profile);
    if (!Check(r, status, "Couldn't parse the settings of " + path)) {
      return {};
    }
    profiles.push_back(std::move(profile));
  }
  return profiles;
}

void DBusNetworkManager::DeleteProfile(const ObjectPath &path, Status &status) {
  BusError error;
  int r = sd_bus_call_method(bus, kService, path.c_str(), kConnectionInterface,
                             "Delete", &error.e, nullptr, "");
  Check(r, error, status, "Deleting " + path + " failed");
}

// Calls AddAndActivateConnection with the settings produced by `write`.
static Connection AddAndActivate(sd_bus *bus, const Device &device,
                                 const ObjectPath &specific_object,
                                 const std::function<void(SettingsWriter &)> &write,
                                 Status &status) {
  Message call;
  int r = sd_bus_message_new_method_call(bus, &call.m, kService, kPath,
                                         kInterface, "AddAndActivateConnection");
  if (!Check(r, status, "Couldn't create AddAndActivateConnection call")) {
    return {};
  }
  SettingsWriter writer(call.m);
  write(writer);
  writer.Finish();
  if (!Check(writer.r, status, "Couldn't encode connection settings")) {
    return {};
  }
  r = sd_bus_message_append(call.m, "oo", device.path.c_str(),
                            specific_object.c_str());
  if (!Check(r, status, "Couldn't encode AddAndActivateConnection")) {
    return {};
  }
  BusError error;
  Message reply;
  r = sd_bus_call(bus, call.m, 0, &error.e, &reply.m);
  if (!Check(r, error, status, "AddAndActivateConnection failed")) {
    return {};
  }
  const char *profile, *active;
  r = sd_bus_message_read(reply.m, "oo", &profile, &active);
  if (!Check(r, status, "Couldn't parse AddAndActivateConnection reply")) {
    return {};
  }
  return Connection{.profile = profile, .active = active};
}

Connection DBusNetworkManager::CreateHotspot(const Device &device,
                                             const HotspotSettings &settings,
                                             Status &status) {
  return AddAndActivate(
      bus, device, "/",
      [&](SettingsWriter &w) { WriteHotspotSettings(w, device, settings); },
      status);
}

void DBusNetworkManager::Deactivate(const ObjectPath &active, Status &status) {
  BusError error;
  int r = sd_bus_call_method(bus, kService, kPath, kInterface,
                             "DeactivateConnection", &error.e, nullptr, "o",
                             active.c_str());
  Check(r, error, status, "Deactivating " + active + " failed");
}

Connection DBusNetworkManager::Connect(const Device &device,
                                       const AccessPoint &ap,
                                       const Credentials &credentials,
                                       Status &status) {
  return AddAndActivate(
      bus, device, ap.path,
      [&](SettingsWriter &w) { WriteJoinSettings(w, ap, credentials); },
      status);
}

ActiveState DBusNetworkManager::GetActiveState(const ObjectPath &active,
                                               Status &status) {
  return (ActiveState)GetU32(kService, active, kActiveInterface, "State",
                             status);
}

Connectivity DBusNetworkManager::GetConnectivity(Status &status) {
  return (Connectivity)GetU32(kService, kPath, kInterface, "Connectivity",
                              status);
}

Str DBusNetworkManager::GetServiceState(Status &status) {
  BusError error;
  Message reply;
  int r = sd_bus_call_method(bus, kSystemdService, kSystemdPath,
                             kSystemdManagerInterface, "LoadUnit", &error.e,
                             &reply.m, "s", kUnitName);
  if (!Check(r, error, status, f("LoadUnit(%s) failed", kUnitName))) {
    return "";
  }
  const char *unit;
  r = sd_bus_message_read(reply.m, "o", &unit);
  if (!Check(r, status, "Couldn't parse LoadUnit reply")) {
    return "";
  }
  return GetString(kSystemdService, unit, kSystemdUnitInterface, "ActiveState",
                   status);
}

void DBusNetworkManager::StartService(Status &status) {
  BusError error;
  int r = sd_bus_call_method(bus, kSystemdService, kSystemdPath,
                             kSystemdManagerInterface, "StartUnit", &error.e,
                             nullptr, "ss", kUnitName, "replace");
  Check(r, error, status, f("StartUnit(%s) failed", kUnitName));
}

} // namespace nm
