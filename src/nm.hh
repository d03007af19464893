#pragma once

// Narrow view of the NetworkManager service.
//
// Only the calls needed to run a captive portal on a single wireless device
// are exposed. `nm::DBusNetworkManager` (nm_dbus.hh) talks to the real
// service; tests substitute their own implementation.

#include "int.hh"
#include "ip.hh"
#include "optional.hh"
#include "status.hh"
#include "str.hh"
#include "variant.hh"
#include "vec.hh"

namespace nm {

using portal::IP;
using portal::Optional;
using portal::Status;
using portal::Str;
using portal::StrView;
using portal::U32;
using portal::Vec;

// D-Bus object path of a NetworkManager object.
using ObjectPath = Str;

// Values of `org.freedesktop.NetworkManager.Device.DeviceType`.
enum class DeviceType : U32 {
  Unknown = 0,
  Ethernet = 1,
  WiFi = 2,
};

// Values of `org.freedesktop.NetworkManager.Device.State`.
enum class DeviceState : U32 {
  Unknown = 0,
  Unmanaged = 10,
  Unavailable = 20,
  Disconnected = 30,
  Prepare = 40,
  Config = 50,
  NeedAuth = 60,
  IPConfig = 70,
  IPCheck = 80,
  Secondaries = 90,
  Activated = 100,
  Deactivating = 110,
  Failed = 120,
};

// Values of `org.freedesktop.NetworkManager.Connection.Active.State`.
enum class ActiveState : U32 {
  Unknown = 0,
  Activating = 1,
  Activated = 2,
  Deactivating = 3,
  Deactivated = 4,
};

// Values of `org.freedesktop.NetworkManager.Connectivity`.
enum class Connectivity : U32 {
  Unknown = 0,
  None = 1,
  Portal = 2,
  Limited = 3,
  Full = 4,
};

enum class Security { None, WEP, WPA, Enterprise };

// Name used in the HTTP API: "none", "wep", "wpa" or "enterprise".
StrView SecurityName(Security);

// Access point flag bits (NM80211ApFlags & NM80211ApSecurityFlags).
constexpr U32 kApFlagPrivacy = 0x1;
constexpr U32 kApSecurityKeyMgmtPSK = 0x100;
constexpr U32 kApSecurityKeyMgmt8021X = 0x200;

Security ClassifySecurity(U32 flags, U32 wpa_flags, U32 rsn_flags);

struct Device {
  ObjectPath path;
  Str interface;
  DeviceType type = DeviceType::Unknown;
};

struct AccessPoint {
  ObjectPath path;
  Str ssid; // raw bytes, not necessarily valid UTF-8
  U32 flags = 0;
  U32 wpa_flags = 0;
  U32 rsn_flags = 0;

  Security GetSecurity() const {
    return ClassifySecurity(flags, wpa_flags, rsn_flags);
  }
};

// Stored connection profile (org.freedesktop.NetworkManager.Settings.Connection).
struct Profile {
  ObjectPath path;
  Str id;
  Str type; // "802-11-wireless", "802-3-ethernet", ...
  Str mode; // "infrastructure", "ap", "adhoc" or "" for non-wireless
  Str ssid;

  bool IsWireless() const { return type == "802-11-wireless"; }
  bool IsAccessPoint() const { return IsWireless() && mode == "ap"; }
};

// True if any wireless profile other than a hotspot is stored.
bool HasConnectionDefined(const Vec<Profile> &);

// Stored profile together with its activation.
struct Connection {
  ObjectPath profile;
  ObjectPath active;
};

namespace credentials {
struct Open {};
struct Wep {
  Str key;
};
struct Wpa {
  Str passphrase;
};
struct Enterprise {
  Str identity;
  Str passphrase;
};
} // namespace credentials

using Credentials =
    std::variant<credentials::Open, credentials::Wep, credentials::Wpa,
                 credentials::Enterprise>;

// Picks the credential shape required by the given security class.
Credentials MakeCredentials(Security, StrView identity, StrView passphrase);

struct HotspotSettings {
  Str ssid;
  Optional<Str> passphrase;
  IP gateway;
};

struct NetworkManager {
  virtual ~NetworkManager() = default;

  virtual Vec<Device> GetDevices(Status &) = 0;

  // Returns an empty Optional if no device has the given interface name.
  virtual Optional<Device> GetDeviceByInterface(StrView interface,
                                                Status &) = 0;

  virtual DeviceState GetDeviceState(const Device &, Status &) = 0;

  // Asks the device to rescan. Fails when a scan is already in progress.
  virtual void RequestScan(const Device &, Status &) = 0;

  virtual Vec<AccessPoint> GetAccessPoints(const Device &, Status &) = 0;

  virtual Vec<Profile> GetProfiles(Status &) = 0;

  virtual void DeleteProfile(const ObjectPath &, Status &) = 0;

  // Stores & activates a hotspot profile on the device.
  virtual Connection CreateHotspot(const Device &, const HotspotSettings &,
                                   Status &) = 0;

  virtual void Deactivate(const ObjectPath &active, Status &) = 0;

  // Stores & starts activating a profile that joins the given access point.
  // Returns as soon as NetworkManager accepted the request.
  virtual Connection Connect(const Device &, const AccessPoint &,
                             const Credentials &, Status &) = 0;

  virtual ActiveState GetActiveState(const ObjectPath &active, Status &) = 0;

  virtual Connectivity GetConnectivity(Status &) = 0;

  // systemd ActiveState of the NetworkManager unit ("active", "inactive", ...).
  virtual Str GetServiceState(Status &) = 0;

  // Asks systemd to start the NetworkManager unit.
  virtual void StartService(Status &) = 0;
};

} // namespace nm
