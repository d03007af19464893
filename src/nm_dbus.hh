#pragma once

#include <source_location>

#include "nm.hh"

typedef struct sd_bus sd_bus;

namespace nm {

// NetworkManager reached over the system D-Bus (using sd-bus from libsystemd).
//
// The NetworkManager systemd unit is controlled through org.freedesktop.systemd1
// on the same bus.
//
// Not thread-safe. Calls may come from different threads as long as they never
// overlap.
struct DBusNetworkManager : NetworkManager {
  sd_bus *bus = nullptr;

  // Connects to the system bus.
  DBusNetworkManager(Status &);
  ~DBusNetworkManager() override;

  DBusNetworkManager(const DBusNetworkManager &) = delete;
  DBusNetworkManager &operator=(const DBusNetworkManager &) = delete;

  Vec<Device> GetDevices(Status &) override;
  Optional<Device> GetDeviceByInterface(StrView interface, Status &) override;
  DeviceState GetDeviceState(const Device &, Status &) override;
  void RequestScan(const Device &, Status &) override;
  Vec<AccessPoint> GetAccessPoints(const Device &, Status &) override;
  Vec<Profile> GetProfiles(Status &) override;
  void DeleteProfile(const ObjectPath &, Status &) override;
  Connection CreateHotspot(const Device &, const HotspotSettings &,
                           Status &) override;
  void Deactivate(const ObjectPath &active, Status &) override;
  Connection Connect(const Device &, const AccessPoint &, const Credentials &,
                     Status &) override;
  ActiveState GetActiveState(const ObjectPath &active, Status &) override;
  Connectivity GetConnectivity(Status &) override;
  Str GetServiceState(Status &) override;
  void StartService(Status &) override;

  Device DescribeDevice(const ObjectPath &, Status &);
  U32 GetU32(const char *destination, const ObjectPath &path,
             const char *interface, const char *property, Status &);
  Str GetString(const char *destination, const ObjectPath &path,
                const char *interface, const char *property, Status &);
};

// True for D-Bus errors meaning that the object was removed before it could be
// read (for example a profile deleted between ListConnections & GetSettings).
bool IsVanishedObject(StrView error_name);

} // namespace nm
