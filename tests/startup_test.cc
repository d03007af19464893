#include "startup.hh"

#include <gtest/gtest.h>

#include "fake_nm.hh"

using namespace portal;

namespace {

TEST(InitNetworking, LeavesRunningServiceAlone) {
  fake::NetworkManager manager;
  EXPECT_TRUE(InitNetworking(manager, Timing::Immediate()).Ok());
  EXPECT_EQ(manager.service_starts, 0);
}

TEST(InitNetworking, StartsInactiveService) {
  fake::NetworkManager manager;
  manager.service_state = "inactive";
  auto result = InitNetworking(manager, Timing::Immediate());
  EXPECT_TRUE(result.Ok()) << result.ToStr();
  EXPECT_EQ(manager.service_starts, 1);
}

TEST(InitNetworking, ServiceThatNeverActivates) {
  fake::NetworkManager manager;
  manager.service_state = "inactive";
  manager.service_state_after_start = "activating";
  auto result = InitNetworking(manager, Timing::Immediate());
  EXPECT_EQ(result.kind, ErrorKind::StartActiveNetworkManager);
  EXPECT_EQ(result.subject, "activating");
}

TEST(InitNetworking, ServiceStartFailure) {
  fake::NetworkManager manager;
  manager.service_state = "failed";
  manager.fail_start_service = true;
  EXPECT_EQ(InitNetworking(manager, Timing::Immediate()).kind,
            ErrorKind::StartNetworkManager);
}

TEST(InitNetworking, UnknownServiceStateIsTolerated) {
  fake::NetworkManager manager;
  manager.fail_service_state = true;
  EXPECT_TRUE(InitNetworking(manager, Timing::Immediate()).Ok());
  EXPECT_EQ(manager.service_starts, 0);
}

TEST(InitNetworking, DeletesLeftoverHotspotProfiles) {
  fake::NetworkManager manager;
  Status status;
  manager.CreateHotspot(fake::WifiDevice(),
                        nm::HotspotSettings{.ssid = "HalleyHub-old"}, status);
  manager.profiles.push_back(fake::WifiProfile("/Settings/1", "Home"));
  EXPECT_TRUE(InitNetworking(manager, Timing::Immediate()).Ok());
  ASSERT_EQ(manager.profiles.size(), 1u);
  EXPECT_EQ(manager.profiles[0].id, "Home");
}

TEST(InitNetworking, ProfileListingFailure) {
  fake::NetworkManager manager;
  manager.fail_get_profiles = true;
  EXPECT_EQ(InitNetworking(manager, Timing::Immediate()).kind,
            ErrorKind::DeleteAccessPointProfiles);
}

TEST(LocateDevice, PicksFirstWiFiDevice) {
  fake::NetworkManager manager;
  nm::Device device;
  EXPECT_TRUE(LocateDevice(manager, std::nullopt, device).Ok());
  EXPECT_EQ(device.interface, "wlan0");
}

TEST(LocateDevice, NoWiFiDevice) {
  fake::NetworkManager manager;
  manager.devices.pop_back();
  nm::Device device;
  EXPECT_EQ(LocateDevice(manager, std::nullopt, device).kind,
            ErrorKind::NoWiFiDevice);
}

TEST(LocateDevice, ByInterface) {
  fake::NetworkManager manager;
  nm::Device device;
  EXPECT_TRUE(LocateDevice(manager, Str("wlan0"), device).Ok());
  EXPECT_EQ(device.path, "/Devices/3");

  auto missing = LocateDevice(manager, Str("wlan7"), device);
  EXPECT_EQ(missing.kind, ErrorKind::DeviceByInterface);
  EXPECT_EQ(missing.subject, "wlan7");

  auto wired = LocateDevice(manager, Str("eth0"), device);
  EXPECT_EQ(wired.kind, ErrorKind::NotAWiFiDevice);
  EXPECT_EQ(wired.subject, "eth0");
}

} // namespace
