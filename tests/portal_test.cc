#include "portal.hh"

#include <gtest/gtest.h>

#include "fake_nm.hh"

using namespace portal;

namespace {

class PortalManagerTest : public ::testing::Test {
protected:
  fake::NetworkManager manager;
  fake::Launcher launcher;
  Config config = fake::TestConfig();
  PortalManager portals{manager, launcher, config};
  nm::Device device = fake::WifiDevice();
};

TEST_F(PortalManagerTest, RaiseStartsHotspotAndHelper) {
  ExitResult error;
  auto session = portals.Raise(device, error);
  ASSERT_TRUE(session.has_value()) << error.ToStr();
  EXPECT_EQ(manager.CountAccessPointProfiles(), 1);
  EXPECT_EQ(manager.last_hotspot->gateway, IP(192, 168, 42, 1));
  ASSERT_EQ(launcher.options.size(), 1u);
  EXPECT_EQ(launcher.options[0].interface, "wlan0");
  EXPECT_EQ(launcher.options[0].gateway, IP(192, 168, 42, 1));
  EXPECT_EQ(launcher.options[0].dhcp_range, "192.168.42.2,192.168.42.254");
  EXPECT_EQ(launcher.running, 1);
}

TEST_F(PortalManagerTest, OpenPortalHasNoPassphrase) {
  config.passphrase.reset();
  ExitResult error;
  auto session = portals.Raise(device, error);
  ASSERT_TRUE(session.has_value());
  EXPECT_FALSE(manager.last_hotspot->passphrase.has_value());
}

TEST_F(PortalManagerTest, HotspotFailureReported) {
  manager.fail_create_hotspot = true;
  ExitResult error;
  EXPECT_FALSE(portals.Raise(device, error).has_value());
  EXPECT_EQ(error.kind, ErrorKind::CreateCaptivePortal);
  EXPECT_EQ(error.subject, "HalleyHub-abc");
  EXPECT_TRUE(launcher.options.empty());
}

TEST_F(PortalManagerTest, HelperWaitsForHotspotActivation) {
  config.timing.activation_timeout = std::chrono::seconds(5);
  manager.hotspot_states = {nm::ActiveState::Activating,
                            nm::ActiveState::Activating,
                            nm::ActiveState::Activated};
  ExitResult error;
  auto session = portals.Raise(device, error);
  ASSERT_TRUE(session.has_value()) << error.ToStr();
  EXPECT_EQ(manager.hotspot_state_reads, 3);
  EXPECT_EQ(launcher.running, 1);
}

TEST_F(PortalManagerTest, DeactivatedHotspotIsNotAPortal) {
  manager.hotspot_states = {nm::ActiveState::Activating,
                            nm::ActiveState::Deactivated};
  config.timing.activation_timeout = std::chrono::seconds(5);
  ExitResult error;
  EXPECT_FALSE(portals.Raise(device, error).has_value());
  EXPECT_EQ(error.kind, ErrorKind::CreateCaptivePortal);
  EXPECT_EQ(error.subject, "HalleyHub-abc");
  EXPECT_TRUE(launcher.options.empty());
  EXPECT_EQ(manager.CountAccessPointProfiles(), 0);
  EXPECT_TRUE(manager.active.empty());
}

TEST_F(PortalManagerTest, HelperFailureRemovesHotspot) {
  launcher.fail = true;
  ExitResult error;
  EXPECT_FALSE(portals.Raise(device, error).has_value());
  EXPECT_EQ(error.kind, ErrorKind::StartHelper);
  EXPECT_EQ(manager.CountAccessPointProfiles(), 0);
  EXPECT_TRUE(manager.active.empty());
}

TEST_F(PortalManagerTest, StopContinuesAfterFailedStep) {
  ExitResult error;
  auto session = portals.Raise(device, error);
  ASSERT_TRUE(session.has_value());
  manager.fail_deactivate = true;
  portals.Stop(*session);
  EXPECT_EQ(launcher.running, 0);
  EXPECT_EQ(manager.deactivations, 1);
  EXPECT_EQ(manager.CountAccessPointProfiles(), 0);
}

} // namespace
