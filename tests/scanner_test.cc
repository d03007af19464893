#include "scanner.hh"

#include <gtest/gtest.h>

#include "fake_nm.hh"

using namespace portal;

namespace {

TEST(FilterAccessPoints, DropsOwnAndInvalidSSIDs) {
  auto filtered = FilterAccessPoints(
      {fake::OpenAP("Cafe"), fake::OpenAP("Portal"), fake::OpenAP("\xc0\xaf"),
       fake::OpenAP("Caf\xc3\xa9")},
      "Portal");
  ASSERT_EQ(filtered.size(), 2u);
  EXPECT_EQ(filtered[0].ssid, "Cafe");
  EXPECT_EQ(filtered[1].ssid, "Caf\xc3\xa9");
}

TEST(ScanAccessPoints, RetriesUntilSomethingIsVisible) {
  fake::NetworkManager manager;
  manager.access_points = {fake::OpenAP("Cafe")};
  manager.empty_reads = 2;
  Status status;
  auto aps = ScanAccessPoints(manager, fake::WifiDevice(), "Portal",
                              Timing::Immediate(5), status);
  ASSERT_TRUE(OK(status)) << status.ToStr();
  EXPECT_EQ(aps.size(), 1u);
  EXPECT_EQ(manager.access_point_reads, 3);
  EXPECT_EQ(manager.scan_requests, 1);
}

TEST(ScanAccessPoints, GivesUpAfterAllAttempts) {
  fake::NetworkManager manager;
  manager.access_points = {fake::OpenAP("Portal")};
  Status status;
  auto aps = ScanAccessPoints(manager, fake::WifiDevice(), "Portal",
                              Timing::Immediate(4), status);
  EXPECT_TRUE(OK(status)) << status.ToStr();
  EXPECT_TRUE(aps.empty());
  EXPECT_EQ(manager.access_point_reads, 4);
}

TEST(ScanAccessPoints, IgnoresScanRequestFailure) {
  fake::NetworkManager manager;
  manager.access_points = {fake::OpenAP("Cafe")};
  manager.fail_request_scan = true;
  Status status;
  auto aps = ScanAccessPoints(manager, fake::WifiDevice(), "Portal",
                              Timing::Immediate(), status);
  EXPECT_TRUE(OK(status)) << status.ToStr();
  EXPECT_EQ(aps.size(), 1u);
}

TEST(ScanAccessPoints, PropagatesReadFailure) {
  fake::NetworkManager manager;
  manager.fail_get_access_points = true;
  Status status;
  auto aps = ScanAccessPoints(manager, fake::WifiDevice(), "Portal",
                              Timing::Immediate(), status);
  EXPECT_FALSE(OK(status));
  EXPECT_TRUE(aps.empty());
  EXPECT_EQ(manager.access_point_reads, 1);
}

} // namespace
