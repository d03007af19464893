#include "connectivity.hh"

#include <gtest/gtest.h>

#include "fake_nm.hh"

using namespace portal;
using namespace std::chrono_literals;

namespace {

TEST(WaitForConnectivity, FullOrLimitedCounts) {
  fake::NetworkManager manager;
  manager.connectivity = nm::Connectivity::Full;
  EXPECT_TRUE(WaitForConnectivity(manager, 0ms, 0ms));
  manager.connectivity = nm::Connectivity::Limited;
  EXPECT_TRUE(WaitForConnectivity(manager, 0ms, 0ms));
}

TEST(WaitForConnectivity, TimesOutWithoutConnectivity) {
  fake::NetworkManager manager;
  manager.connectivity = nm::Connectivity::Portal;
  EXPECT_FALSE(WaitForConnectivity(manager, 30ms, 10ms));
  EXPECT_GE(manager.connectivity_checks, 2);
}

TEST(WaitForConnectivity, ErrorMeansNoConnectivity) {
  fake::NetworkManager manager;
  manager.fail_connectivity = true;
  EXPECT_FALSE(WaitForConnectivity(manager, 1s, 0ms));
  EXPECT_EQ(manager.connectivity_checks, 1);
}

TEST(WaitForActivation, PollsWhileActivating) {
  fake::NetworkManager manager;
  manager.join_states = {nm::ActiveState::Activating,
                         nm::ActiveState::Deactivated};
  Status status;
  auto state =
      WaitForActivation(manager, "/ActiveConnection/1", 1s, 0ms, status);
  EXPECT_TRUE(OK(status));
  EXPECT_EQ(state, nm::ActiveState::Deactivated);
  EXPECT_EQ(manager.active_state_reads, 2);
}

TEST(WaitForActivation, GivesUpAfterTimeout) {
  fake::NetworkManager manager;
  manager.join_states = {nm::ActiveState::Activating};
  Status status;
  auto state =
      WaitForActivation(manager, "/ActiveConnection/1", 20ms, 5ms, status);
  EXPECT_TRUE(OK(status));
  EXPECT_EQ(state, nm::ActiveState::Activating);
}

} // namespace
