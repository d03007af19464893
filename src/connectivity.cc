#include "connectivity.hh"

#include "log.hh"

namespace portal {

using Clock = std::chrono::steady_clock;

bool WaitForConnectivity(nm::NetworkManager &manager, Duration timeout,
                         Duration poll) {
  auto deadline = Clock::now() + timeout;
  while (true) {
    Status status;
    auto connectivity = manager.GetConnectivity(status);
    if (!OK(status)) {
      ERROR << "Getting Internet connectivity failed: " << status;
      return false;
    }
    if (connectivity == nm::Connectivity::Full ||
        connectivity == nm::Connectivity::Limited) {
      VERBOSE << "Connectivity established: " << (U32)connectivity;
      return true;
    }
    if (Clock::now() >= deadline) {
      return false;
    }
    Sleep(poll);
  }
}

nm::ActiveState WaitForActivation(nm::NetworkManager &manager,
                                  const nm::ObjectPath &active,
                                  Duration timeout, Duration poll,
                                  Status &status) {
  auto deadline = Clock::now() + timeout;
  while (true) {
    auto state = manager.GetActiveState(active, status);
    if (!OK(status)) {
      AppendErrorMessage(status) += "Couldn't read the state of " + active;
      return nm::ActiveState::Unknown;
    }
    if (state != nm::ActiveState::Activating) {
      return state;
    }
    if (Clock::now() >= deadline) {
      return state;
    }
    Sleep(poll);
  }
}

} // namespace portal
