#pragma once

#include <chrono>

namespace portal {

using Duration = std::chrono::milliseconds;

// Delays & bounds used while talking to NetworkManager.
struct Timing {
  // Wait after a scan request before reading the results.
  Duration scan_settle = std::chrono::seconds(4);
  int scan_attempts = 10;
  Duration scan_retry = std::chrono::seconds(1);

  // Wait after the hotspot was torn down, so the radio can settle.
  Duration portal_stop_settle = std::chrono::seconds(1);

  Duration connectivity_timeout = std::chrono::seconds(20);
  Duration connectivity_poll = std::chrono::seconds(1);

  Duration service_start_timeout = std::chrono::seconds(15);
  Duration service_poll = std::chrono::seconds(1);

  Duration activation_timeout = std::chrono::seconds(60);
  Duration activation_poll = std::chrono::seconds(1);

  // No delays at all. Scans are attempted `attempts` times.
  static Timing Immediate(int attempts = 10) {
    return Timing{.scan_settle = Duration::zero(),
                  .scan_attempts = attempts,
                  .scan_retry = Duration::zero(),
                  .portal_stop_settle = Duration::zero(),
                  .connectivity_timeout = Duration::zero(),
                  .connectivity_poll = Duration::zero(),
                  .service_start_timeout = Duration::zero(),
                  .service_poll = Duration::zero(),
                  .activation_timeout = Duration::zero(),
                  .activation_poll = Duration::zero()};
  }
};

void Sleep(Duration);

} // namespace portal
