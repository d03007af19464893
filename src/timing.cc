#include "timing.hh"

#include <thread>

namespace portal {

void Sleep(Duration d) {
  if (d > Duration::zero()) {
    std::this_thread::sleep_for(d);
  }
}

} // namespace portal
