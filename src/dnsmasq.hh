#pragma once

// DHCP & DNS for clients of the captive portal, provided by a dnsmasq process.

#include <sys/types.h>

#include "ip.hh"
#include "status.hh"
#include "str.hh"
#include "unique_ptr.hh"
#include "vec.hh"

namespace dnsmasq {

using portal::IP;
using portal::Status;
using portal::Str;
using portal::UniquePtr;
using portal::Vec;

struct Options {
  IP gateway;
  Str dhcp_range;
  Str interface;
};

// Arguments (without the program name) that make dnsmasq answer every DNS query
// with the gateway address & hand out leases from the configured range.
Vec<Str> CommandLine(const Options &);

// Running helper. Destroying it stops the helper.
struct Instance {
  virtual ~Instance() = default;
};

struct Launcher {
  virtual ~Launcher() = default;
  virtual UniquePtr<Instance> Start(const Options &, Status &) = 0;
};

// Child process. The destructor sends SIGTERM, then SIGKILL if the process
// didn't exit within a second, and reaps it.
struct Process : Instance {
  pid_t pid;

  Process(pid_t pid) : pid(pid) {}
  ~Process() override;

  Process(const Process &) = delete;
  Process &operator=(const Process &) = delete;
};

// Starts `binary` (looked up in PATH) with `CommandLine` arguments.
struct ProcessLauncher : Launcher {
  Str binary = "dnsmasq";

  UniquePtr<Instance> Start(const Options &, Status &) override;
};

} // namespace dnsmasq
