#include <cstdio>
#include <thread>

#include "api.hh"
#include "channel.hh"
#include "config.hh"
#include "dnsmasq.hh"
#include "epoll.hh"
#include "log.hh"
#include "nm_dbus.hh"
#include "orchestrator.hh"
#include "startup.hh"
#include "status.hh"
#include "supervisor.hh"
#include "systemd.hh"

using namespace portal;

int main(int argc, char *argv[]) {
  Status status;
  ConfigAction action = ConfigAction::Run;
  Config config = LoadConfig(argc, argv, ProcessEnvironment(), action, status);
  if (action == ConfigAction::Help) {
    printf("%s", Usage(argv[0]).c_str());
    return 0;
  }
  if (action == ConfigAction::Version) {
    printf("wifi-portal %s\n", kVersion);
    return 0;
  }
  if (!OK(status)) {
    fprintf(stderr, "%s", Usage(argv[0]).c_str());
    return ExitCode(
        ExitResult::Failure(ErrorKind::Configuration, std::move(status)));
  }
  min_log_level = config.log_level;

  epoll::Init(status);
  if (!OK(status)) {
    ERROR << status;
    return 1;
  }
  systemd::Init();
  LOG << "Starting wifi-portal " << kVersion;

  Channel<Command> commands;
  ExitSupervisor supervisor(commands);
  // Signals are blocked before the orchestrator thread is started, so that it
  // inherits the mask.
  supervisor.HookSignals(status);
  if (!OK(status)) {
    return ExitCode(
        ExitResult::Failure(ErrorKind::HookSignals, std::move(status)));
  }
  supervisor.Open(status);
  if (!OK(status)) {
    return ExitCode(
        ExitResult::Failure(ErrorKind::HookSignals, std::move(status)));
  }

  nm::DBusNetworkManager manager(status);
  if (!OK(status)) {
    return ExitCode(ExitResult::Failure(ErrorKind::ConnectNetworkManager,
                                        std::move(status)));
  }

  if (auto result = InitNetworking(manager, config.timing); !result.Ok()) {
    return ExitCode(result);
  }

  nm::Device device;
  if (auto result = LocateDevice(manager, config.interface, device);
      !result.Ok()) {
    return ExitCode(result);
  }

  dnsmasq::ProcessLauncher launcher;
  api::PortalAPI api(config, commands);
  Orchestrator orchestrator(manager, launcher, config, device, commands,
                            api.responses);
  if (auto result = orchestrator.Start(); !result.Ok()) {
    return ExitCode(result);
  }

  api.Start(status);
  if (!OK(status)) {
    return ExitCode(ExitResult::Failure(ErrorKind::StartHTTPServer,
                                        std::move(status),
                                        config.listening.ToStr()));
  }

  supervisor.ArmActivityTimer(config.activity_timeout_s, status);
  if (!OK(status)) {
    ERROR << "Couldn't start the activity timer: " << status;
    status.Reset();
  }

  supervisor.on_exit = [&](const ExitResult &result) {
    api.FailPending(result);
    api.Stop();
  };

  std::thread orchestrator_thread([&] {
    ExitResult result = orchestrator.Run();
    if (!supervisor.results.Send(std::move(result))) {
      ERROR << "Orchestrator finished after the event loop";
    }
  });

  systemd::SetStatus("Managing " + device.interface);
  systemd::Ready();

  epoll::Loop(status);
  if (!OK(status)) {
    ERROR << "Event loop failed: " << status;
    if (!commands.Send(command::Exit{})) {
      VERBOSE << "Orchestrator is already gone";
    }
  }
  orchestrator_thread.join();

  if (!supervisor.result) {
    return 1;
  }
  return ExitCode(*supervisor.result);
}
