#include "dnsmasq.hh"

#include <csignal>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include "format.hh"
#include "log.hh"
#include "timing.hh"

using namespace portal;

namespace dnsmasq {

Vec<Str> CommandLine(const Options &options) {
  Str gateway = ToStr(options.gateway);
  return {
      f("--address=/#/%s", gateway.c_str()),
      "--dhcp-range=" + options.dhcp_range,
      f("--dhcp-option=option:router,%s", gateway.c_str()),
      "--interface=" + options.interface,
      "--keep-in-foreground",
      "--bind-interfaces",
      "--except-interface=lo",
      "--conf-file",
      "--no-hosts",
  };
}

Process::~Process() {
  if (pid <= 0) {
    return;
  }
  kill(pid, SIGTERM);
  for (int i = 0; i < 20; ++i) {
    int wstatus;
    pid_t r = waitpid(pid, &wstatus, WNOHANG);
    if (r == pid || (r == -1 && errno == ECHILD)) {
      errno = 0;
      VERBOSE << "dnsmasq (PID=" << (int)pid << ") stopped";
      return;
    }
    Sleep(std::chrono::milliseconds(50));
  }
  WARNING << "dnsmasq (PID=" << (int)pid << ") ignored SIGTERM. Killing it.";
  kill(pid, SIGKILL);
  waitpid(pid, nullptr, 0);
}

UniquePtr<Instance> ProcessLauncher::Start(const Options &options,
                                           Status &status) {
  Vec<Str> args = CommandLine(options);
  Vec<char *> argv;
  argv.push_back(binary.data());
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);

  // Reports exec failures. Closed automatically when exec succeeds.
  int status_pipe[2];
  if (pipe2(status_pipe, O_CLOEXEC) == -1) {
    AppendErrorMessage(status) += "pipe2()";
    return nullptr;
  }

  pid_t pid = fork();
  if (pid == -1) {
    AppendErrorMessage(status) += "fork()";
    close(status_pipe[0]);
    close(status_pipe[1]);
    return nullptr;
  }
  if (pid == 0) {
    close(status_pipe[0]);
    // Signals blocked for signalfd would otherwise stay blocked in dnsmasq.
    sigset_t empty;
    sigemptyset(&empty);
    sigprocmask(SIG_SETMASK, &empty, nullptr);
    execvp(argv[0], argv.data());
    int err = errno;
    (void)!write(status_pipe[1], &err, sizeof(err));
    _exit(127);
  }

  close(status_pipe[1]);
  int child_errno = 0;
  ssize_t n;
  do {
    n = read(status_pipe[0], &child_errno, sizeof(child_errno));
  } while (n == -1 && errno == EINTR);
  close(status_pipe[0]);
  if (n == sizeof(child_errno)) {
    waitpid(pid, nullptr, 0);
    errno = child_errno;
    AppendErrorMessage(status) += "Couldn't execute " + binary;
    return nullptr;
  }
  errno = 0;

  LOG << "Started dnsmasq (PID=" << (int)pid << ") on " << options.interface;
  return std::make_unique<Process>(pid);
}

} // namespace dnsmasq
