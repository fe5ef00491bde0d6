#pragma once

// hostcall/program_loader.hpp — Starting a guest program and wiring its pipes.
//
// The guest runs as a child process. Its stdout carries requests to the
// bridge, its stdin carries responses back; its stderr is inherited. The
// first line the guest reads is the launch frame:
//
//   {"flags":{"arguments":[...],"platform":"posix","environmentVariables":[["K","V"],...]}}
//
// ARTIFACTS:
//   *.js   run through the configured JavaScript runner (HOSTCALL_JS_RUNNER)
//   other  must be an executable file and is run directly

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>
#include <utility>
#include <vector>

#include "hostcall/channel.hpp"
#include "hostcall/types.hpp"

namespace hostcall {

struct LaunchFlags {
  std::vector<std::string> arguments;
  std::string platform;
  std::vector<std::pair<std::string, std::string>> environment_variables;
};

// "posix" or "windows"; nullopt on any other host.
std::optional<std::string> detect_platform();

// Environment taken from envp ("NAME=value" strings, null-terminated).
LaunchFlags make_launch_flags(std::vector<std::string> arguments, std::string platform,
                              char** envp);

// The complete launch frame, {"flags": {...}}.
std::string flags_to_json(const LaunchFlags& flags);

struct LaunchResult {
  bool ok{false};
  ErrorCode error_code{ErrorCode::none};
  std::string message;
};

// A running guest. Destruction closes both pipes and reaps the child; a guest
// that has not exited by then is killed.
class GuestProcess {
 public:
  GuestProcess(pid_t pid, int request_fd, int response_fd);
  ~GuestProcess();
  GuestProcess(const GuestProcess&) = delete;
  GuestProcess& operator=(const GuestProcess&) = delete;

  Channel& channel() { return channel_; }
  pid_t pid() const { return pid_; }

 private:
  pid_t pid_{-1};
  FdChannel channel_;
};

class ProgramLoader {
 public:
  virtual ~ProgramLoader() = default;

  // Starts the guest and sends the launch frame. Returns nullptr with
  // *result describing the failure when the guest cannot be started.
  virtual std::unique_ptr<GuestProcess> launch(const std::filesystem::path& program,
                                               const LaunchFlags& flags,
                                               LaunchResult* result) = 0;
};

class ExecutableLoader : public ProgramLoader {
 public:
  explicit ExecutableLoader(std::string js_runner) : js_runner_(std::move(js_runner)) {}

  std::unique_ptr<GuestProcess> launch(const std::filesystem::path& program,
                                       const LaunchFlags& flags,
                                       LaunchResult* result) override;

 private:
  std::string js_runner_;
};

}  // namespace hostcall
