#ifndef _WIN32

#include "hostcall/program_loader.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

#include "hostcall/jsonlite.hpp"

namespace fs = std::filesystem;

namespace hostcall {

namespace {

constexpr auto kReapGrace = std::chrono::milliseconds(200);
constexpr auto kReapPoll = std::chrono::milliseconds(5);

bool make_pipe(int fds[2]) {
  if (::pipe(fds) != 0) return false;
  ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
  ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
  return true;
}

void close_fd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

std::unique_ptr<GuestProcess> launch_error(LaunchResult* result, std::string message) {
  result->ok = false;
  result->error_code = ErrorCode::launch_failed;
  result->message = std::move(message);
  return nullptr;
}

}  // namespace

std::optional<std::string> detect_platform() {
#if defined(__linux__) || defined(__APPLE__)
  return std::string("posix");
#else
  return std::nullopt;
#endif
}

LaunchFlags make_launch_flags(std::vector<std::string> arguments, std::string platform,
                              char** envp) {
  LaunchFlags flags;
  flags.arguments = std::move(arguments);
  flags.platform = std::move(platform);
  for (char** e = envp; e && *e; ++e) {
    const std::string entry(*e);
    const auto eq = entry.find('=');
    if (eq == std::string::npos || eq == 0) continue;
    flags.environment_variables.emplace_back(entry.substr(0, eq), entry.substr(eq + 1));
  }
  return flags;
}

std::string flags_to_json(const LaunchFlags& flags) {
  jsonlite::Array args;
  for (const auto& a : flags.arguments) args.emplace_back(a);
  jsonlite::Array env;
  for (const auto& [name, value] : flags.environment_variables) {
    env.emplace_back(jsonlite::Array{name, value});
  }

  jsonlite::Object body;
  body["arguments"] = std::move(args);
  body["platform"] = flags.platform;
  body["environmentVariables"] = std::move(env);

  jsonlite::Object frame;
  frame["flags"] = std::move(body);
  return jsonlite::to_json(frame);
}

GuestProcess::GuestProcess(pid_t pid, int request_fd, int response_fd)
    : pid_(pid), channel_(request_fd, response_fd, true) {}

GuestProcess::~GuestProcess() {
  channel_.close_write();
  if (pid_ <= 0) return;

  int status = 0;
  const auto deadline = std::chrono::steady_clock::now() + kReapGrace;
  while (true) {
    const pid_t w = ::waitpid(pid_, &status, WNOHANG);
    if (w == pid_) return;
    if (w < 0 && errno != EINTR) return;
    if (std::chrono::steady_clock::now() >= deadline) break;
    std::this_thread::sleep_for(kReapPoll);
  }
  ::kill(pid_, SIGKILL);
  while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
  }
}

std::unique_ptr<GuestProcess> ExecutableLoader::launch(const fs::path& program,
                                                       const LaunchFlags& flags,
                                                       LaunchResult* result) {
  *result = LaunchResult{};

  std::error_code ec;
  const fs::path abs = fs::absolute(program, ec).lexically_normal();
  if (ec) return launch_error(result, ec.message() + ": " + program.string());
  if (!fs::is_regular_file(abs, ec)) {
    return launch_error(result, "Could not find program " + abs.string());
  }

  std::vector<std::string> all;
  if (abs.extension() == ".js") {
    all = {js_runner_, abs.string()};
  } else {
    if (::access(abs.c_str(), X_OK) != 0) {
      return launch_error(result, std::string(std::strerror(errno)) + ": " + abs.string());
    }
    all = {abs.string()};
  }
  std::vector<char*> argv;
  for (auto& s : all) argv.push_back(s.data());
  argv.push_back(nullptr);

  int to_guest[2] = {-1, -1};
  int from_guest[2] = {-1, -1};
  int status_pipe[2] = {-1, -1};
  if (!make_pipe(to_guest) || !make_pipe(from_guest) || !make_pipe(status_pipe)) {
    const std::string reason = std::strerror(errno);
    for (int* fd : {&to_guest[0], &to_guest[1], &from_guest[0], &from_guest[1],
                    &status_pipe[0], &status_pipe[1]}) {
      close_fd(*fd);
    }
    return launch_error(result, "cannot create pipe: " + reason);
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    const std::string reason = std::strerror(errno);
    for (int* fd : {&to_guest[0], &to_guest[1], &from_guest[0], &from_guest[1],
                    &status_pipe[0], &status_pipe[1]}) {
      close_fd(*fd);
    }
    return launch_error(result, "cannot fork: " + reason);
  }

  if (pid == 0) {
    ::signal(SIGPIPE, SIG_DFL);
    ::dup2(to_guest[0], STDIN_FILENO);
    ::dup2(from_guest[1], STDOUT_FILENO);
    ::execvp(argv[0], argv.data());
    const int err = errno;
    ssize_t ignored = ::write(status_pipe[1], &err, sizeof(err));
    (void)ignored;
    ::_exit(127);
  }

  close_fd(to_guest[0]);
  close_fd(from_guest[1]);
  close_fd(status_pipe[1]);

  int exec_errno = 0;
  ssize_t n = 0;
  do {
    n = ::read(status_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  close_fd(status_pipe[0]);

  auto guest = std::make_unique<GuestProcess>(pid, from_guest[0], to_guest[1]);
  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    guest.reset();
    return launch_error(result, std::string("Could not start ") + all.front() + ": " +
                                    std::strerror(exec_errno));
  }

  if (!guest->channel().send(flags_to_json(flags))) {
    const std::string err = guest->channel().last_error();
    guest.reset();
    return launch_error(result, "Could not send launch flags: " + err);
  }

  result->ok = true;
  return guest;
}

}  // namespace hostcall

#endif
