#ifndef _WIN32

#include "hostcall/process_runner.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "hostcall/jsonlite.hpp"

namespace hostcall {

namespace {

// Reported by the child through the exec-status pipe before it gives up.
enum class ChildStage : int { stdin_redirect = 1, chdir = 2, exec = 3 };

struct ChildFailure {
  int stage{0};
  int err{0};
};

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

[[noreturn]] void child_fail(int status_fd, ChildStage stage) {
  ChildFailure f{static_cast<int>(stage), errno};
  ssize_t ignored = ::write(status_fd, &f, sizeof(f));
  (void)ignored;
  ::_exit(127);
}

std::string describe_child_failure(const ChildFailure& f, const ProcessSpec& spec) {
  const std::string reason = std::strerror(f.err);
  switch (static_cast<ChildStage>(f.stage)) {
    case ChildStage::stdin_redirect:
      return reason + ": /dev/null";
    case ChildStage::chdir:
      return reason + ": " + (spec.cwd ? spec.cwd->string() : std::string());
    case ChildStage::exec:
      return reason + ": " + spec.command;
  }
  return reason;
}

ProcessOutcome failed(std::string message, std::string stderr_text = {}) {
  ProcessOutcome o;
  o.kind = ProcessOutcomeKind::failed;
  o.message = stderr_text.empty() ? std::move(message) : stderr_text;
  o.stderr_text = std::move(stderr_text);
  return o;
}

int wait_child(pid_t pid, int& status) {
  while (true) {
    const pid_t w = ::waitpid(pid, &status, 0);
    if (w == pid) return 0;
    if (w < 0 && errno == EINTR) continue;
    return errno ? errno : ECHILD;
  }
}

}  // namespace

ErrorCode ProcessOutcome::error_code() const {
  switch (kind) {
    case ProcessOutcomeKind::success: return ErrorCode::none;
    case ProcessOutcomeKind::exited: return ErrorCode::process_exited;
    case ProcessOutcomeKind::signaled: return ErrorCode::process_signaled;
    case ProcessOutcomeKind::failed: return ErrorCode::process_spawn_failed;
  }
  return ErrorCode::process_spawn_failed;
}

ProcessOutcome run_process(const ProcessSpec& spec) {
  // Everything the child needs is built before fork().
  std::vector<std::string> all = {spec.command};
  all.insert(all.end(), spec.argv.begin(), spec.argv.end());
  std::vector<char*> argv;
  argv.reserve(all.size() + 1);
  for (auto& s : all) argv.push_back(s.data());
  argv.push_back(nullptr);
  const std::string cwd = spec.cwd ? spec.cwd->string() : std::string();

  int out_pipe[2] = {-1, -1};
  int err_pipe[2] = {-1, -1};
  int status_pipe[2] = {-1, -1};
  if (!make_pipe(out_pipe) || !make_pipe(err_pipe) || !make_pipe(status_pipe)) {
    const std::string reason = std::strerror(errno);
    for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1],
                    &status_pipe[0], &status_pipe[1]}) {
      close_fd(*fd);
    }
    return failed("cannot create pipe: " + reason);
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    const std::string reason = std::strerror(errno);
    for (int* fd : {&out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1],
                    &status_pipe[0], &status_pipe[1]}) {
      close_fd(*fd);
    }
    return failed("cannot fork: " + reason);
  }

  if (pid == 0) {
    // The bridge ignores SIGPIPE; ignored dispositions survive exec.
    ::signal(SIGPIPE, SIG_DFL);
    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull < 0 || ::dup2(devnull, STDIN_FILENO) < 0) {
      child_fail(status_pipe[1], ChildStage::stdin_redirect);
    }
    ::dup2(out_pipe[1], STDOUT_FILENO);
    ::dup2(err_pipe[1], STDERR_FILENO);
    if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
      child_fail(status_pipe[1], ChildStage::chdir);
    }
    ::execvp(argv[0], argv.data());
    child_fail(status_pipe[1], ChildStage::exec);
  }

  close_fd(out_pipe[1]);
  close_fd(err_pipe[1]);
  close_fd(status_pipe[1]);

  // Zero bytes: exec succeeded and the close-on-exec end went away.
  ChildFailure child_failure;
  ssize_t n = 0;
  do {
    n = ::read(status_pipe[0], &child_failure, sizeof(child_failure));
  } while (n < 0 && errno == EINTR);
  close_fd(status_pipe[0]);

  if (n == static_cast<ssize_t>(sizeof(child_failure))) {
    close_fd(out_pipe[0]);
    close_fd(err_pipe[0]);
    int status = 0;
    (void)wait_child(pid, status);
    return failed(describe_child_failure(child_failure, spec));
  }

  std::string stdout_bytes;
  std::string stderr_bytes;
  std::string read_error;
  char buf[4096];
  while (out_pipe[0] >= 0 || err_pipe[0] >= 0) {
    pollfd fds[2];
    nfds_t count = 0;
    if (out_pipe[0] >= 0) fds[count++] = pollfd{out_pipe[0], POLLIN, 0};
    if (err_pipe[0] >= 0) fds[count++] = pollfd{err_pipe[0], POLLIN, 0};
    if (::poll(fds, count, -1) < 0) {
      if (errno == EINTR) continue;
      read_error = std::string("poll failed: ") + std::strerror(errno);
      close_fd(out_pipe[0]);
      close_fd(err_pipe[0]);
      break;
    }
    for (nfds_t k = 0; k < count; ++k) {
      if (fds[k].revents == 0) continue;
      int& fd = (fds[k].fd == out_pipe[0]) ? out_pipe[0] : err_pipe[0];
      std::string& sink = (&fd == &out_pipe[0]) ? stdout_bytes : stderr_bytes;
      const ssize_t r = ::read(fd, buf, sizeof(buf));
      if (r > 0) {
        sink.append(buf, static_cast<std::size_t>(r));
      } else if (r == 0) {
        close_fd(fd);
      } else if (errno != EINTR && errno != EAGAIN) {
        read_error = std::string("cannot read process output: ") + std::strerror(errno);
        close_fd(fd);
      }
    }
  }

  int status = 0;
  const int wait_err = wait_child(pid, status);
  std::string stderr_text = jsonlite::decode_utf8_lossy(stderr_bytes);

  if (wait_err != 0) {
    return failed(std::string("cannot wait for process: ") + std::strerror(wait_err),
                  std::move(stderr_text));
  }
  if (!read_error.empty()) {
    return failed(read_error, std::move(stderr_text));
  }

  ProcessOutcome o;
  o.stderr_text = std::move(stderr_text);
  if (WIFEXITED(status)) {
    const int code = WEXITSTATUS(status);
    if (code == 0) {
      o.kind = ProcessOutcomeKind::success;
      o.output = jsonlite::decode_utf8_lossy(stdout_bytes);
    } else {
      o.kind = ProcessOutcomeKind::exited;
      o.exit_code = code;
    }
    return o;
  }
  if (WIFSIGNALED(status)) {
    o.kind = ProcessOutcomeKind::signaled;
    o.signal_number = WTERMSIG(status);
    return o;
  }
  return failed("unrecognized process termination status " + std::to_string(status),
                std::move(o.stderr_text));
}

}  // namespace hostcall

#endif
