#pragma once

// hostcall/process_runner.hpp — Subprocess execution for the execute request.
//
// EXECUTION:
//   The command is resolved on PATH (execvp) and receives the arguments
//   verbatim; no shell is involved. The child inherits the bridge environment,
//   reads /dev/null on stdin, and has stdout and stderr captured through pipes.
//   The call blocks until the child terminates. There is no timeout and no
//   cancellation: a hung command hangs the bridge.
//
// OUTCOME TAXONOMY (mutually exclusive, exhaustive, checked in this order):
//   success   exit status 0; output = stdout decoded as UTF-8 (lossy)
//   exited    nonzero exit status; exit_code set
//   signaled  killed by a signal; signal_number set
//   failed    pipe/fork failure, exec failure reported by the child, or a
//             read error; message prefers captured stderr text
//
// Exec failures are reported through a close-on-exec pipe, so "command not
// found" is a spawn failure and never masquerades as exit status 127.

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "hostcall/types.hpp"

namespace hostcall {

struct ProcessSpec {
  std::string command;
  std::vector<std::string> argv;            // arguments after the command
  std::optional<std::filesystem::path> cwd; // already resolved by the sandbox
};

enum class ProcessOutcomeKind {
  success,
  exited,
  signaled,
  failed,
};

struct ProcessOutcome {
  ProcessOutcomeKind kind{ProcessOutcomeKind::failed};
  std::string output;       // success only
  int exit_code{0};         // exited only
  int signal_number{0};     // signaled only
  std::string message;      // failed only
  std::string stderr_text;  // whatever was captured, for diagnostics

  ErrorCode error_code() const;
};

ProcessOutcome run_process(const ProcessSpec& spec);

}  // namespace hostcall
