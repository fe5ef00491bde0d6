#pragma once

// hostcall/context.hpp — Process-level state of one bridge session.
//
// ExecutionContext owns everything that outlives a single request: the
// temporary directory registry, the event log, request statistics and the
// transcript hasher. The dispatcher borrows it; nothing here is global.
//
// CONTROLLED EXIT:
//   controlled_exit() is the only place where cleanup happens. The first call
//   removes tracked temporary directories, flushes the output stream and emits
//   the session_end event, then returns the status for the caller to hand back
//   from main(). Later calls (a fatal error while already exiting) do nothing
//   but return the status of the first call.

#include <iosfwd>
#include <optional>
#include <string>

#include "hostcall/config.hpp"
#include "hostcall/hash.hpp"
#include "hostcall/observability.hpp"
#include "hostcall/temp_registry.hpp"

namespace hostcall {

class ExecutionContext {
 public:
  // out receives writeStdout payloads and fatal diagnostics.
  ExecutionContext(BridgeConfig config, std::ostream& out);

  const BridgeConfig& config() const { return config_; }
  TemporaryDirectoryRegistry& temp_registry() { return registry_; }
  BridgeStats& stats() { return stats_; }
  const BridgeStats& stats() const { return stats_; }
  TranscriptHasher& transcript() { return transcript_; }
  const EventLog& event_log() const { return event_log_; }
  std::ostream& out() { return out_; }

  // Prints one diagnostic line to the output stream.
  void diagnostic(const std::string& line);

  int controlled_exit(int status, const std::string& reason);

  bool exited() const { return exit_status_.has_value(); }
  std::optional<int> exit_status() const { return exit_status_; }

 private:
  BridgeConfig config_;
  std::ostream& out_;
  TemporaryDirectoryRegistry registry_;
  BridgeStats stats_;
  TranscriptHasher transcript_;
  EventLog event_log_;
  std::optional<int> exit_status_;
};

}  // namespace hostcall
