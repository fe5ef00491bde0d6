#pragma once

// hostcall/dispatcher.hpp — The request/response loop.
//
// PROTOCOL:
//   request   {"kind": "<tag>", "value": <payload>}   ("name" accepted for "kind")
//   response  one JSON value: the success payload, or an error object
//
// STATE MACHINE:
//   awaiting_request --receive--> handling_request --send--> awaiting_request
//                                        |
//                                        +--exit / fatal--> terminated
//   step() never receives while a response is pending, so exactly one request
//   is in flight and responses come out in request order.
//
// CLOSED KIND SET:
//   RequestKind is exhaustively switched on in Dispatcher::handle() and
//   wire_name(); the build uses -Werror=switch, so a new enumerator without a
//   handler does not compile. A wire tag outside the set is still possible
//   (newer guest, older bridge) and is fatal: diagnostic, controlled exit,
//   status 1, no response.
//
// FAILURE POLICY:
//   Handlers return HandlerResult and do not throw; handle() still catches
//   std::exception and turns it into an {"message": ...} response. Only
//   checkVersion mismatches, exit, unknown kinds and broken frames/channels
//   end the session.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "hostcall/channel.hpp"
#include "hostcall/context.hpp"
#include "hostcall/jsonlite.hpp"
#include "hostcall/observability.hpp"
#include "hostcall/types.hpp"

namespace hostcall {

enum class RequestKind {
  check_version,
  write_stdout,
  exit,
  read_file,
  write_file,
  list_files,
  list_subdirectories,
  execute,
  copy_file,
  move_file,
  delete_file,
  stat,
  create_directory,
  remove_directory,
  obliterate_directory,
  create_temporary_directory,
};

std::optional<RequestKind> parse_request_kind(std::string_view tag);
std::string_view wire_name(RequestKind kind);

struct Request {
  RequestKind kind{RequestKind::exit};
  jsonlite::Value value;
};

struct FrameDecode {
  bool ok{false};
  Request request;
  std::string tag;      // raw kind tag, when one was present
  ErrorCode error_code{ErrorCode::none};
  std::string message;
};

FrameDecode decode_frame(const std::string& line);

struct HandlerResult {
  jsonlite::Value response;
  bool ok{true};
  ErrorCode error_code{ErrorCode::none};
  // Set for exit and fatal conditions: no response is sent and the session
  // ends with this status.
  std::optional<int> terminate_status;
  std::string terminate_reason;

  static HandlerResult success(jsonlite::Value v);
  // {"message": message}
  static HandlerResult failure(ErrorCode code, const std::string& message);
  // Kind-specific error payload.
  static HandlerResult failure_with(ErrorCode code, jsonlite::Value payload);
  static HandlerResult terminate(int status, std::string reason, ErrorCode code = ErrorCode::none);
};

// One handler per request kind. Payloads are validated here; a payload of the
// wrong shape yields an invalid_payload failure, except for check_version and
// exit, which terminate the session instead.
namespace handlers {

HandlerResult check_version(const jsonlite::Value& v, ExecutionContext& ctx);
HandlerResult write_stdout(const jsonlite::Value& v, ExecutionContext& ctx);
HandlerResult exit(const jsonlite::Value& v, ExecutionContext& ctx);
HandlerResult read_file(const jsonlite::Value& v);
HandlerResult write_file(const jsonlite::Value& v);
HandlerResult list_files(const jsonlite::Value& v);
HandlerResult list_subdirectories(const jsonlite::Value& v);
HandlerResult execute(const jsonlite::Value& v);
HandlerResult copy_file(const jsonlite::Value& v);
HandlerResult move_file(const jsonlite::Value& v);
HandlerResult delete_file(const jsonlite::Value& v);
HandlerResult stat(const jsonlite::Value& v);
HandlerResult create_directory(const jsonlite::Value& v);
HandlerResult remove_directory(const jsonlite::Value& v);
HandlerResult obliterate_directory(const jsonlite::Value& v);
HandlerResult create_temporary_directory(ExecutionContext& ctx);

}  // namespace handlers

enum class DispatcherState {
  awaiting_request,
  handling_request,
  terminated,
};

class Dispatcher {
 public:
  Dispatcher(Channel& channel, ExecutionContext& ctx);

  // Runs until the session ends; returns the process exit status. The
  // controlled exit has already run when this returns.
  int run();

  // Receives, handles and answers one request. Returns the exit status once
  // the session has ended, nullopt otherwise.
  std::optional<int> step();

  HandlerResult handle(const Request& request);

  DispatcherState state() const { return state_; }
  std::uint64_t handled() const { return seq_; }

 private:
  int finish(int status, const std::string& reason);
  void record(RequestEvent& ev, const HandlerResult& result);
  void trace(const char* direction, const std::string& line) const;

  Channel& channel_;
  ExecutionContext& ctx_;
  DispatcherState state_{DispatcherState::awaiting_request};
  std::uint64_t seq_{0};
};

}  // namespace hostcall
