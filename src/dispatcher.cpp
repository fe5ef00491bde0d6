#include "hostcall/dispatcher.hpp"

#include <array>
#include <exception>
#include <iostream>
#include <utility>

#include "hostcall/hash.hpp"

namespace hostcall {

namespace {

constexpr std::array<std::pair<std::string_view, RequestKind>, 16> kWireNames{{
    {"checkVersion", RequestKind::check_version},
    {"writeStdout", RequestKind::write_stdout},
    {"exit", RequestKind::exit},
    {"readFile", RequestKind::read_file},
    {"writeFile", RequestKind::write_file},
    {"listFiles", RequestKind::list_files},
    {"listSubdirectories", RequestKind::list_subdirectories},
    {"execute", RequestKind::execute},
    {"copyFile", RequestKind::copy_file},
    {"moveFile", RequestKind::move_file},
    {"deleteFile", RequestKind::delete_file},
    {"stat", RequestKind::stat},
    {"createDirectory", RequestKind::create_directory},
    {"removeDirectory", RequestKind::remove_directory},
    {"obliterateDirectory", RequestKind::obliterate_directory},
    {"createTemporaryDirectory", RequestKind::create_temporary_directory},
}};

}  // namespace

std::optional<RequestKind> parse_request_kind(std::string_view tag) {
  for (const auto& [name, kind] : kWireNames) {
    if (name == tag) return kind;
  }
  return std::nullopt;
}

std::string_view wire_name(RequestKind kind) {
  switch (kind) {
    case RequestKind::check_version: return "checkVersion";
    case RequestKind::write_stdout: return "writeStdout";
    case RequestKind::exit: return "exit";
    case RequestKind::read_file: return "readFile";
    case RequestKind::write_file: return "writeFile";
    case RequestKind::list_files: return "listFiles";
    case RequestKind::list_subdirectories: return "listSubdirectories";
    case RequestKind::execute: return "execute";
    case RequestKind::copy_file: return "copyFile";
    case RequestKind::move_file: return "moveFile";
    case RequestKind::delete_file: return "deleteFile";
    case RequestKind::stat: return "stat";
    case RequestKind::create_directory: return "createDirectory";
    case RequestKind::remove_directory: return "removeDirectory";
    case RequestKind::obliterate_directory: return "obliterateDirectory";
    case RequestKind::create_temporary_directory: return "createTemporaryDirectory";
  }
  return "";
}

FrameDecode decode_frame(const std::string& line) {
  FrameDecode out;

  std::optional<jsonlite::JsonError> err;
  jsonlite::Value parsed = jsonlite::parse_value(line, &err);
  if (err) {
    out.error_code = ErrorCode::json_parse_error;
    out.message = err->message;
    return out;
  }

  const jsonlite::Object* obj = jsonlite::as_object(parsed);
  if (!obj) {
    out.error_code = ErrorCode::malformed_frame;
    out.message = "request is not a JSON object";
    return out;
  }

  const jsonlite::Value* tag = jsonlite::find(*obj, "kind");
  if (!tag) tag = jsonlite::find(*obj, "name");
  const std::string* tag_text = tag ? jsonlite::as_string(*tag) : nullptr;
  if (!tag_text) {
    out.error_code = ErrorCode::malformed_frame;
    out.message = "request has no kind";
    return out;
  }
  out.tag = *tag_text;

  auto kind = parse_request_kind(out.tag);
  if (!kind) {
    out.error_code = ErrorCode::unrecognized_request;
    out.message = "unexpected request " + out.tag;
    return out;
  }

  out.ok = true;
  out.request.kind = *kind;
  if (const jsonlite::Value* value = jsonlite::find(*obj, "value")) out.request.value = *value;
  return out;
}

Dispatcher::Dispatcher(Channel& channel, ExecutionContext& ctx)
    : channel_(channel), ctx_(ctx) {}

int Dispatcher::run() {
  for (;;) {
    if (auto status = step()) return *status;
  }
}

std::optional<int> Dispatcher::step() {
  if (state_ == DispatcherState::terminated) return ctx_.exit_status();

  std::optional<std::string> frame = channel_.receive();
  if (!frame) {
    const std::string err = channel_.last_error();
    ctx_.diagnostic(err.empty() ? "Guest program closed the request channel without exiting"
                                : "Could not read request: " + err);
    return finish(1, "channel_closed");
  }

  state_ = DispatcherState::handling_request;
  ++seq_;
  ctx_.transcript().update("req:", *frame);
  trace(">>", *frame);

  RequestEvent ev;
  ev.seq = seq_;
  ev.bytes_in = frame->size();
  ev.request_digest = hash_domain("req:", *frame);

  FrameDecode decoded = decode_frame(*frame);
  ev.kind = decoded.ok ? std::string(wire_name(decoded.request.kind)) : decoded.tag;

  HandlerResult result;
  {
    ScopeTimer timer(ev.duration_ns);
    if (decoded.ok) {
      result = handle(decoded.request);
    } else if (decoded.error_code == ErrorCode::unrecognized_request) {
      ctx_.diagnostic("Internal error - unexpected request " + decoded.tag);
      ctx_.diagnostic("Try updating to newer versions of hostcall and the hostcall guest package");
      result = HandlerResult::terminate(1, "unrecognized_request", decoded.error_code);
    } else {
      ctx_.diagnostic("Malformed request: " + decoded.message);
      result = HandlerResult::terminate(1, to_string(decoded.error_code), decoded.error_code);
    }
  }

  if (result.terminate_status) {
    record(ev, result);
    return finish(*result.terminate_status, result.terminate_reason);
  }

  const std::string response = jsonlite::to_json(result.response);
  if (!channel_.send(response)) {
    result.ok = false;
    result.error_code = ErrorCode::channel_closed;
    record(ev, result);
    ctx_.diagnostic("Could not send response: " + channel_.last_error());
    return finish(1, "channel_closed");
  }
  ctx_.transcript().update("res:", response);
  trace("<<", response);

  ev.bytes_out = response.size();
  record(ev, result);
  state_ = DispatcherState::awaiting_request;
  return std::nullopt;
}

HandlerResult Dispatcher::handle(const Request& request) {
  const jsonlite::Value& v = request.value;
  try {
    switch (request.kind) {
      case RequestKind::check_version: return handlers::check_version(v, ctx_);
      case RequestKind::write_stdout: return handlers::write_stdout(v, ctx_);
      case RequestKind::exit: return handlers::exit(v, ctx_);
      case RequestKind::read_file: return handlers::read_file(v);
      case RequestKind::write_file: return handlers::write_file(v);
      case RequestKind::list_files: return handlers::list_files(v);
      case RequestKind::list_subdirectories: return handlers::list_subdirectories(v);
      case RequestKind::execute: return handlers::execute(v);
      case RequestKind::copy_file: return handlers::copy_file(v);
      case RequestKind::move_file: return handlers::move_file(v);
      case RequestKind::delete_file: return handlers::delete_file(v);
      case RequestKind::stat: return handlers::stat(v);
      case RequestKind::create_directory: return handlers::create_directory(v);
      case RequestKind::remove_directory: return handlers::remove_directory(v);
      case RequestKind::obliterate_directory: return handlers::obliterate_directory(v);
      case RequestKind::create_temporary_directory: return handlers::create_temporary_directory(ctx_);
    }
  } catch (const std::exception& e) {
    return HandlerResult::failure(ErrorCode::io_failure, e.what());
  }
  return HandlerResult::failure(ErrorCode::unrecognized_request, "unhandled request kind");
}

int Dispatcher::finish(int status, const std::string& reason) {
  state_ = DispatcherState::terminated;
  return ctx_.controlled_exit(status, reason);
}

void Dispatcher::record(RequestEvent& ev, const HandlerResult& result) {
  ev.ok = result.ok;
  ev.error_code = to_string(result.error_code);
  ctx_.stats().record(ev);
  ctx_.event_log().emit(ev);
}

void Dispatcher::trace(const char* direction, const std::string& line) const {
  if (!ctx_.config().trace_frames) return;
  std::cerr << direction << " " << line << "\n";
}

}  // namespace hostcall
