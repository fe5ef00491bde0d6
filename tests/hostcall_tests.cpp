#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "hostcall/channel.hpp"
#include "hostcall/config.hpp"
#include "hostcall/context.hpp"
#include "hostcall/dispatcher.hpp"
#include "hostcall/hash.hpp"
#include "hostcall/jsonlite.hpp"
#include "hostcall/observability.hpp"
#include "hostcall/path_sandbox.hpp"
#include "hostcall/process_runner.hpp"
#include "hostcall/program_loader.hpp"
#include "hostcall/temp_registry.hpp"
#include "hostcall/version.hpp"

namespace fs = std::filesystem;
namespace json = hostcall::jsonlite;

namespace {
int g_tests_run = 0;
int g_tests_passed = 0;
fs::path g_root;

void expect(bool condition, const std::string& message) {
  if (!condition) {
    std::cerr << "FAIL: " << message << "\n";
    std::exit(1);
  }
}

void run_test(const std::string& name, void (*fn)()) {
  std::cout << "  " << name << "...";
  fn();
  std::cout << " PASSED\n";
  g_tests_run++;
  g_tests_passed++;
}

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

fs::path scratch(const std::string& name) {
  const fs::path p = g_root / name;
  fs::remove_all(p);
  fs::create_directories(p);
  return p;
}

hostcall::BridgeConfig test_config(const std::string& name) {
  hostcall::BridgeConfig c;
  c.temp_root = scratch(name + "_tmp");
  return c;
}

std::string read_text(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

void write_text(const fs::path& p, const std::string& data) {
  std::ofstream ofs(p, std::ios::binary | std::ios::trunc);
  ofs << data;
}

std::string frags(const std::vector<std::string>& parts) {
  json::Array a;
  for (const auto& p : parts) a.emplace_back(p);
  return json::to_json(a);
}

std::string frame(const std::string& kind, const std::string& value_json) {
  return "{\"kind\":\"" + kind + "\",\"value\":" + value_json + "}";
}

// In-memory channel. log records every receive and send in order, tagged
// with the index of the request it belongs to.
class ScriptedChannel : public hostcall::Channel {
 public:
  explicit ScriptedChannel(std::vector<std::string> frames) : frames_(std::move(frames)) {}

  std::optional<std::string> receive() override {
    if (next_ >= frames_.size()) return std::nullopt;
    log.push_back("recv " + std::to_string(next_));
    return frames_[next_++];
  }

  bool send(const std::string& line) override {
    if (fail_sends) return false;
    log.push_back("send " + std::to_string(next_ - 1));
    sent.push_back(line);
    return true;
  }

  std::string last_error() const override { return fail_sends ? "peer gone" : ""; }

  std::size_t received() const { return next_; }

  // Appends a frame for requests that depend on an earlier response.
  void queue(std::string frame) { frames_.push_back(std::move(frame)); }

  std::vector<std::string> sent;
  std::vector<std::string> log;
  bool fail_sends{false};

 private:
  std::vector<std::string> frames_;
  std::size_t next_{0};
};

std::string call(hostcall::Dispatcher& d, hostcall::RequestKind kind, const std::string& value_json) {
  hostcall::Request req;
  req.kind = kind;
  std::optional<json::JsonError> err;
  req.value = json::parse_value(value_json, &err);
  expect(!err, "test payload must parse: " + value_json);
  return json::to_json(d.handle(req).response);
}

std::vector<std::string> g_events;
void capture_event(const std::string& line) { g_events.push_back(line); }

// ============================================================================
// PathSandbox
// ============================================================================

void test_anchor_is_trusted() {
  auto r = hostcall::resolve_path({"/base/dir/"}, "/work");
  expect(r.ok, "absolute anchor must resolve");
  expect(r.path == fs::path("/base/dir"), "trailing separator dropped: " + r.path.string());

  r = hostcall::resolve_path({"rel/./x"}, "/work");
  expect(r.ok && r.path == fs::path("/work/rel/x"), "relative anchor resolves against base");

  // The anchor itself is never containment-checked.
  r = hostcall::resolve_path({"../up"}, "/work/a");
  expect(r.ok && r.path == fs::path("/work/up"), "anchor may point anywhere");
}

void test_descendants_checked() {
  auto r = hostcall::resolve_path({"/base", "sub"}, "/work");
  expect(r.ok && r.path == fs::path("/base/sub"), "child fragment resolves under anchor");

  r = hostcall::resolve_path({"/base", "a/b", "."}, "/work");
  expect(r.ok && r.path == fs::path("/base/a/b"), "nested and dot fragments accepted");

  r = hostcall::resolve_path({"/base", "../escape"}, "/work");
  expect(!r.ok, "upward fragment must fail");
  expect(r.error_code == hostcall::ErrorCode::invalid_path, "escape is invalid_path");
  expect(r.message == "../escape is not a proper relative path", "escape message: " + r.message);

  r = hostcall::resolve_path({"/base", "a/../../x"}, "/work");
  expect(!r.ok, "escape through collapse must fail");

  r = hostcall::resolve_path({"/base", "/etc"}, "/work");
  expect(!r.ok, "absolute fragment outside anchor must fail");

  r = hostcall::resolve_path({"/base", "..foo"}, "/work");
  expect(r.ok && r.path == fs::path("/base/..foo"), "..foo is a descendant");
}

void test_empty_fragments() {
  auto r = hostcall::resolve_path({}, "/work");
  expect(!r.ok && r.message == "Empty path given", "empty fragments rejected");
}

// ============================================================================
// VersionNegotiator
// ============================================================================

void test_version_check() {
  using hostcall::version::check_compatibility;
  using hostcall::version::VersionRequirement;

  expect(check_compatibility(VersionRequirement{5, 0}).ok, "5.0 accepted");

  auto r = check_compatibility(VersionRequirement{5, 1});
  expect(!r.ok && r.error_code == "minor_too_new", "5.1 rejected as minor_too_new");
  expect(r.diagnostic_lines.size() == 2, "minor mismatch prints two lines");
  expect(r.diagnostic_lines[0] ==
             "Version mismatch: script requires hostcall version at least 5.1 (current hostcall version: 5.0)",
         "minor diagnostic: " + r.diagnostic_lines[0]);

  r = check_compatibility(VersionRequirement{4, 9});
  expect(!r.ok && r.error_code == "major_too_old", "4.9 rejected as too old");
  expect(contains(r.diagnostic_lines[1], "update script"), "too-old hint");

  r = check_compatibility(VersionRequirement{6, 0});
  expect(!r.ok && r.error_code == "major_too_new", "6.0 rejected as too new");
  expect(r.diagnostic_lines[1] == "Please update to a newer version of hostcall", "too-new hint");
}

void test_version_manifest() {
  const auto m = hostcall::version::current_manifest("5.0.0");
  const std::string j = hostcall::version::manifest_to_json(m);
  expect(!json::validate_strict(j), "manifest is strict JSON");
  expect(contains(j, "\"engine_semver\":\"5.0.0\""), "manifest carries semver");
}

// ============================================================================
// ProcessRunner
// ============================================================================

void test_process_success() {
  hostcall::ProcessSpec spec{"/bin/sh", {"-c", "printf hello"}, std::nullopt};
  auto o = hostcall::run_process(spec);
  expect(o.kind == hostcall::ProcessOutcomeKind::success, "exit 0 is success");
  expect(o.output == "hello", "stdout captured: " + o.output);
}

void test_process_exit_code() {
  hostcall::ProcessSpec spec{"/bin/sh", {"-c", "echo oops >&2; exit 2"}, std::nullopt};
  auto o = hostcall::run_process(spec);
  expect(o.kind == hostcall::ProcessOutcomeKind::exited && o.exit_code == 2, "exit 2 is exited");
  expect(o.error_code() == hostcall::ErrorCode::process_exited, "exited error code");
  expect(o.stderr_text == "oops\n", "stderr captured");
}

void test_process_signaled() {
  hostcall::ProcessSpec spec{"/bin/sh", {"-c", "kill -TERM $$"}, std::nullopt};
  auto o = hostcall::run_process(spec);
  expect(o.kind == hostcall::ProcessOutcomeKind::signaled, "self-kill is signaled");
  expect(o.signal_number == 15, "SIGTERM reported");
}

void test_process_spawn_failure() {
  hostcall::ProcessSpec spec{"hostcall-no-such-command", {}, std::nullopt};
  auto o = hostcall::run_process(spec);
  expect(o.kind == hostcall::ProcessOutcomeKind::failed, "missing command is failed, not exit 127");
  expect(contains(o.message, "hostcall-no-such-command"), "message names the command");
}

void test_process_working_directory() {
  const fs::path dir = scratch("proc_cwd");
  hostcall::ProcessSpec spec{"/bin/sh", {"-c", "pwd -P"}, dir};
  auto o = hostcall::run_process(spec);
  expect(o.kind == hostcall::ProcessOutcomeKind::success, "pwd succeeds");
  expect(o.output == fs::canonical(dir).string() + "\n", "child runs in cwd: " + o.output);
}

// ============================================================================
// TemporaryResourceRegistry
// ============================================================================

void test_temp_dirs_distinct() {
  hostcall::TemporaryDirectoryRegistry reg(scratch("temp_distinct"));
  auto a = reg.create();
  auto b = reg.create();
  expect(a.ok && b.ok, "both directories created");
  expect(a.path != b.path, "handles are distinct");
  expect(a.path.is_absolute(), "handle is absolute");
  expect(fs::is_directory(a.path) && fs::is_empty(a.path), "first exists and is empty");
  expect(fs::is_directory(b.path) && fs::is_empty(b.path), "second exists and is empty");
  expect(reg.tracked().size() == 2, "both tracked");
}

void test_temp_cleanup_tolerates_removed() {
  hostcall::TemporaryDirectoryRegistry reg(scratch("temp_cleanup"));
  auto a = reg.create();
  auto b = reg.create();
  write_text(b.path / "f.txt", "data");
  fs::remove_all(a.path);

  auto report = reg.cleanup_all();
  expect(report.attempted == 2, "every tracked path attempted");
  expect(report.removed == 1, "only the surviving one counted");
  expect(!fs::exists(a.path) && !fs::exists(b.path), "nothing left behind");

  report = reg.cleanup_all();
  expect(report.attempted == 0, "second cleanup is a no-op");
  expect(reg.created_total() == 2, "created_total survives cleanup");
}

void test_temp_root_missing() {
  hostcall::TemporaryDirectoryRegistry reg(g_root / "no" / "such" / "root");
  auto r = reg.create();
  expect(!r.ok && r.error_code == hostcall::ErrorCode::io_failure, "missing root is io_failure");
  expect(reg.tracked().empty(), "failed create is not tracked");
}

// ============================================================================
// JSON codec
// ============================================================================

void test_json_codec() {
  std::optional<json::JsonError> err;
  auto v = json::parse_value("{\"kind\":\"exit\",\"value\":-3}", &err);
  expect(!err, "request parses");
  const auto* obj = json::as_object(v);
  expect(obj && json::get_string(*obj, "kind") == "exit", "kind extracted");
  auto code = json::as_int(*json::find(*obj, "value"));
  expect(code && *code == -3, "negative integer survives");
  expect(json::to_json(v) == "{\"kind\":\"exit\",\"value\":-3}", "negative integer serializes as integer");

  json::parse_value("{\"a\":1,\"a\":2}", &err);
  expect(err.has_value(), "duplicate keys rejected");
  json::parse_value("[1,2] x", &err);
  expect(err.has_value(), "trailing data rejected");

  expect(json::to_json(std::string("a\nb\x01")) == "\"a\\nb\\u0001\"", "control characters escaped");
  expect(json::decode_utf8_lossy(std::string("ok\xff")) == "ok\xEF\xBF\xBD", "invalid byte replaced");

  auto arr = json::as_string_array(json::parse_value("[\"a\",1]", &err));
  expect(!arr, "mixed array is not a string array");

  json::parse_value("\"a\\qb\"", &err);
  expect(err && err->code == "json_parse_error", "unknown escape rejected");
  json::parse_value("\"a\tb\"", &err);
  expect(err && err->code == "json_parse_error", "raw control byte rejected");
  auto esc = json::parse_value("\"\\\"\\/\\\\\"", &err);
  expect(!err && json::as_string(esc) && *json::as_string(esc) == "\"/\\", "standard escapes decoded");
}

// ============================================================================
// Hashing
// ============================================================================

void test_blake3_known_vectors() {
  expect(hostcall::blake3_hex("") == "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262",
         "BLAKE3 empty vector");
  expect(hostcall::blake3_hex("hello") == "ea8f163db38682925e4491c5e58d4bb3506ef8c14eb78a86e908c5624a67200f",
         "BLAKE3 hello vector");
  expect(hostcall::hash_domain("req:", "x") != hostcall::hash_domain("res:", "x"), "domains separate");
}

void test_transcript_order_sensitive() {
  hostcall::TranscriptHasher a;
  hostcall::TranscriptHasher b;
  a.update("req:", "one");
  a.update("res:", "two");
  b.update("res:", "two");
  b.update("req:", "one");
  expect(a.hex_digest() != b.hex_digest(), "transcript depends on order");
  expect(a.hex_digest() == a.hex_digest(), "hex_digest does not disturb state");
  expect(a.frames() == 2, "frames counted");
}

// ============================================================================
// Channel
// ============================================================================

void test_fd_channel_framing() {
  int in[2];
  int out[2];
  expect(::pipe(in) == 0 && ::pipe(out) == 0, "pipes created");
  const std::string data = "one\r\ntwo\nthree";
  expect(::write(in[1], data.data(), data.size()) == static_cast<ssize_t>(data.size()), "fed");
  ::close(in[1]);

  {
    hostcall::FdChannel ch(in[0], out[1], true);
    expect(ch.receive().value_or("") == "one", "CR stripped");
    expect(ch.receive().value_or("") == "two", "second frame");
    expect(ch.receive().value_or("") == "three", "unterminated final frame");
    expect(!ch.receive().has_value(), "end of stream");
    expect(ch.last_error().empty(), "clean end has no error");
    expect(ch.send("null"), "send works");
  }

  char buf[16] = {};
  const ssize_t n = ::read(out[0], buf, sizeof(buf));
  expect(n == 5 && std::string(buf, 5) == "null\n", "send appends newline");
  ::close(out[0]);
}

// ============================================================================
// CommandDispatcher
// ============================================================================

void test_dispatch_one_at_a_time() {
  const fs::path dir = scratch("dispatch_order");
  ScriptedChannel ch({
      frame("checkVersion", "[5,0]"),
      frame("writeStdout", "\"a\""),
      frame("stat", frags({dir.string()})),
      frame("exit", "0"),
  });
  std::ostringstream out;
  hostcall::ExecutionContext ctx(test_config("dispatch_order"), out);
  hostcall::Dispatcher d(ch, ctx);

  expect(d.state() == hostcall::DispatcherState::awaiting_request, "starts awaiting");
  expect(d.run() == 0, "exit 0");
  expect(d.state() == hostcall::DispatcherState::terminated, "ends terminated");

  const std::vector<std::string> expected = {"recv 0", "send 0", "recv 1", "send 1",
                                             "recv 2", "send 2", "recv 3"};
  expect(ch.log == expected, "each response sent before the next receive");
  expect(ch.sent.size() == 3, "N-1 responses, exit has none");
  expect(ch.sent[0] == "null" && ch.sent[1] == "null", "null responses");
  expect(ch.sent[2] == "\"directory\"", "stat response: " + ch.sent[2]);
  expect(out.str() == "a", "writeStdout goes to output verbatim");
}

void test_name_alias_accepted() {
  const fs::path dir = scratch("dispatch_alias");
  ScriptedChannel ch({
      "{\"name\":\"stat\",\"value\":" + frags({dir.string(), "nope"}) + "}",
      "{\"name\":\"exit\",\"value\":0}",
  });
  std::ostringstream out;
  hostcall::ExecutionContext ctx(test_config("dispatch_alias"), out);
  hostcall::Dispatcher d(ch, ctx);
  expect(d.run() == 0, "alias session exits 0");
  expect(ch.sent.size() == 1 && ch.sent[0] == "\"nonexistent\"", "name accepted as kind");
}

void test_unknown_kind_fatal() {
  ScriptedChannel ch({
      frame("frobnicate", "null"),
      frame("exit", "0"),
  });
  std::ostringstream out;
  hostcall::ExecutionContext ctx(test_config("dispatch_unknown"), out);
  hostcall::Dispatcher d(ch, ctx);
  expect(d.run() == 1, "unknown kind exits 1");
  expect(ch.sent.empty(), "no response for unknown kind");
  expect(ch.received() == 1, "nothing read after the fatal frame");
  expect(contains(out.str(), "Internal error - unexpected request frobnicate"), "diagnostic printed");
  expect(contains(out.str(), "Try updating to newer versions of hostcall"), "hint printed");
}

void test_version_mismatch_fatal() {
  auto cfg = test_config("dispatch_version");
  const fs::path temp_root = cfg.temp_root;
  ScriptedChannel ch({
      frame("createTemporaryDirectory", "null"),
      frame("checkVersion", "[6,0]"),
  });
  std::ostringstream out;
  hostcall::ExecutionContext ctx(std::move(cfg), out);
  hostcall::Dispatcher d(ch, ctx);
  expect(d.run() == 1, "version mismatch exits 1");
  expect(ch.sent.size() == 1, "only the temp dir request answered");
  expect(contains(out.str(), "script requires hostcall major version 6"), "mismatch diagnostic");
  expect(fs::is_empty(temp_root), "cleanup ran before exit");
}

void test_exit_status_and_cleanup() {
  ScriptedChannel ch({
      frame("createTemporaryDirectory", "null"),
      frame("createTemporaryDirectory", "null"),
      frame("exit", "7"),
  });
  std::ostringstream out;
  hostcall::ExecutionContext ctx(test_config("dispatch_exit"), out);
  hostcall::Dispatcher d(ch, ctx);
  expect(d.run() == 7, "guest exit code returned");

  std::optional<json::JsonError> err;
  const auto first = json::parse_value(ch.sent[0], &err);
  const auto second = json::parse_value(ch.sent[1], &err);
  expect(json::as_string(first) && json::as_string(second), "temp dir responses are paths");
  expect(*json::as_string(first) != *json::as_string(second), "distinct temp dirs");
  expect(!fs::exists(*json::as_string(first)), "first removed at exit");
  expect(!fs::exists(*json::as_string(second)), "second removed at exit");

  expect(ctx.exited() && ctx.exit_status() == 7, "context records status");
  expect(ctx.controlled_exit(1, "again") == 7, "controlled exit is idempotent");
  expect(d.step() == std::optional<int>(7), "step after termination returns status");
}

void test_exit_code_out_of_range() {
  for (const char* code : {"4294967296", "256", "-1"}) {
    ScriptedChannel ch({frame("exit", code)});
    std::ostringstream out;
    hostcall::ExecutionContext ctx(test_config("dispatch_exit_range"), out);
    hostcall::Dispatcher d(ch, ctx);
    expect(d.run() == 1, std::string("out-of-range exit code maps to 1: ") + code);
  }
  ScriptedChannel ch({frame("exit", "255")});
  std::ostringstream out;
  hostcall::ExecutionContext ctx(test_config("dispatch_exit_range"), out);
  hostcall::Dispatcher d(ch, ctx);
  expect(d.run() == 255, "255 passes through");
}

void test_exit_non_integer_fatal() {
  ScriptedChannel ch({frame("exit", "\"x\""), frame("exit", "0")});
  std::ostringstream out;
  hostcall::ExecutionContext ctx(test_config("dispatch_exit_bad"), out);
  hostcall::Dispatcher d(ch, ctx);
  expect(d.run() == 1, "non-integer exit code exits 1");
  expect(ch.sent.empty(), "no response sent");
  expect(ch.received() == 1, "no further request read");
  expect(contains(out.str(), "Invalid exit code: \"x\""), "exit code diagnostic");
}

void test_malformed_check_version_fatal() {
  ScriptedChannel ch({frame("checkVersion", "[5]"), frame("exit", "0")});
  std::ostringstream out;
  hostcall::ExecutionContext ctx(test_config("dispatch_version_shape"), out);
  hostcall::Dispatcher d(ch, ctx);
  expect(d.run() == 1, "malformed checkVersion exits 1");
  expect(ch.sent.empty(), "no response sent");
  expect(ch.received() == 1, "no further request read");
  expect(contains(out.str(), "Malformed checkVersion request"), "checkVersion diagnostic");
}

void test_channel_closed_fatal() {
  ScriptedChannel ch({frame("checkVersion", "[5,0]")});
  std::ostringstream out;
  hostcall::ExecutionContext ctx(test_config("dispatch_closed"), out);
  hostcall::Dispatcher d(ch, ctx);
  expect(d.run() == 1, "closed channel exits 1");
  expect(ch.sent.size() == 1, "the one request was answered");
  expect(contains(out.str(), "closed the request channel"), "closed diagnostic");
}

void test_malformed_frame_fatal() {
  ScriptedChannel ch({"this is not json"});
  std::ostringstream out;
  hostcall::ExecutionContext ctx(test_config("dispatch_malformed"), out);
  hostcall::Dispatcher d(ch, ctx);
  expect(d.run() == 1, "bad JSON exits 1");
  expect(contains(out.str(), "Malformed request"), "malformed diagnostic");

  auto dec = hostcall::decode_frame("{\"value\":1}");
  expect(!dec.ok && dec.error_code == hostcall::ErrorCode::malformed_frame, "missing kind is malformed");
  dec = hostcall::decode_frame("[1]");
  expect(!dec.ok && dec.error_code == hostcall::ErrorCode::malformed_frame, "non-object is malformed");
}

void test_send_failure_fatal() {
  ScriptedChannel ch({frame("checkVersion", "[5,0]"), frame("exit", "0")});
  ch.fail_sends = true;
  std::ostringstream out;
  hostcall::ExecutionContext ctx(test_config("dispatch_sendfail"), out);
  hostcall::Dispatcher d(ch, ctx);
  expect(d.run() == 1, "unsendable response exits 1");
  expect(ch.received() == 1, "no further request read");
  expect(contains(out.str(), "Could not send response: peer gone"), "send diagnostic");
}

void test_invalid_payload_recoverable() {
  ScriptedChannel ch({frame("readFile", "42"), frame("exit", "0")});
  std::ostringstream out;
  hostcall::ExecutionContext ctx(test_config("dispatch_payload"), out);
  hostcall::Dispatcher d(ch, ctx);
  expect(d.run() == 0, "bad payload does not end the session");
  expect(ch.sent.size() == 1 && contains(ch.sent[0], "\"message\""), "structured error sent");
  expect(ctx.stats().requests_failed == 1, "failure counted");
}

void test_wire_names_round_trip() {
  for (int k = 0; k <= static_cast<int>(hostcall::RequestKind::create_temporary_directory); ++k) {
    const auto kind = static_cast<hostcall::RequestKind>(k);
    const auto parsed = hostcall::parse_request_kind(hostcall::wire_name(kind));
    expect(parsed && *parsed == kind, "wire name maps back: " + std::string(hostcall::wire_name(kind)));
  }
  expect(!hostcall::parse_request_kind("Exit"), "tags are case sensitive");
}

// ============================================================================
// Request handlers
// ============================================================================

void test_file_handlers() {
  const fs::path dir = scratch("handlers_files");
  const std::string d = dir.string();
  ScriptedChannel ch(std::vector<std::string>{});
  std::ostringstream out;
  hostcall::ExecutionContext ctx(test_config("handlers_files"), out);
  hostcall::Dispatcher disp(ch, ctx);
  using K = hostcall::RequestKind;

  expect(call(disp, K::write_file, "{\"path\":" + frags({d, "a.txt"}) + ",\"contents\":\"hello\"}") == "null",
         "writeFile");
  expect(call(disp, K::read_file, frags({d, "a.txt"})) == "\"hello\"", "readFile");
  expect(call(disp, K::read_file, frags({d, "missing.txt"})).rfind("{\"message\":", 0) == 0,
         "missing file is a structured error");

  write_text(dir / "b.txt", "old");
  expect(call(disp, K::copy_file,
              "{\"sourcePath\":" + frags({d, "a.txt"}) + ",\"destinationPath\":" + frags({d, "b.txt"}) + "}") ==
             "null",
         "copyFile");
  expect(read_text(dir / "b.txt") == "hello", "copyFile overwrites");

  expect(call(disp, K::move_file,
              "{\"sourcePath\":" + frags({d, "a.txt"}) + ",\"destinationPath\":" + frags({d, "c.txt"}) + "}") ==
             "null",
         "moveFile");
  expect(call(disp, K::stat, frags({d, "a.txt"})) == "\"nonexistent\"", "moved source gone");
  expect(call(disp, K::stat, frags({d, "c.txt"})) == "\"file\"", "moved destination is a file");
  expect(call(disp, K::stat, frags({d, "c.txt", "below"})) == "\"nonexistent\"", "path below a file");

  expect(call(disp, K::create_directory, frags({d, "sub", "deep"})) == "null", "createDirectory recursive");
  expect(call(disp, K::create_directory, frags({d, "sub"})) == "null", "createDirectory on existing");
  expect(call(disp, K::list_files, frags({d})) == "[\"b.txt\",\"c.txt\"]", "listFiles sorted, files only");
  expect(call(disp, K::list_subdirectories, frags({d})) == "[\"sub\"]", "listSubdirectories");

  expect(call(disp, K::delete_file, frags({d, "sub"})).rfind("{\"message\":", 0) == 0,
         "deleteFile refuses directories");
  expect(call(disp, K::delete_file, frags({d, "c.txt"})) == "null", "deleteFile");
  expect(!fs::exists(dir / "c.txt"), "file deleted");

  expect(call(disp, K::read_file, frags({d, "../x"})) == "{\"message\":\"../x is not a proper relative path\"}",
         "escape reported as structured error");
}

void test_obliterate_vs_remove() {
  const fs::path dir = scratch("handlers_dirs");
  const std::string d = dir.string();
  fs::create_directories(dir / "full" / "nested");
  write_text(dir / "full" / "nested" / "f.txt", "x");
  fs::create_directories(dir / "empty");
  ScriptedChannel ch(std::vector<std::string>{});
  std::ostringstream out;
  hostcall::ExecutionContext ctx(test_config("handlers_dirs"), out);
  hostcall::Dispatcher disp(ch, ctx);
  using K = hostcall::RequestKind;

  expect(call(disp, K::remove_directory, frags({d, "full"})).rfind("{\"message\":", 0) == 0,
         "removeDirectory refuses non-empty");
  expect(fs::exists(dir / "full" / "nested" / "f.txt"), "nothing removed");
  expect(call(disp, K::obliterate_directory, frags({d, "full"})) == "null", "obliterateDirectory");
  expect(!fs::exists(dir / "full"), "tree gone");
  expect(call(disp, K::remove_directory, frags({d, "empty"})) == "null", "removeDirectory on empty");

  write_text(dir / "plain.txt", "x");
  expect(call(disp, K::obliterate_directory, frags({d, "plain.txt"})).rfind("{\"message\":", 0) == 0,
         "obliterateDirectory refuses files");
  expect(fs::exists(dir / "plain.txt"), "file untouched");
}

void test_obliterated_temp_dir_cleanup() {
  g_events.clear();
  hostcall::set_bridge_event_hook(&capture_event);
  auto cfg = test_config("dispatch_obliterate_temp");
  const fs::path temp_root = cfg.temp_root;
  ScriptedChannel ch({frame("createTemporaryDirectory", "null")});
  std::ostringstream out;
  hostcall::ExecutionContext ctx(std::move(cfg), out);
  hostcall::Dispatcher d(ch, ctx);

  expect(!d.step().has_value(), "createTemporaryDirectory answered");
  std::optional<json::JsonError> err;
  const auto created = json::parse_value(ch.sent.at(0), &err);
  const std::string* path = json::as_string(created);
  expect(path && fs::is_directory(*path), "temp dir exists");
  const std::string temp_dir = path ? *path : std::string();

  ch.queue(frame("obliterateDirectory", frags({temp_dir})));
  ch.queue(frame("exit", "0"));
  const int status = d.run();
  hostcall::set_bridge_event_hook(nullptr);

  expect(status == 0, "session exits 0 after guest removed its temp dir");
  expect(ch.sent.size() == 2 && ch.sent[1] == "null", "obliterateDirectory answered");
  expect(!fs::exists(temp_dir), "temp dir gone");
  expect(fs::is_empty(temp_root), "nothing left under temp root");
  expect(!g_events.empty() &&
             contains(g_events.back(), "\"temp_dirs_created\":1,\"temp_dirs_removed\":0"),
         "cleanup counts only what it removed: " + (g_events.empty() ? std::string() : g_events.back()));
}

void test_execute_handler() {
  const fs::path dir = scratch("handlers_exec");
  ScriptedChannel ch(std::vector<std::string>{});
  std::ostringstream out;
  hostcall::ExecutionContext ctx(test_config("handlers_exec"), out);
  hostcall::Dispatcher disp(ch, ctx);
  using K = hostcall::RequestKind;

  expect(call(disp, K::execute, "{\"command\":\"echo\",\"arguments\":[\"hi\"],\"options\":{}}") == "\"hi\\n\"",
         "execute success returns stdout");
  expect(call(disp, K::execute, "{\"command\":\"/bin/sh\",\"arguments\":[\"-c\",\"exit 2\"],\"options\":{}}") ==
             "{\"code\":2,\"error\":\"exited\"}",
         "execute exited");
  expect(call(disp, K::execute,
              "{\"command\":\"/bin/sh\",\"arguments\":[\"-c\",\"kill -TERM $$\"],\"options\":{}}") ==
             "{\"error\":\"terminated\"}",
         "execute terminated");
  const std::string failed =
      call(disp, K::execute, "{\"command\":\"hostcall-no-such-command\",\"arguments\":[],\"options\":{}}");
  expect(contains(failed, "\"error\":\"failed\"") && contains(failed, "\"message\":"), "execute failed");

  write_text(dir / "marker", "");
  const std::string listed = call(disp, K::execute,
                                  "{\"command\":\"ls\",\"arguments\":[],\"options\":{\"workingDirectory\":" +
                                      frags({dir.string()}) + "}}");
  expect(listed == "\"marker\\n\"", "workingDirectory honored: " + listed);

  const std::string escaped = call(disp, K::execute,
                                   "{\"command\":\"ls\",\"arguments\":[],\"options\":{\"workingDirectory\":" +
                                       frags({dir.string(), ".."}) + "}}");
  expect(escaped == "{\"error\":\"failed\",\"message\":\".. is not a proper relative path\"}",
         "bad workingDirectory fails without spawning: " + escaped);
}

// ============================================================================
// Observability & config
// ============================================================================

void test_event_hook_and_stats() {
  g_events.clear();
  hostcall::set_bridge_event_hook(&capture_event);
  const fs::path dir = scratch("events");
  ScriptedChannel ch({frame("stat", frags({dir.string()})), frame("exit", "0")});
  std::ostringstream out;
  hostcall::ExecutionContext ctx(test_config("events"), out);
  hostcall::Dispatcher d(ch, ctx);
  const int status = d.run();
  hostcall::set_bridge_event_hook(nullptr);

  expect(status == 0, "session exits 0");
  expect(g_events.size() == 3, "two request events and one session_end");
  expect(g_events[0].rfind("{\"event\":\"request\",\"seq\":1,\"kind\":\"stat\",\"ok\":true", 0) == 0,
         "request event: " + g_events[0]);
  expect(contains(g_events[2], "\"event\":\"session_end\",\"exit_code\":0,\"reason\":\"exit\""),
         "session event: " + g_events[2]);
  expect(contains(g_events[2], "\"transcript_digest\":\"" + ctx.transcript().hex_digest() + "\""),
         "session event carries transcript digest");
  for (const auto& e : g_events) expect(!json::validate_strict(e), "event is strict JSON");

  expect(ctx.stats().requests_total == 2, "both requests counted");
  expect(ctx.stats().per_kind.at("stat") == 1, "per-kind counter");
  expect(ctx.transcript().frames() == 3, "req, res, req framed into transcript");
}

void test_event_log_file() {
  const fs::path dir = scratch("event_file");
  auto cfg = test_config("event_file");
  cfg.event_log_path = (dir / "events.jsonl").string();
  ScriptedChannel ch({frame("exit", "4")});
  std::ostringstream out;
  hostcall::ExecutionContext ctx(std::move(cfg), out);
  hostcall::Dispatcher d(ch, ctx);
  expect(d.run() == 4, "exit 4");

  const std::string log = read_text(dir / "events.jsonl");
  expect(contains(log, "\"kind\":\"exit\""), "request event appended");
  expect(contains(log, "\"exit_code\":4"), "session event appended");
}

void test_config_from_env() {
  ::setenv("HOSTCALL_TEMP_ROOT", "/var/tmp/hc", 1);
  ::setenv("HOSTCALL_TRACE", "1", 1);
  ::setenv("HOSTCALL_JS_RUNNER", "deno", 1);
  ::setenv("HOSTCALL_EVENT_LOG", "/tmp/hc.jsonl", 1);
  auto c = hostcall::BridgeConfig::from_env();
  expect(c.temp_root == fs::path("/var/tmp/hc"), "temp root from env");
  expect(c.trace_frames, "trace from env");
  expect(c.js_runner == "deno", "runner from env");
  expect(c.event_log_path == "/tmp/hc.jsonl", "event log from env");

  for (const char* name : {"HOSTCALL_TEMP_ROOT", "HOSTCALL_TRACE", "HOSTCALL_JS_RUNNER", "HOSTCALL_EVENT_LOG"}) {
    ::unsetenv(name);
  }
  c = hostcall::BridgeConfig::from_env();
  expect(!c.temp_root.empty(), "temp root defaults to system temp");
  expect(!c.trace_frames && c.js_runner == "node" && c.event_log_path.empty(), "defaults");
}

// ============================================================================
// ProgramLoader
// ============================================================================

void test_launch_flags_json() {
  char a[] = "A=1";
  char b[] = "B=x=y";
  char* envp[] = {a, b, nullptr};
  auto flags = hostcall::make_launch_flags({"arg"}, "posix", envp);
  expect(hostcall::flags_to_json(flags) ==
             "{\"flags\":{\"arguments\":[\"arg\"],\"environmentVariables\":[[\"A\",\"1\"],[\"B\",\"x=y\"]],"
             "\"platform\":\"posix\"}}",
         "launch frame shape: " + hostcall::flags_to_json(flags));
  expect(hostcall::detect_platform() == std::optional<std::string>("posix"), "POSIX host detected");
}

void test_launch_failures() {
  const fs::path dir = scratch("launch_fail");
  hostcall::ExecutableLoader loader("node");
  hostcall::LaunchFlags flags;
  flags.platform = "posix";
  hostcall::LaunchResult result;

  auto guest = loader.launch(dir / "missing", flags, &result);
  expect(!guest && !result.ok, "missing program fails");
  expect(result.error_code == hostcall::ErrorCode::launch_failed, "launch_failed code");

  write_text(dir / "not_exec", "#!/bin/sh\n");
  fs::permissions(dir / "not_exec", fs::perms::owner_read | fs::perms::owner_write);
  guest = loader.launch(dir / "not_exec", flags, &result);
  expect(!guest && !result.ok, "non-executable program fails");
}

void test_end_to_end_shell_guest() {
  const fs::path dir = scratch("e2e");
  const fs::path flags_out = dir / "flags.json";
  const fs::path script = dir / "guest.sh";
  write_text(script,
             "#!/bin/sh\n"
             "IFS= read -r flags\n"
             "printf '%s' \"$flags\" > '" + flags_out.string() + "'\n"
             "echo '{\"kind\":\"checkVersion\",\"value\":[5,0]}'\n"
             "IFS= read -r response\n"
             "echo '{\"kind\":\"writeStdout\",\"value\":\"from guest\"}'\n"
             "IFS= read -r response\n"
             "echo '{\"kind\":\"exit\",\"value\":3}'\n");
  fs::permissions(script, fs::perms::owner_all);

  std::ostringstream out;
  hostcall::ExecutionContext ctx(test_config("e2e"), out);
  hostcall::ExecutableLoader loader(ctx.config().js_runner);
  hostcall::LaunchResult result;
  char env_entry[] = "GREETING=hi";
  char* envp[] = {env_entry, nullptr};
  auto guest = loader.launch(script, hostcall::make_launch_flags({"one", "two"}, "posix", envp), &result);
  expect(guest && result.ok, "guest launched: " + result.message);

  hostcall::Dispatcher d(guest->channel(), ctx);
  const int status = d.run();
  guest.reset();

  expect(status == 3, "guest exit status propagated");
  expect(out.str() == "from guest", "guest output written: " + out.str());
  const std::string flags = read_text(flags_out);
  expect(contains(flags, "\"arguments\":[\"one\",\"two\"]"), "arguments delivered: " + flags);
  expect(contains(flags, "[\"GREETING\",\"hi\"]"), "environment delivered");
  expect(contains(flags, "\"platform\":\"posix\""), "platform delivered");
}

}  // namespace

int main() {
  std::cout << "=== hostcall Test Suite ===\n";
  g_root = fs::temp_directory_path() / ("hostcall_tests_" + std::to_string(::getpid()));
  fs::remove_all(g_root);
  fs::create_directories(g_root);

  std::cout << "\n[PathSandbox]\n";
  run_test("anchor is trusted", test_anchor_is_trusted);
  run_test("descendants checked", test_descendants_checked);
  run_test("empty fragments", test_empty_fragments);

  std::cout << "\n[VersionNegotiator]\n";
  run_test("compatibility check", test_version_check);
  run_test("version manifest", test_version_manifest);

  std::cout << "\n[ProcessRunner]\n";
  run_test("success output", test_process_success);
  run_test("nonzero exit", test_process_exit_code);
  run_test("signaled", test_process_signaled);
  run_test("spawn failure", test_process_spawn_failure);
  run_test("working directory", test_process_working_directory);

  std::cout << "\n[TemporaryResourceRegistry]\n";
  run_test("distinct empty directories", test_temp_dirs_distinct);
  run_test("cleanup tolerates removed", test_temp_cleanup_tolerates_removed);
  run_test("missing root", test_temp_root_missing);

  std::cout << "\n[Codec & Transport]\n";
  run_test("JSON codec", test_json_codec);
  run_test("BLAKE3 known vectors", test_blake3_known_vectors);
  run_test("transcript order", test_transcript_order_sensitive);
  run_test("fd channel framing", test_fd_channel_framing);

  std::cout << "\n[CommandDispatcher]\n";
  run_test("one request at a time", test_dispatch_one_at_a_time);
  run_test("name alias", test_name_alias_accepted);
  run_test("unknown kind is fatal", test_unknown_kind_fatal);
  run_test("version mismatch is fatal", test_version_mismatch_fatal);
  run_test("exit status and cleanup", test_exit_status_and_cleanup);
  run_test("exit code out of range", test_exit_code_out_of_range);
  run_test("non-integer exit is fatal", test_exit_non_integer_fatal);
  run_test("malformed checkVersion is fatal", test_malformed_check_version_fatal);
  run_test("channel closed is fatal", test_channel_closed_fatal);
  run_test("malformed frame is fatal", test_malformed_frame_fatal);
  run_test("send failure is fatal", test_send_failure_fatal);
  run_test("invalid payload is recoverable", test_invalid_payload_recoverable);
  run_test("wire names", test_wire_names_round_trip);

  std::cout << "\n[Handlers]\n";
  run_test("file handlers", test_file_handlers);
  run_test("obliterate vs remove", test_obliterate_vs_remove);
  run_test("obliterated temp dir cleanup", test_obliterated_temp_dir_cleanup);
  run_test("execute", test_execute_handler);

  std::cout << "\n[Observability & Config]\n";
  run_test("event hook and stats", test_event_hook_and_stats);
  run_test("event log file", test_event_log_file);
  run_test("config from env", test_config_from_env);

  std::cout << "\n[ProgramLoader]\n";
  run_test("launch flags JSON", test_launch_flags_json);
  run_test("launch failures", test_launch_failures);
  run_test("end-to-end shell guest", test_end_to_end_shell_guest);

  fs::remove_all(g_root);
  std::cout << "\n=== " << g_tests_passed << "/" << g_tests_run << " tests passed ===\n";
  return 0;
}
