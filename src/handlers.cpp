#include "hostcall/dispatcher.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <optional>
#include <ostream>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>

#include "hostcall/path_sandbox.hpp"
#include "hostcall/process_runner.hpp"
#include "hostcall/version.hpp"

namespace fs = std::filesystem;

namespace hostcall {

HandlerResult HandlerResult::success(jsonlite::Value v) {
  HandlerResult r;
  r.response = std::move(v);
  return r;
}

HandlerResult HandlerResult::failure(ErrorCode code, const std::string& message) {
  jsonlite::Object err;
  err["message"] = message;
  return failure_with(code, std::move(err));
}

HandlerResult HandlerResult::failure_with(ErrorCode code, jsonlite::Value payload) {
  HandlerResult r;
  r.response = std::move(payload);
  r.ok = false;
  r.error_code = code;
  return r;
}

HandlerResult HandlerResult::terminate(int status, std::string reason, ErrorCode code) {
  HandlerResult r;
  r.ok = (code == ErrorCode::none);
  r.error_code = code;
  r.terminate_status = status;
  r.terminate_reason = std::move(reason);
  return r;
}

namespace handlers {

namespace {

HandlerResult io_error(const std::error_code& ec, const fs::path& p) {
  return HandlerResult::failure(ErrorCode::io_failure, ec.message() + ": " + p.string());
}

HandlerResult io_error(std::errc e, const fs::path& p) {
  return io_error(std::make_error_code(e), p);
}

HandlerResult path_error(const PathResolution& res) {
  return HandlerResult::failure(res.error_code, res.message);
}

// Resolves a fragment-array payload. On failure *error holds the response.
bool resolve_value(const jsonlite::Value& v, fs::path* out, HandlerResult* error) {
  auto fragments = jsonlite::as_string_array(v);
  if (!fragments) {
    *error = HandlerResult::failure(ErrorCode::invalid_payload,
                                    "Expected an array of path fragments");
    return false;
  }
  PathResolution res = resolve_path(*fragments);
  if (!res.ok) {
    *error = path_error(res);
    return false;
  }
  *out = std::move(res.path);
  return true;
}

bool resolve_field(const jsonlite::Value& v, const std::string& key, fs::path* out,
                   HandlerResult* error) {
  const jsonlite::Object* obj = jsonlite::as_object(v);
  const jsonlite::Value* field = obj ? jsonlite::find(*obj, key) : nullptr;
  if (!field) {
    *error = HandlerResult::failure(ErrorCode::invalid_payload, "Missing field: " + key);
    return false;
  }
  return resolve_value(*field, out, error);
}

template <typename Pred>
HandlerResult list_entries(const jsonlite::Value& v, Pred keep) {
  fs::path dir;
  HandlerResult error;
  if (!resolve_value(v, &dir, &error)) return error;

  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) return io_error(ec, dir);

  std::vector<std::string> names;
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    std::error_code st_ec;
    const fs::file_status st = it->status(st_ec);
    if (keep(st)) names.push_back(it->path().filename().string());
  }
  if (ec) return io_error(ec, dir);

  std::sort(names.begin(), names.end());
  jsonlite::Array out;
  out.reserve(names.size());
  for (auto& n : names) out.emplace_back(std::move(n));
  return HandlerResult::success(std::move(out));
}

}  // namespace

HandlerResult check_version(const jsonlite::Value& v, ExecutionContext& ctx) {
  const jsonlite::Array* arr = jsonlite::as_array(v);
  std::optional<std::int64_t> major;
  std::optional<std::int64_t> minor;
  if (arr && arr->size() == 2) {
    major = jsonlite::as_int((*arr)[0]);
    minor = jsonlite::as_int((*arr)[1]);
  }
  if (!major || !minor) {
    ctx.diagnostic("Malformed checkVersion request: expected [major, minor], got " +
                   jsonlite::to_json(v));
    return HandlerResult::terminate(1, "malformed_frame", ErrorCode::malformed_frame);
  }

  const auto result = version::check_compatibility(version::VersionRequirement{*major, *minor});
  if (!result.ok) {
    for (const auto& line : result.diagnostic_lines) ctx.diagnostic(line);
    return HandlerResult::terminate(1, "version_mismatch", ErrorCode::version_mismatch);
  }
  return HandlerResult::success(nullptr);
}

HandlerResult write_stdout(const jsonlite::Value& v, ExecutionContext& ctx) {
  const std::string* text = jsonlite::as_string(v);
  if (!text) return HandlerResult::failure(ErrorCode::invalid_payload, "Expected a string");
  ctx.out() << *text;
  ctx.out().flush();
  if (!ctx.out()) return HandlerResult::failure(ErrorCode::io_failure, "Could not write to stdout");
  return HandlerResult::success(nullptr);
}

HandlerResult exit(const jsonlite::Value& v, ExecutionContext& ctx) {
  auto status = jsonlite::as_int(v);
  if (!status) {
    ctx.diagnostic("Invalid exit code: " + jsonlite::to_json(v));
    return HandlerResult::terminate(1, "invalid_payload", ErrorCode::invalid_payload);
  }
  // Process exit statuses are 8 bits wide.
  if (*status < 0 || *status > 255) return HandlerResult::terminate(1, "exit");
  return HandlerResult::terminate(static_cast<int>(*status), "exit");
}

HandlerResult read_file(const jsonlite::Value& v) {
  fs::path p;
  HandlerResult error;
  if (!resolve_value(v, &p, &error)) return error;

  std::error_code ec;
  const fs::file_status st = fs::status(p, ec);
  if (ec) return io_error(ec, p);
  if (fs::is_directory(st)) return io_error(std::errc::is_a_directory, p);

  std::ifstream in(p, std::ios::binary);
  if (!in) return HandlerResult::failure(ErrorCode::io_failure, "Could not open file: " + p.string());
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) return HandlerResult::failure(ErrorCode::io_failure, "Could not read file: " + p.string());
  return HandlerResult::success(jsonlite::decode_utf8_lossy(ss.str()));
}

HandlerResult write_file(const jsonlite::Value& v) {
  fs::path p;
  HandlerResult error;
  if (!resolve_field(v, "path", &p, &error)) return error;
  const jsonlite::Value* contents = jsonlite::find(*jsonlite::as_object(v), "contents");
  const std::string* text = contents ? jsonlite::as_string(*contents) : nullptr;
  if (!text) return HandlerResult::failure(ErrorCode::invalid_payload, "Missing field: contents");

  std::error_code ec;
  if (fs::is_directory(p, ec)) return io_error(std::errc::is_a_directory, p);
  if (!fs::is_directory(p.parent_path(), ec)) {
    return io_error(std::errc::no_such_file_or_directory, p);
  }

  std::ofstream out(p, std::ios::binary | std::ios::trunc);
  if (!out) return HandlerResult::failure(ErrorCode::io_failure, "Could not open file: " + p.string());
  out.write(text->data(), static_cast<std::streamsize>(text->size()));
  out.close();
  if (!out) return HandlerResult::failure(ErrorCode::io_failure, "Could not write file: " + p.string());
  return HandlerResult::success(nullptr);
}

HandlerResult list_files(const jsonlite::Value& v) {
  return list_entries(v, [](const fs::file_status& st) { return fs::is_regular_file(st); });
}

HandlerResult list_subdirectories(const jsonlite::Value& v) {
  return list_entries(v, [](const fs::file_status& st) { return fs::is_directory(st); });
}

HandlerResult execute(const jsonlite::Value& v) {
  const jsonlite::Object* obj = jsonlite::as_object(v);
  const jsonlite::Value* command = obj ? jsonlite::find(*obj, "command") : nullptr;
  const jsonlite::Value* arguments = obj ? jsonlite::find(*obj, "arguments") : nullptr;
  const std::string* command_text = command ? jsonlite::as_string(*command) : nullptr;
  auto args = arguments ? jsonlite::as_string_array(*arguments)
                        : std::optional<std::vector<std::string>>(std::vector<std::string>{});
  if (!command_text || !args) {
    return HandlerResult::failure(ErrorCode::invalid_payload,
                                  "Expected {command, arguments, options}");
  }

  ProcessSpec spec;
  spec.command = *command_text;
  spec.argv = std::move(*args);

  const jsonlite::Value* options = jsonlite::find(*obj, "options");
  const jsonlite::Object* opts = options ? jsonlite::as_object(*options) : nullptr;
  const jsonlite::Value* wd = opts ? jsonlite::find(*opts, "workingDirectory") : nullptr;
  if (wd && !jsonlite::is_null(*wd)) {
    fs::path cwd;
    HandlerResult error;
    if (!resolve_value(*wd, &cwd, &error)) {
      const jsonlite::Object* err = jsonlite::as_object(error.response);
      jsonlite::Object failed;
      failed["error"] = "failed";
      failed["message"] = err ? jsonlite::get_string(*err, "message") : std::string();
      return HandlerResult::failure_with(error.error_code, std::move(failed));
    }
    spec.cwd = std::move(cwd);
  }

  ProcessOutcome outcome = run_process(spec);
  jsonlite::Object err;
  switch (outcome.kind) {
    case ProcessOutcomeKind::success:
      return HandlerResult::success(std::move(outcome.output));
    case ProcessOutcomeKind::exited:
      err["error"] = "exited";
      err["code"] = outcome.exit_code;
      break;
    case ProcessOutcomeKind::signaled:
      err["error"] = "terminated";
      break;
    case ProcessOutcomeKind::failed:
      err["error"] = "failed";
      err["message"] = outcome.message;
      break;
  }
  return HandlerResult::failure_with(outcome.error_code(), std::move(err));
}

HandlerResult copy_file(const jsonlite::Value& v) {
  fs::path src;
  fs::path dst;
  HandlerResult error;
  if (!resolve_field(v, "sourcePath", &src, &error)) return error;
  if (!resolve_field(v, "destinationPath", &dst, &error)) return error;

  std::error_code ec;
  fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
  if (ec) return io_error(ec, src);
  return HandlerResult::success(nullptr);
}

HandlerResult move_file(const jsonlite::Value& v) {
  fs::path src;
  fs::path dst;
  HandlerResult error;
  if (!resolve_field(v, "sourcePath", &src, &error)) return error;
  if (!resolve_field(v, "destinationPath", &dst, &error)) return error;

  std::error_code ec;
  fs::rename(src, dst, ec);
  if (ec) return io_error(ec, src);
  return HandlerResult::success(nullptr);
}

HandlerResult delete_file(const jsonlite::Value& v) {
  fs::path p;
  HandlerResult error;
  if (!resolve_value(v, &p, &error)) return error;

  std::error_code ec;
  const fs::file_status st = fs::symlink_status(p, ec);
  if (st.type() == fs::file_type::not_found) return io_error(std::errc::no_such_file_or_directory, p);
  if (ec) return io_error(ec, p);
  if (fs::is_directory(st)) return io_error(std::errc::is_a_directory, p);

  if (!fs::remove(p, ec) || ec) {
    return ec ? io_error(ec, p) : io_error(std::errc::no_such_file_or_directory, p);
  }
  return HandlerResult::success(nullptr);
}

HandlerResult stat(const jsonlite::Value& v) {
  fs::path p;
  HandlerResult error;
  if (!resolve_value(v, &p, &error)) return error;

  std::error_code ec;
  const fs::file_status st = fs::status(p, ec);
  // ENOTDIR on an intermediate component also reports not_found.
  if (st.type() == fs::file_type::not_found) {
    HandlerResult r = HandlerResult::success("nonexistent");
    r.error_code = ErrorCode::stat_nonexistent;
    return r;
  }
  if (ec) return io_error(ec, p);
  if (fs::is_regular_file(st)) return HandlerResult::success("file");
  if (fs::is_directory(st)) return HandlerResult::success("directory");
  return HandlerResult::success("other");
}

HandlerResult create_directory(const jsonlite::Value& v) {
  fs::path p;
  HandlerResult error;
  if (!resolve_value(v, &p, &error)) return error;

  std::error_code ec;
  fs::create_directories(p, ec);
  if (ec) return io_error(ec, p);
  if (!fs::is_directory(p, ec)) return io_error(std::errc::file_exists, p);
  return HandlerResult::success(nullptr);
}

HandlerResult remove_directory(const jsonlite::Value& v) {
  fs::path p;
  HandlerResult error;
  if (!resolve_value(v, &p, &error)) return error;

  std::error_code ec;
  const fs::file_status st = fs::symlink_status(p, ec);
  if (st.type() == fs::file_type::not_found) return io_error(std::errc::no_such_file_or_directory, p);
  if (ec) return io_error(ec, p);
  if (!fs::is_directory(st)) return io_error(std::errc::not_a_directory, p);

  fs::remove(p, ec);
  if (ec) return io_error(ec, p);
  return HandlerResult::success(nullptr);
}

HandlerResult obliterate_directory(const jsonlite::Value& v) {
  fs::path p;
  HandlerResult error;
  if (!resolve_value(v, &p, &error)) return error;

  std::error_code ec;
  const fs::file_status st = fs::symlink_status(p, ec);
  if (st.type() == fs::file_type::not_found) return io_error(std::errc::no_such_file_or_directory, p);
  if (ec) return io_error(ec, p);
  if (!fs::is_directory(st)) return io_error(std::errc::not_a_directory, p);

  fs::remove_all(p, ec);
  if (ec) return io_error(ec, p);
  return HandlerResult::success(nullptr);
}

HandlerResult create_temporary_directory(ExecutionContext& ctx) {
  TempDirResult res = ctx.temp_registry().create();
  if (!res.ok) return HandlerResult::failure(res.error_code, res.message);
  return HandlerResult::success(res.path.string());
}

}  // namespace handlers
}  // namespace hostcall
