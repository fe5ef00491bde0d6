#include "hostcall/jsonlite.hpp"

// Notes on jsonlite:
//
// FRAMING:
//   to_json() never emits a raw newline: '\n' and every other control byte are
//   escaped, so one serialized value is always exactly one NDJSON line.
//
// TEXT:
//   Strings are carried as UTF-8 bytes. \uXXXX escapes (including surrogate
//   pairs) are decoded to UTF-8; a lone surrogate decodes to U+FFFD.
//   decode_utf8_lossy() is applied to file contents and process output before
//   they are placed in a response, so every emitted string is valid UTF-8.

#include <cctype>
#include <cstdio>
#include <cstdint>
#include <sstream>
#include <stdexcept>

namespace hostcall::jsonlite {

namespace {

void append_utf8(std::string& o, std::uint32_t cp) {
  if (cp < 0x80) {
    o += static_cast<char>(cp);
  } else if (cp < 0x800) {
    o += static_cast<char>(0xC0 | (cp >> 6));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    o += static_cast<char>(0xE0 | (cp >> 12));
    o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    o += static_cast<char>(0xF0 | (cp >> 18));
    o += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    o += static_cast<char>(0x80 | (cp & 0x3F));
  }
}

constexpr std::uint32_t kReplacementChar = 0xFFFD;

struct Parser {
  const std::string& s;
  size_t i{0};
  std::optional<JsonError> err;
  size_t depth{0};

  void ws() { while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i; }
  bool eat(char c) { ws(); if (i < s.size() && s[i] == c) { ++i; return true; } return false; }

  bool parse_hex4(std::uint32_t& out) {
    if (i + 4 > s.size()) return false;
    out = 0;
    for (size_t k = 0; k < 4; ++k) {
      const char c = s[i + k];
      out <<= 4;
      if (c >= '0' && c <= '9') out |= static_cast<std::uint32_t>(c - '0');
      else if (c >= 'a' && c <= 'f') out |= static_cast<std::uint32_t>(c - 'a' + 10);
      else if (c >= 'A' && c <= 'F') out |= static_cast<std::uint32_t>(c - 'A' + 10);
      else return false;
    }
    i += 4;
    return true;
  }

  void parse_unicode_escape(std::string& o) {
    std::uint32_t cp = 0;
    if (!parse_hex4(cp)) {
      err = JsonError{"json_parse_error", "invalid \\u escape"};
      return;
    }
    if (cp >= 0xD800 && cp <= 0xDBFF) {
      std::uint32_t low = 0;
      const size_t save = i;
      if (i + 1 < s.size() && s[i] == '\\' && s[i + 1] == 'u') {
        i += 2;
        if (parse_hex4(low) && low >= 0xDC00 && low <= 0xDFFF) {
          append_utf8(o, 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00));
          return;
        }
      }
      i = save;
      append_utf8(o, kReplacementChar);
      return;
    }
    if (cp >= 0xDC00 && cp <= 0xDFFF) cp = kReplacementChar;
    append_utf8(o, cp);
  }

  std::string parse_string() {
    if (!eat('"')) {
      err = JsonError{"json_parse_error", "expected string"};
      return {};
    }
    std::string o;
    while (i < s.size()) {
      char c = s[i++];
      if (c == '"') return o;
      if (c == '\\' && i < s.size()) {
        char n = s[i++];
        if (n == 'n') o += '\n';
        else if (n == 't') o += '\t';
        else if (n == 'r') o += '\r';
        else if (n == 'b') o += '\b';
        else if (n == 'f') o += '\f';
        else if (n == 'u') { parse_unicode_escape(o); if (err) return {}; }
        else if (n == '"' || n == '\\' || n == '/') o += n;
        else {
          err = JsonError{"json_parse_error", std::string("invalid escape \\") + n};
          return {};
        }
      } else if (static_cast<unsigned char>(c) < 0x20) {
        err = JsonError{"json_parse_error", "unescaped control character in string"};
        return {};
      } else {
        o += c;
      }
    }
    err = JsonError{"json_parse_error", "unterminated string"};
    return {};
  }

  bool parse_number(Value& out_val) {
    ws();
    size_t start = i;

    if (s.compare(i, 3, "NaN") == 0 || s.compare(i, 8, "Infinity") == 0 || s.compare(i, 9, "-Infinity") == 0) {
      err = JsonError{"json_parse_error", "NaN/Infinity unsupported"};
      return false;
    }

    if (i < s.size() && s[i] == '-') ++i;
    if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
      return false;
    }
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;

    bool has_frac = false;
    if (i < s.size() && s[i] == '.') {
      has_frac = true;
      ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        err = JsonError{"json_parse_error", "invalid number format"};
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }

    bool has_exp = false;
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
      has_exp = true;
      ++i;
      if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        err = JsonError{"json_parse_error", "invalid exponent"};
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }

    const std::string num_str = s.substr(start, i - start);
    try {
      if (has_frac || has_exp || num_str[0] == '-') {
        out_val = Value{std::stod(num_str)};
      } else {
        out_val = Value{static_cast<std::uint64_t>(std::stoull(num_str))};
      }
      return true;
    } catch (const std::exception&) {
      err = JsonError{"json_parse_error", "number out of range"};
      return false;
    }
  }

  Value parse_value() {
    ws();
    if (i >= s.size()) { err = JsonError{"json_parse_error", "unexpected eof"}; return {}; }
    if (depth >= kMaxDepth) { err = JsonError{"json_parse_error", "nesting too deep"}; return {}; }
    if (s[i] == '{') { ++depth; Value v{parse_object()}; --depth; return v; }
    if (s[i] == '[') { ++depth; Value v{parse_array()}; --depth; return v; }
    if (s[i] == '"') return Value{parse_string()};
    if (s.compare(i, 4, "true") == 0) { i += 4; return Value{true}; }
    if (s.compare(i, 5, "false") == 0) { i += 5; return Value{false}; }
    if (s.compare(i, 4, "null") == 0) { i += 4; return Value{nullptr}; }
    Value num_val;
    if (parse_number(num_val)) {
      return num_val;
    }
    if (!err) err = JsonError{"json_parse_error", "unexpected token"};
    return {};
  }

  Object parse_object() {
    Object out;
    eat('{');
    ws();
    if (eat('}')) return out;
    while (!err) {
      auto k = parse_string();
      if (err) break;
      if (out.contains(k)) { err = JsonError{"json_duplicate_key", "duplicate key: " + k}; break; }
      if (!eat(':')) { err = JsonError{"json_parse_error", "expected :"}; break; }
      out[k] = parse_value();
      if (err) break;
      if (eat('}')) break;
      if (!eat(',')) { err = JsonError{"json_parse_error", "expected ,"}; break; }
    }
    return out;
  }

  Array parse_array() {
    Array out;
    eat('[');
    ws();
    if (eat(']')) return out;
    while (!err) {
      out.push_back(parse_value());
      if (err) break;
      if (eat(']')) break;
      if (!eat(',')) { err = JsonError{"json_parse_error", "expected ,"}; break; }
    }
    return out;
  }
};

std::string escape_inner(const std::string& s) {
  bool needs_escape = false;
  for (unsigned char c : s) {
    if (c == '"' || c == '\\' || c < 0x20) {
      needs_escape = true;
      break;
    }
  }
  if (!needs_escape) return s;

  std::string o;
  o.reserve(s.size() + s.size() / 4 + 4);
  for (char c : s) {
    if (c == '"')        o += "\\\"";
    else if (c == '\\')  o += "\\\\";
    else if (c == '\b')  o += "\\b";
    else if (c == '\f')  o += "\\f";
    else if (c == '\n')  o += "\\n";
    else if (c == '\r')  o += "\\r";
    else if (c == '\t')  o += "\\t";
    else if (static_cast<unsigned char>(c) < 0x20) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
      o += buf;
    }
    else                 o += c;
  }
  return o;
}

// Integral doubles print without a fraction so negative exit codes survive a
// round trip as integers.
std::string format_double(double d) {
  char buf[64];
  int n = 0;
  if (d > -1e15 && d < 1e15 && d == static_cast<double>(static_cast<long long>(d))) {
    n = std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(d));
  } else {
    n = std::snprintf(buf, sizeof(buf), "%.17g", d);
  }
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "0";
  return std::string(buf, static_cast<size_t>(n));
}

Value finish(Parser& p) {
  auto v = p.parse_value();
  p.ws();
  if (!p.err && p.i != p.s.size()) p.err = JsonError{"json_parse_error", "trailing data"};
  return v;
}

}  // namespace

std::string to_json(const Value& v) {
  if (std::holds_alternative<std::nullptr_t>(v.v)) return "null";
  if (std::holds_alternative<bool>(v.v)) return std::get<bool>(v.v) ? "true" : "false";
  if (std::holds_alternative<std::string>(v.v)) return "\"" + escape_inner(std::get<std::string>(v.v)) + "\"";
  if (std::holds_alternative<std::uint64_t>(v.v)) return std::to_string(std::get<std::uint64_t>(v.v));
  if (std::holds_alternative<double>(v.v)) return format_double(std::get<double>(v.v));
  if (std::holds_alternative<Object>(v.v)) {
    std::ostringstream oss; oss << "{"; bool first = true;
    for (const auto& [k, vv] : std::get<Object>(v.v)) { if (!first) oss << ","; first = false; oss << "\"" << escape_inner(k) << "\"" << ":" << to_json(vv); }
    oss << "}"; return oss.str();
  }
  std::ostringstream oss; oss << "["; bool first = true;
  for (const auto& vv : std::get<Array>(v.v)) { if (!first) oss << ","; first = false; oss << to_json(vv); }
  oss << "]"; return oss.str();
}

Value parse_value(const std::string& text, std::optional<JsonError>* error) {
  Parser p{text};
  auto v = finish(p);
  if (error) *error = p.err;
  if (p.err) return {};
  return v;
}

std::optional<JsonError> validate_strict(const std::string& text) {
  Parser p{text};
  (void)finish(p);
  return p.err;
}

std::string escape(const std::string& s) { return escape_inner(s); }

std::string decode_utf8_lossy(std::string_view bytes) {
  std::string out;
  out.reserve(bytes.size());
  size_t i = 0;
  const size_t n = bytes.size();
  auto cont = [&](size_t k) {
    return k < n && (static_cast<unsigned char>(bytes[k]) & 0xC0) == 0x80;
  };
  while (i < n) {
    const unsigned char c = static_cast<unsigned char>(bytes[i]);
    size_t len = 0;
    std::uint32_t cp = 0;
    if (c < 0x80) { out += static_cast<char>(c); ++i; continue; }
    if (c >= 0xC2 && c <= 0xDF) { len = 2; cp = c & 0x1F; }
    else if (c >= 0xE0 && c <= 0xEF) { len = 3; cp = c & 0x0F; }
    else if (c >= 0xF0 && c <= 0xF4) { len = 4; cp = c & 0x07; }
    else { append_utf8(out, kReplacementChar); ++i; continue; }

    size_t k = 1;
    for (; k < len && cont(i + k); ++k) {
      cp = (cp << 6) | (static_cast<unsigned char>(bytes[i + k]) & 0x3F);
    }
    const bool overlong = (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000);
    const bool surrogate = cp >= 0xD800 && cp <= 0xDFFF;
    if (k < len || overlong || surrogate || cp > 0x10FFFF) {
      append_utf8(out, kReplacementChar);
      i += k;
      continue;
    }
    out.append(bytes.substr(i, len));
    i += len;
  }
  return out;
}

bool is_null(const Value& value) { return std::holds_alternative<std::nullptr_t>(value.v); }

const std::string* as_string(const Value& value) { return std::get_if<std::string>(&value.v); }

const Array* as_array(const Value& value) { return std::get_if<Array>(&value.v); }

const Object* as_object(const Value& value) { return std::get_if<Object>(&value.v); }

std::optional<std::int64_t> as_int(const Value& value) {
  if (const auto* u = std::get_if<std::uint64_t>(&value.v)) {
    if (*u > static_cast<std::uint64_t>(INT64_MAX)) return std::nullopt;
    return static_cast<std::int64_t>(*u);
  }
  if (const auto* d = std::get_if<double>(&value.v)) {
    if (*d < -9.2e18 || *d > 9.2e18) return std::nullopt;
    const auto n = static_cast<std::int64_t>(*d);
    if (static_cast<double>(n) != *d) return std::nullopt;
    return n;
  }
  return std::nullopt;
}

const Value* find(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  return it == obj.end() ? nullptr : &it->second;
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<std::string>(it->second.v)) return def;
  return std::get<std::string>(it->second.v);
}

std::optional<std::vector<std::string>> as_string_array(const Value& value) {
  const auto* arr = as_array(value);
  if (!arr) return std::nullopt;
  std::vector<std::string> out;
  out.reserve(arr->size());
  for (const auto& item : *arr) {
    const auto* s = as_string(item);
    if (!s) return std::nullopt;
    out.push_back(*s);
  }
  return out;
}

}  // namespace hostcall::jsonlite
