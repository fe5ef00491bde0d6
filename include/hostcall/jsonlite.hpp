#pragma once

// hostcall/jsonlite.hpp — Minimal strict JSON codec for the NDJSON protocol.
//
// WIRE SHAPE:
//   Every frame exchanged with the guest is one JSON value on one line.
//   Requests are objects ({"kind": ..., "value": ...}); responses may be any
//   value (null, string, array, or an error object).
//
// NUMBERS:
//   Non-negative integers are stored as uint64; negative integers and numbers
//   with a fraction or exponent are stored as double. as_int() accepts both
//   when the value is integral.
//
// STRICTNESS:
//   Duplicate object keys, trailing data, NaN/Infinity and unterminated
//   strings are rejected with a JsonError. Nesting is capped at kMaxDepth.

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace hostcall::jsonlite {

constexpr std::size_t kMaxDepth = 256;

struct JsonError {
  std::string code;
  std::string message;
};

struct Value;
using Array = std::vector<Value>;
using Object = std::map<std::string, Value>;

struct Value {
  std::variant<std::nullptr_t, bool, std::uint64_t, double, std::string, Array, Object> v;

  Value() : v(nullptr) {}
  Value(std::nullptr_t) : v(nullptr) {}
  Value(bool b) : v(b) {}
  Value(double d) : v(d) {}
  Value(const char* s) : v(std::string(s)) {}
  Value(std::string s) : v(std::move(s)) {}
  Value(Array a) : v(std::move(a)) {}
  Value(Object o) : v(std::move(o)) {}

  template <typename T,
            std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool>, int> = 0>
  Value(T n) {
    if constexpr (std::is_signed_v<T>) {
      if (n < 0) {
        v = static_cast<double>(n);
        return;
      }
    }
    v = static_cast<std::uint64_t>(n);
  }
};

// Parse any JSON value. On failure *error is set and a null Value is returned.
Value parse_value(const std::string& text, std::optional<JsonError>* error);

std::optional<JsonError> validate_strict(const std::string& text);

// Compact serialization. Object keys come out sorted (std::map order).
std::string to_json(const Value& value);

std::string escape(const std::string& s);

// Replace every invalid UTF-8 sequence with U+FFFD.
std::string decode_utf8_lossy(std::string_view bytes);

// Type-safe views. Return nullptr / nullopt when the alternative differs.
bool is_null(const Value& value);
const std::string* as_string(const Value& value);
const Array* as_array(const Value& value);
const Object* as_object(const Value& value);
std::optional<std::int64_t> as_int(const Value& value);
const Value* find(const Object& obj, const std::string& key);

// Convenience extractor with a default.
std::string get_string(const Object& obj, const std::string& key, const std::string& def = "");

// Returns nullopt unless value is an array whose every element is a string.
std::optional<std::vector<std::string>> as_string_array(const Value& value);

}  // namespace hostcall::jsonlite
