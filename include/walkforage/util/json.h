#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace walkforage::json {

struct Value;
using Array = std::vector<Value>;
// Keys are kept sorted so that stringify() output is stable.
using Object = std::map<std::string, Value>;

// Small JSON document model used for content tables and CLI reports.
struct Value : std::variant<std::nullptr_t, bool, double, std::string, Array, Object> {
  using variant::variant;

  bool is_null() const { return std::holds_alternative<std::nullptr_t>(*this); }
  bool is_bool() const { return std::holds_alternative<bool>(*this); }
  bool is_number() const { return std::holds_alternative<double>(*this); }
  bool is_string() const { return std::holds_alternative<std::string>(*this); }
  bool is_array() const { return std::holds_alternative<Array>(*this); }
  bool is_object() const { return std::holds_alternative<Object>(*this); }

  // Typed accessors. Throw std::runtime_error naming `what` on a type mismatch.
  bool as_bool(const char* what = "value") const;
  double as_number(const char* what = "value") const;
  std::int64_t as_int(const char* what = "value") const;
  const std::string& as_string(const char* what = "value") const;
  const Array& as_array(const char* what = "value") const;
  const Object& as_object(const char* what = "value") const;

  // Object member lookup; nullptr when this is not an object or the key is absent.
  const Value* find(const std::string& key) const;

  // Lenient getters for optional members.
  bool bool_or(const std::string& key, bool def) const;
  double number_or(const std::string& key, double def) const;
  std::string string_or(const std::string& key, const std::string& def) const;
};

// Parse a JSON document. Throws std::runtime_error with a line/column on malformed input.
// A leading UTF-8 byte order mark is skipped.
Value parse(const std::string& text);

// Serialize. indent <= 0 produces a single line.
std::string stringify(const Value& v, int indent = 2);

} // namespace walkforage::json
