#include "walkforage/util/json.h"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace walkforage::json {
namespace {

const char* type_name(const Value& v) {
  if (v.is_null()) return "null";
  if (v.is_bool()) return "bool";
  if (v.is_number()) return "number";
  if (v.is_string()) return "string";
  if (v.is_array()) return "array";
  return "object";
}

[[noreturn]] void type_error(const char* what, const char* expected, const Value& got) {
  throw std::runtime_error(std::string("JSON ") + what + ": expected " + expected + ", got " + type_name(got));
}

class Reader {
 public:
  explicit Reader(const std::string& text) : s_(text) {
    if (s_.size() >= 3 && static_cast<unsigned char>(s_[0]) == 0xEF && static_cast<unsigned char>(s_[1]) == 0xBB &&
        static_cast<unsigned char>(s_[2]) == 0xBF) {
      pos_ = 3;
    }
  }

  Value document() {
    Value v = value();
    skip_ws();
    if (pos_ != s_.size()) fail("trailing characters after document");
    return v;
  }

 private:
  const std::string& s_;
  std::size_t pos_{0};

  [[noreturn]] void fail(const std::string& msg) const {
    int line = 1;
    int col = 1;
    for (std::size_t k = 0; k < pos_ && k < s_.size(); ++k) {
      if (s_[k] == '\n') {
        ++line;
        col = 1;
      } else {
        ++col;
      }
    }
    std::ostringstream ss;
    ss << "JSON parse error (line " << line << ", col " << col << "): " << msg;
    throw std::runtime_error(ss.str());
  }

  bool at_end() const { return pos_ >= s_.size(); }
  char peek() const { return at_end() ? '\0' : s_[pos_]; }

  void skip_ws() {
    while (!at_end() && std::isspace(static_cast<unsigned char>(s_[pos_]))) ++pos_;
  }

  void expect(char c) {
    skip_ws();
    if (peek() != c) fail(std::string("expected '") + c + "'");
    ++pos_;
  }

  bool accept(char c) {
    skip_ws();
    if (peek() != c) return false;
    ++pos_;
    return true;
  }

  Value value() {
    skip_ws();
    switch (peek()) {
      case '{': return object();
      case '[': return array();
      case '"': return string();
      case 't': keyword("true"); return true;
      case 'f': keyword("false"); return false;
      case 'n': keyword("null"); return nullptr;
      default: break;
    }
    if (peek() == '-' || std::isdigit(static_cast<unsigned char>(peek()))) return number();
    if (at_end()) fail("unexpected end of input");
    fail(std::string("unexpected character '") + peek() + "'");
  }

  void keyword(const char* word) {
    for (const char* p = word; *p; ++p) {
      if (peek() != *p) fail(std::string("invalid literal, expected ") + word);
      ++pos_;
    }
  }

  void digits() {
    if (!std::isdigit(static_cast<unsigned char>(peek()))) fail("expected digit");
    while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
  }

  Value number() {
    const std::size_t start = pos_;
    if (peek() == '-') ++pos_;
    if (peek() == '0') {
      ++pos_;
    } else {
      digits();
    }
    if (peek() == '.') {
      ++pos_;
      digits();
    }
    if (peek() == 'e' || peek() == 'E') {
      ++pos_;
      if (peek() == '+' || peek() == '-') ++pos_;
      digits();
    }
    std::istringstream in(s_.substr(start, pos_ - start));
    in.imbue(std::locale::classic());
    double d = 0.0;
    in >> d;
    if (!in) fail("number out of range");
    return d;
  }

  unsigned hex4() {
    unsigned code = 0;
    for (int k = 0; k < 4; ++k) {
      const char h = peek();
      ++pos_;
      code <<= 4;
      if (h >= '0' && h <= '9') {
        code |= static_cast<unsigned>(h - '0');
      } else if (h >= 'a' && h <= 'f') {
        code |= static_cast<unsigned>(h - 'a' + 10);
      } else if (h >= 'A' && h <= 'F') {
        code |= static_cast<unsigned>(h - 'A' + 10);
      } else {
        fail("invalid \\u escape");
      }
    }
    return code;
  }

  static void put_utf8(std::uint32_t cp, std::string& out) {
    if (cp < 0x80) {
      out += static_cast<char>(cp);
    } else if (cp < 0x800) {
      out += static_cast<char>(0xC0 | (cp >> 6));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
      out += static_cast<char>(0xE0 | (cp >> 12));
      out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
      out += static_cast<char>(0xF0 | (cp >> 18));
      out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
      out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      out += static_cast<char>(0x80 | (cp & 0x3F));
    }
  }

  std::string raw_string() {
    expect('"');
    std::string out;
    for (;;) {
      if (at_end()) fail("unterminated string");
      const char c = s_[pos_++];
      if (c == '"') return out;
      if (c != '\\') {
        out += c;
        continue;
      }
      if (at_end()) fail("unterminated escape");
      const char e = s_[pos_++];
      switch (e) {
        case '"': out += '"'; break;
        case '\\': out += '\\'; break;
        case '/': out += '/'; break;
        case 'b': out += '\b'; break;
        case 'f': out += '\f'; break;
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        case 't': out += '\t'; break;
        case 'u': {
          std::uint32_t cp = hex4();
          if (cp >= 0xD800 && cp <= 0xDBFF) {
            if (peek() != '\\') fail("missing low surrogate");
            ++pos_;
            if (peek() != 'u') fail("missing low surrogate");
            ++pos_;
            const unsigned lo = hex4();
            if (lo < 0xDC00 || lo > 0xDFFF) fail("invalid low surrogate");
            cp = 0x10000u + ((cp - 0xD800u) << 10) + (lo - 0xDC00u);
          } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
            fail("unpaired low surrogate");
          }
          put_utf8(cp, out);
          break;
        }
        default: fail(std::string("unknown escape '\\") + e + "'");
      }
    }
  }

  Value string() { return raw_string(); }

  Value array() {
    expect('[');
    Array out;
    if (accept(']')) return out;
    do {
      out.push_back(value());
    } while (accept(','));
    expect(']');
    return out;
  }

  Value object() {
    expect('{');
    Object out;
    if (accept('}')) return out;
    do {
      skip_ws();
      if (peek() != '"') fail("expected string key");
      std::string key = raw_string();
      expect(':');
      Value v = value();
      if (!out.emplace(key, std::move(v)).second) fail("duplicate key '" + key + "'");
    } while (accept(','));
    expect('}');
    return out;
  }
};

void write_escaped(const std::string& in, std::string& out) {
  out += '"';
  for (const char c : in) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out += buf;
        } else {
          out += c;
        }
    }
  }
  out += '"';
}

void write_value(const Value& v, std::string& out, int indent, int depth) {
  const auto newline = [&](int d) {
    if (indent <= 0) return;
    out += '\n';
    out.append(static_cast<std::size_t>(d * indent), ' ');
  };

  if (v.is_null()) {
    out += "null";
  } else if (v.is_bool()) {
    out += std::get<bool>(v) ? "true" : "false";
  } else if (v.is_number()) {
    const double d = std::get<double>(v);
    if (std::isfinite(d) && d == std::floor(d) && std::fabs(d) < 9.0e15) {
      out += std::to_string(static_cast<long long>(d));
    } else {
      std::ostringstream ss;
      ss.imbue(std::locale::classic());
      ss.precision(17);
      ss << d;
      out += ss.str();
    }
  } else if (v.is_string()) {
    write_escaped(std::get<std::string>(v), out);
  } else if (v.is_array()) {
    const auto& a = std::get<Array>(v);
    out += '[';
    for (std::size_t k = 0; k < a.size(); ++k) {
      if (k > 0) out += ',';
      newline(depth + 1);
      write_value(a[k], out, indent, depth + 1);
    }
    if (!a.empty()) newline(depth);
    out += ']';
  } else {
    const auto& o = std::get<Object>(v);
    out += '{';
    bool first = true;
    for (const auto& [k, child] : o) {
      if (!first) out += ',';
      first = false;
      newline(depth + 1);
      write_escaped(k, out);
      out += indent > 0 ? ": " : ":";
      write_value(child, out, indent, depth + 1);
    }
    if (!o.empty()) newline(depth);
    out += '}';
  }
}

} // namespace

bool Value::as_bool(const char* what) const {
  if (const auto* p = std::get_if<bool>(this)) return *p;
  type_error(what, "bool", *this);
}

double Value::as_number(const char* what) const {
  if (const auto* p = std::get_if<double>(this)) return *p;
  type_error(what, "number", *this);
}

std::int64_t Value::as_int(const char* what) const {
  const double d = as_number(what);
  if (!std::isfinite(d) || d != std::floor(d)) {
    throw std::runtime_error(std::string("JSON ") + what + ": expected an integer");
  }
  // 2^63; the cast is only defined strictly inside the int64 range.
  constexpr double kLimit = 9223372036854775808.0;
  if (d >= kLimit || d < -kLimit) throw std::runtime_error(std::string("JSON ") + what + ": integer out of range");
  return static_cast<std::int64_t>(d);
}

const std::string& Value::as_string(const char* what) const {
  if (const auto* p = std::get_if<std::string>(this)) return *p;
  type_error(what, "string", *this);
}

const Array& Value::as_array(const char* what) const {
  if (const auto* p = std::get_if<Array>(this)) return *p;
  type_error(what, "array", *this);
}

const Object& Value::as_object(const char* what) const {
  if (const auto* p = std::get_if<Object>(this)) return *p;
  type_error(what, "object", *this);
}

const Value* Value::find(const std::string& key) const {
  const auto* o = std::get_if<Object>(this);
  if (!o) return nullptr;
  const auto it = o->find(key);
  return it == o->end() ? nullptr : &it->second;
}

bool Value::bool_or(const std::string& key, bool def) const {
  const Value* v = find(key);
  return v ? v->as_bool(key.c_str()) : def;
}

double Value::number_or(const std::string& key, double def) const {
  const Value* v = find(key);
  return v ? v->as_number(key.c_str()) : def;
}

std::string Value::string_or(const std::string& key, const std::string& def) const {
  const Value* v = find(key);
  return v ? v->as_string(key.c_str()) : def;
}

Value parse(const std::string& text) { return Reader(text).document(); }

std::string stringify(const Value& v, int indent) {
  std::string out;
  write_value(v, out, indent, 0);
  return out;
}

} // namespace walkforage::json
