#include "turngate/util/json.h"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace turngate::json {
namespace {

bool has_utf8_bom(const std::string& s) {
  return s.size() >= 3 && static_cast<unsigned char>(s[0]) == 0xEF &&
         static_cast<unsigned char>(s[1]) == 0xBB && static_cast<unsigned char>(s[2]) == 0xBF;
}

class Reader {
 public:
  explicit Reader(const std::string& text) : s_(text), pos_(has_utf8_bom(text) ? 3 : 0) {}

  Value document() {
    Value v = value(0);
    skip_ws();
    if (pos_ != s_.size()) fail("trailing characters after JSON value");
    return v;
  }

 private:
  static constexpr int kMaxDepth = 256;

  const std::string& s_;
  std::size_t pos_;

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
    ss << "JSON parse error at line " << line << ", col " << col << ": " << msg;
    throw std::runtime_error(ss.str());
  }

  char peek() const { return pos_ < s_.size() ? s_[pos_] : '\0'; }

  void skip_ws() {
    while (pos_ < s_.size() && std::isspace(static_cast<unsigned char>(s_[pos_]))) ++pos_;
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

  Value value(int depth) {
    if (depth > kMaxDepth) fail("nesting too deep");
    skip_ws();
    switch (peek()) {
      case '{': return object(depth);
      case '[': return array(depth);
      case '"': return string();
      case 't': return literal("true", true);
      case 'f': return literal("false", false);
      case 'n': return literal("null", nullptr);
      default: break;
    }
    if (peek() == '-' || std::isdigit(static_cast<unsigned char>(peek()))) return number();
    fail("unexpected character");
  }

  Value literal(const char* word, Value v) {
    for (const char* p = word; *p; ++p) {
      if (peek() != *p) fail(std::string("invalid literal, expected ") + word);
      ++pos_;
    }
    return v;
  }

  Value number() {
    const std::size_t start = pos_;
    if (peek() == '-') ++pos_;
    if (!std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number");
    if (peek() == '0') {
      ++pos_;
    } else {
      while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
    }
    if (peek() == '.') {
      ++pos_;
      if (!std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number fraction");
      while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
    }
    if (peek() == 'e' || peek() == 'E') {
      ++pos_;
      if (peek() == '+' || peek() == '-') ++pos_;
      if (!std::isdigit(static_cast<unsigned char>(peek()))) fail("invalid number exponent");
      while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
    }
    const std::string token = s_.substr(start, pos_ - start);
    std::istringstream in(token);
    in.imbue(std::locale::classic());
    double d = 0.0;
    in >> d;
    if (in.fail()) fail("number out of range");
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
        fail("bad \\u escape");
      }
    }
    return code;
  }

  static void put_utf8(std::uint32_t cp, std::string& out) {
    if (cp < 0x80) {
      out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
      out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
      out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }

  std::string string() {
    expect('"');
    std::string out;
    for (;;) {
      if (pos_ >= s_.size()) fail("unterminated string");
      const char c = s_[pos_++];
      if (c == '"') break;
      if (static_cast<unsigned char>(c) < 0x20) fail("control character in string");
      if (c != '\\') {
        out.push_back(c);
        continue;
      }
      if (pos_ >= s_.size()) fail("unterminated escape");
      const char e = s_[pos_++];
      switch (e) {
        case '"': out.push_back('"'); break;
        case '\\': out.push_back('\\'); break;
        case '/': out.push_back('/'); break;
        case 'b': out.push_back('\b'); break;
        case 'f': out.push_back('\f'); break;
        case 'n': out.push_back('\n'); break;
        case 'r': out.push_back('\r'); break;
        case 't': out.push_back('\t'); break;
        case 'u': {
          unsigned cp = hex4();
          if (cp >= 0xD800 && cp <= 0xDBFF) {
            if (peek() != '\\') fail("expected low surrogate");
            ++pos_;
            if (peek() != 'u') fail("expected low surrogate");
            ++pos_;
            const unsigned lo = hex4();
            if (lo < 0xDC00 || lo > 0xDFFF) fail("invalid low surrogate");
            cp = 0x10000u + ((cp - 0xD800u) << 10) + (lo - 0xDC00u);
          } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
            fail("unexpected low surrogate");
          }
          put_utf8(cp, out);
          break;
        }
        default: fail("unknown escape");
      }
    }
    return out;
  }

  Value array(int depth) {
    expect('[');
    Array out;
    if (accept(']')) return out;
    do {
      out.push_back(value(depth + 1));
    } while (accept(','));
    expect(']');
    return out;
  }

  Value object(int depth) {
    expect('{');
    Object out;
    if (accept('}')) return out;
    do {
      skip_ws();
      if (peek() != '"') fail("expected string key");
      std::string key = string();
      expect(':');
      out[std::move(key)] = value(depth + 1);
    } while (accept(','));
    expect('}');
    return out;
  }
};

void write_escaped(const std::string& in, std::string& out) {
  out.push_back('"');
  for (char c : in) {
    switch (c) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out += buf;
        } else {
          out.push_back(c);
        }
    }
  }
  out.push_back('"');
}

void write_number(double d, std::string& out) {
  if (!std::isfinite(d)) {
    // JSON has no representation for inf/nan.
    out += "null";
    return;
  }
  if (is_integral(d)) {
    out += std::to_string(static_cast<std::int64_t>(d));
    return;
  }
  std::ostringstream ss;
  ss.imbue(std::locale::classic());
  ss.precision(17);
  ss << d;
  out += ss.str();
}

void newline(std::string& out, int indent, int depth) {
  if (indent <= 0) return;
  out.push_back('\n');
  out.append(static_cast<std::size_t>(indent * depth), ' ');
}

void write_value(const Value& v, std::string& out, int indent, int depth) {
  if (v.is_null()) {
    out += "null";
  } else if (const bool* b = v.as_bool()) {
    out += *b ? "true" : "false";
  } else if (const double* d = v.as_number()) {
    write_number(*d, out);
  } else if (const std::string* s = v.as_string()) {
    write_escaped(*s, out);
  } else if (const Array* a = v.as_array()) {
    out.push_back('[');
    for (std::size_t i = 0; i < a->size(); ++i) {
      if (i > 0) out.push_back(',');
      newline(out, indent, depth + 1);
      write_value((*a)[i], out, indent, depth + 1);
    }
    if (!a->empty()) newline(out, indent, depth);
    out.push_back(']');
  } else {
    const Object& o = v.object();
    out.push_back('{');
    bool first = true;
    for (const auto& [key, child] : o) {
      if (!first) out.push_back(',');
      first = false;
      newline(out, indent, depth + 1);
      write_escaped(key, out);
      out.push_back(':');
      if (indent > 0) out.push_back(' ');
      write_value(child, out, indent, depth + 1);
    }
    if (!o.empty()) newline(out, indent, depth);
    out.push_back('}');
  }
}

} // namespace

bool Value::is_null() const { return std::holds_alternative<std::nullptr_t>(*this); }
bool Value::is_bool() const { return std::holds_alternative<bool>(*this); }
bool Value::is_number() const { return std::holds_alternative<double>(*this); }
bool Value::is_string() const { return std::holds_alternative<std::string>(*this); }
bool Value::is_array() const { return std::holds_alternative<Array>(*this); }
bool Value::is_object() const { return std::holds_alternative<Object>(*this); }

const bool* Value::as_bool() const { return std::get_if<bool>(this); }
const double* Value::as_number() const { return std::get_if<double>(this); }
const std::string* Value::as_string() const { return std::get_if<std::string>(this); }
const Array* Value::as_array() const { return std::get_if<Array>(this); }
const Object* Value::as_object() const { return std::get_if<Object>(this); }

Array* Value::as_array() { return std::get_if<Array>(this); }
Object* Value::as_object() { return std::get_if<Object>(this); }

const Value& Value::at(const std::string& key) const {
  const Value* v = find(key);
  if (!v) {
    if (!is_object()) throw std::runtime_error("JSON value is not an object");
    throw std::runtime_error("JSON object missing key: " + key);
  }
  return *v;
}

const Value& Value::at(std::size_t index) const {
  const Array& a = array();
  if (index >= a.size()) throw std::runtime_error("JSON array index out of range");
  return a[index];
}

const Value* Value::find(const std::string& key) const {
  const Object* o = as_object();
  if (!o) return nullptr;
  const auto it = o->find(key);
  return it == o->end() ? nullptr : &it->second;
}

bool Value::bool_value(bool def) const {
  const bool* p = as_bool();
  return p ? *p : def;
}

double Value::number_value(double def) const {
  const double* p = as_number();
  return p ? *p : def;
}

std::int64_t Value::int_value(std::int64_t def) const {
  const double* p = as_number();
  return p ? static_cast<std::int64_t>(*p) : def;
}

std::string Value::string_value(const std::string& def) const {
  const std::string* p = as_string();
  return p ? *p : def;
}

const Object& Value::object() const {
  const Object* o = as_object();
  if (!o) throw std::runtime_error("JSON value is not an object");
  return *o;
}

const Array& Value::array() const {
  const Array* a = as_array();
  if (!a) throw std::runtime_error("JSON value is not an array");
  return *a;
}

bool is_integral(double d) {
  if (!std::isfinite(d) || std::trunc(d) != d) return false;
  // 2^63 is exactly representable; anything at or above it overflows int64.
  return d >= -9223372036854775808.0 && d < 9223372036854775808.0;
}

Value parse(const std::string& text) {
  Reader r(text);
  return r.document();
}

std::string stringify(const Value& v, int indent) {
  std::string out;
  write_value(v, out, indent, 0);
  return out;
}

} // namespace turngate::json
