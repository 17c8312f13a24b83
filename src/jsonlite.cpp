#include "applogic/jsonlite.hpp"

// Architecture notes on jsonlite:
//
// DETERMINISM GUARANTEES:
//   - to_json() emits sorted keys (std::map iteration) and no whitespace, so
//     the same Value always serializes to the same bytes. Definition and state
//     digests are taken over this form.
//   - format_number() uses snprintf, whose digit output does not depend on the
//     locale in the C locale used by the library.
//
// DETERMINISM RISKS:
//   - std::strtod() is locale-sensitive. It is used only for input parsing and
//     for the round-trip check inside format_number(), never for output text.
//
// MICRO_OPT: json_size() mirrors to_json() byte for byte without building the
// string. The safety governor calls it after every state mutation, so the
// state-size check costs one tree walk and no allocation.

#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace applogic::jsonlite {

namespace {

void append_utf8(std::string& out, std::uint32_t cp) {
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

struct Parser {
  const std::string& s;
  size_t i{0};
  std::optional<JsonError> err;
  int depth{0};

  static constexpr int kMaxDepth = 256;

  void ws() { while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i; }
  bool eat(char c) { ws(); if (i < s.size() && s[i] == c) { ++i; return true; } return false; }
  void fail(const std::string& msg) {
    if (!err) err = JsonError{"json_parse_error", msg + " at offset " + std::to_string(i)};
  }

  bool read_hex4(std::uint32_t& out) {
    if (i + 4 > s.size()) { fail("truncated \\u escape"); return false; }
    out = 0;
    for (int k = 0; k < 4; ++k) {
      const char c = s[i++];
      out <<= 4;
      if (c >= '0' && c <= '9') out |= static_cast<std::uint32_t>(c - '0');
      else if (c >= 'a' && c <= 'f') out |= static_cast<std::uint32_t>(c - 'a' + 10);
      else if (c >= 'A' && c <= 'F') out |= static_cast<std::uint32_t>(c - 'A' + 10);
      else { fail("invalid \\u escape"); return false; }
    }
    return true;
  }

  std::string parse_string() {
    if (!eat('"')) { fail("expected string"); return {}; }
    std::string o;
    while (i < s.size()) {
      char c = s[i++];
      if (c == '"') return o;
      if (static_cast<unsigned char>(c) < 0x20) { fail("control character in string"); return {}; }
      if (c != '\\') { o += c; continue; }
      if (i >= s.size()) break;
      char n = s[i++];
      if (n == 'n') o += '\n';
      else if (n == 't') o += '\t';
      else if (n == 'r') o += '\r';
      else if (n == 'b') o += '\b';
      else if (n == 'f') o += '\f';
      else if (n == '"' || n == '\\' || n == '/') o += n;
      else if (n == 'u') {
        std::uint32_t cp = 0;
        if (!read_hex4(cp)) return {};
        if (cp >= 0xD800 && cp <= 0xDBFF) {
          std::uint32_t lo = 0;
          if (i + 1 < s.size() && s[i] == '\\' && s[i + 1] == 'u') {
            i += 2;
            if (!read_hex4(lo)) return {};
          }
          if (lo < 0xDC00 || lo > 0xDFFF) { fail("unpaired surrogate"); return {}; }
          cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
        } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
          fail("unpaired surrogate");
          return {};
        }
        append_utf8(o, cp);
      } else {
        fail("invalid escape");
        return {};
      }
    }
    fail("unterminated string");
    return {};
  }

  bool parse_number(Value& out_val) {
    ws();
    size_t start = i;

    if (s.compare(i, 3, "NaN") == 0 || s.compare(i, 8, "Infinity") == 0 || s.compare(i, 9, "-Infinity") == 0) {
      fail("NaN/Infinity unsupported");
      return false;
    }

    if (i < s.size() && s[i] == '-') ++i;
    if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
      return false;
    }
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;

    if (i < s.size() && s[i] == '.') {
      ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        fail("invalid number format");
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }

    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
      ++i;
      if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        fail("invalid exponent");
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }

    const std::string num_str = s.substr(start, i - start);
    char* end = nullptr;
    const double d = std::strtod(num_str.c_str(), &end);
    if (end != num_str.c_str() + num_str.size() || !std::isfinite(d)) {
      fail("number out of range");
      return false;
    }
    out_val = Value{d};
    return true;
  }

  Value parse_value() {
    ws();
    if (i >= s.size()) { fail("unexpected eof"); return {}; }
    if (s[i] == '{' || s[i] == '[') {
      if (++depth > kMaxDepth) { fail("nesting too deep"); return {}; }
      Value out = s[i] == '{' ? Value{parse_object()} : Value{parse_array()};
      --depth;
      return out;
    }
    if (s[i] == '"') return Value{parse_string()};
    if (s.compare(i, 4, "true") == 0) { i += 4; return Value{true}; }
    if (s.compare(i, 5, "false") == 0) { i += 5; return Value{false}; }
    if (s.compare(i, 4, "null") == 0) { i += 4; return Value{nullptr}; }
    Value num_val;
    if (parse_number(num_val)) {
      return num_val;
    }
    fail("unexpected token");
    return {};
  }

  Map parse_object() {
    Map out;
    eat('{');
    ws();
    if (eat('}')) return out;
    while (!err) {
      auto k = parse_string();
      if (err) break;
      if (out.contains(k)) { err = JsonError{"json_duplicate_key", "duplicate key: " + k}; break; }
      if (!eat(':')) { fail("expected :"); break; }
      out[k] = parse_value();
      if (err) break;
      if (eat('}')) break;
      if (!eat(',')) { fail("expected ,"); break; }
    }
    return out;
  }

  List parse_array() {
    List out;
    eat('[');
    ws();
    if (eat(']')) return out;
    while (!err) {
      out.push_back(parse_value());
      if (err) break;
      if (eat(']')) break;
      if (!eat(',')) { fail("expected ,"); break; }
    }
    return out;
  }
};

bool needs_escape(unsigned char c) { return c == '"' || c == '\\' || c < 0x20; }

size_t escaped_length(const std::string& s) {
  size_t n = 0;
  for (unsigned char c : s) {
    if (c == '"' || c == '\\' || c == '\b' || c == '\f' || c == '\n' || c == '\r' || c == '\t') n += 2;
    else if (c < 0x20) n += 6;
    else n += 1;
  }
  return n;
}

// MICRO_OPT: Fast path for strings with no escape characters (the common case
// for field names and agent ids). The pre-scan returns the input unchanged.
std::string escape_inner(const std::string& s) {
  bool any = false;
  for (unsigned char c : s) {
    if (needs_escape(c)) { any = true; break; }
  }
  if (!any) return s;

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
    } else {
      o += c;
    }
  }
  return o;
}

void write_json(const Value& v, std::string& out) {
  switch (v.type()) {
    case ValueType::null:    out += "null"; return;
    case ValueType::boolean: out += v.as_bool() ? "true" : "false"; return;
    case ValueType::number:  out += format_number(v.as_number()); return;
    case ValueType::string:
      out += '"';
      out += escape_inner(v.as_string());
      out += '"';
      return;
    case ValueType::list: {
      out += '[';
      bool first = true;
      for (const auto& item : v.as_list()) {
        if (!first) out += ',';
        first = false;
        write_json(item, out);
      }
      out += ']';
      return;
    }
    case ValueType::map: {
      out += '{';
      bool first = true;
      for (const auto& [k, item] : v.as_map()) {
        if (!first) out += ',';
        first = false;
        out += '"';
        out += escape_inner(k);
        out += "\":";
        write_json(item, out);
      }
      out += '}';
      return;
    }
  }
}

}  // namespace

std::string format_number(double d) {
  // JSON has no inf or NaN; the evaluator never produces them.
  if (!std::isfinite(d)) return "null";
  if (d == 0.0) return "0";
  char buf[64];
  if (std::floor(d) == d && std::fabs(d) < 1e15) {
    std::snprintf(buf, sizeof(buf), "%.0f", d);
    return buf;
  }
  std::snprintf(buf, sizeof(buf), "%.15g", d);
  if (std::strtod(buf, nullptr) != d) {
    std::snprintf(buf, sizeof(buf), "%.17g", d);
  }
  return buf;
}

std::string escape(const std::string& s) { return escape_inner(s); }

std::string to_json(const Value& v) {
  std::string out;
  out.reserve(64);
  write_json(v, out);
  return out;
}

size_t json_size(const Value& v) {
  switch (v.type()) {
    case ValueType::null:    return 4;
    case ValueType::boolean: return v.as_bool() ? 4 : 5;
    case ValueType::number:  return format_number(v.as_number()).size();
    case ValueType::string:  return escaped_length(v.as_string()) + 2;
    case ValueType::list: {
      const List& l = v.as_list();
      size_t n = 2 + (l.empty() ? 0 : l.size() - 1);
      for (const auto& item : l) n += json_size(item);
      return n;
    }
    case ValueType::map: {
      const Map& m = v.as_map();
      size_t n = 2 + (m.empty() ? 0 : m.size() - 1);
      for (const auto& [k, item] : m) n += escaped_length(k) + 3 + json_size(item);
      return n;
    }
  }
  return 0;
}

Value parse_value(const std::string& text, std::optional<JsonError>* error) {
  Parser p{text};
  auto v = p.parse_value();
  p.ws();
  if (!p.err && p.i != text.size()) p.fail("trailing data");
  if (error) *error = p.err;
  if (p.err) return {};
  return v;
}

Map parse(const std::string& text, std::optional<JsonError>* error) {
  std::optional<JsonError> err;
  Value v = parse_value(text, &err);
  if (!err && !v.is_map()) err = JsonError{"json_parse_error", "top-level value must be an object"};
  if (error) *error = err;
  if (err) return {};
  return std::move(v.as_map());
}

std::string get_string(const Map& obj, const std::string& key, const std::string& def) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->second.is_string()) return def;
  return it->second.as_string();
}

bool get_bool(const Map& obj, const std::string& key, bool def) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->second.is_bool()) return def;
  return it->second.as_bool();
}

std::vector<std::string> get_string_array(const Map& obj, const std::string& key) {
  std::vector<std::string> out;
  auto it = obj.find(key);
  if (it == obj.end() || !it->second.is_list()) return out;
  for (const auto& item : it->second.as_list()) {
    if (item.is_string()) out.push_back(item.as_string());
  }
  return out;
}

}  // namespace applogic::jsonlite
