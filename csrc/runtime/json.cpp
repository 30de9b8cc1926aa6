#include "json.hpp"
#include "../common.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>

namespace farstore::json {

#define JSON_FAIL(msg) FARSTORE_THROW(MalformedArchive, std::string("json: ") + (msg))

struct Parser {
  const std::string& s;
  size_t i{0};
  Parser(const std::string& s) : s(s) {}

  void ws() { while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i; }

  bool match(char c) { ws(); if (i<s.size() && s[i]==c) { ++i; return true; } return false; }
  void expect(char c) { ws(); if (i>=s.size() || s[i]!=c) JSON_FAIL("expected '"+std::string(1,c)+"'"); ++i; }
  bool literal(const char* w) {
    size_t n = std::char_traits<char>::length(w);
    if (s.compare(i, n, w)==0) { i+=n; return true; }
    return false;
  }

  Value parse_value() {
    ws(); if (i>=s.size()) JSON_FAIL("unexpected end");
    char c = s[i];
    if (c=='{') return parse_object();
    if (c=='[') return parse_array();
    if (c=='"') return parse_string();
    if (c=='t' || c=='f') return parse_bool();
    if (c=='n') return parse_null();
    return parse_number();
  }

  Value parse_object() {
    expect('{');
    Object o;
    ws();
    if (match('}')) return Value::object(std::move(o));
    while (true) {
      ws();
      std::string key = parse_string().s;
      expect(':');
      Value val = parse_value();
      if (!o.emplace(key, std::move(val)).second) JSON_FAIL("duplicate key '" + key + "'");
      ws();
      if (match('}')) break;
      if (!match(',')) JSON_FAIL("expected ',' or '}'");
    }
    return Value::object(std::move(o));
  }

  Value parse_array() {
    expect('[');
    Array a;
    ws();
    if (match(']')) return Value::array(std::move(a));
    while (true) {
      a.push_back(parse_value());
      ws();
      if (match(']')) break;
      if (!match(',')) JSON_FAIL("expected ',' or ']'");
    }
    return Value::array(std::move(a));
  }

  unsigned hex4() {
    if (i+4 > s.size()) JSON_FAIL("short unicode escape");
    unsigned code=0;
    for (int k=0;k<4;++k) {
      char h=s[i++]; code <<= 4;
      if (h>='0'&&h<='9') code+=h-'0';
      else if (h>='a'&&h<='f') code+=h-'a'+10;
      else if (h>='A'&&h<='F') code+=h-'A'+10;
      else JSON_FAIL("bad hex");
    }
    return code;
  }

  static void put_utf8(std::string& out, unsigned code) {
    if (code<=0x7F) out.push_back(static_cast<char>(code));
    else if (code<=0x7FF) { out.push_back(static_cast<char>(0xC0 | ((code>>6)&0x1F))); out.push_back(static_cast<char>(0x80 | (code&0x3F))); }
    else if (code<=0xFFFF) { out.push_back(static_cast<char>(0xE0 | ((code>>12)&0x0F))); out.push_back(static_cast<char>(0x80 | ((code>>6)&0x3F))); out.push_back(static_cast<char>(0x80 | (code&0x3F))); }
    else {
      out.push_back(static_cast<char>(0xF0 | ((code>>18)&0x07)));
      out.push_back(static_cast<char>(0x80 | ((code>>12)&0x3F)));
      out.push_back(static_cast<char>(0x80 | ((code>>6)&0x3F)));
      out.push_back(static_cast<char>(0x80 | (code&0x3F)));
    }
  }

  Value parse_string() {
    expect('"');
    std::string out;
    bool closed = false;
    while (i < s.size()) {
      char c = s[i++];
      if (c=='"') { closed = true; break; }
      if (c=='\\') {
        if (i>=s.size()) JSON_FAIL("bad escape");
        char e = s[i++];
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
            unsigned code = hex4();
            if (code>=0xD800 && code<=0xDBFF && s.compare(i, 2, "\\u")==0) {
              i += 2;
              unsigned lo = hex4();
              if (lo<0xDC00 || lo>0xDFFF) JSON_FAIL("bad surrogate pair");
              code = 0x10000 + ((code-0xD800)<<10) + (lo-0xDC00);
            }
            put_utf8(out, code);
            break;
          }
          default: JSON_FAIL("bad escape char");
        }
      } else {
        out.push_back(c);
      }
    }
    if (!closed) JSON_FAIL("unterminated string");
    return Value::string(std::move(out));
  }

  Value parse_bool() {
    if (literal("true")) return Value::boolean(true);
    if (literal("false")) return Value::boolean(false);
    JSON_FAIL("invalid bool");
  }

  Value parse_null() {
    if (literal("null")) return Value::null();
    JSON_FAIL("invalid null");
  }

  Value parse_number() {
    size_t start = i;
    bool neg = false;
    if (s[i]=='-') { neg = true; ++i; }
    if (literal("Infinity")) return Value::number(neg ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity());
    if (!neg && literal("NaN")) return Value::number(std::numeric_limits<double>::quiet_NaN());
    bool is_float = false;
    size_t digits = i;
    while (i<s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    if (i == digits) JSON_FAIL("invalid number");
    if (i<s.size() && s[i]=='.') { is_float = true; ++i; while (i<s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i; }
    if (i<s.size() && (s[i]=='e' || s[i]=='E')) {
      is_float = true; ++i;
      if (i<s.size() && (s[i]=='+'||s[i]=='-')) ++i;
      while (i<s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }
    std::string text = s.substr(start, i-start);
    if (is_float) {
      // strtod, not stod: subnormal results set ERANGE but are valid
      double v = std::strtod(text.c_str(), nullptr);
      if (std::isinf(v)) JSON_FAIL("number out of range: " + text);
      return Value::number(v);
    }
    try {
      return Value::integer(std::stoll(text));
    } catch (const std::out_of_range&) {
      JSON_FAIL("integer out of range: " + text);
    }
  }
};

Value parse(const std::string& s) {
  Parser p(s);
  Value v = p.parse_value();
  p.ws();
  if (p.i != s.size()) JSON_FAIL("trailing characters");
  return v;
}

static void dump_string(std::string& out, const std::string& s) {
  out.push_back('"');
  for (char ch : s) {
    unsigned char c = static_cast<unsigned char>(ch);
    switch (ch) {
      case '"': out += "\\\""; break;
      case '\\': out += "\\\\"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      default:
        if (c < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", c);
          out += buf;
        } else {
          out.push_back(ch);
        }
    }
  }
  out.push_back('"');
}

static void dump_number(std::string& out, double v) {
  if (std::isnan(v)) { out += "NaN"; return; }
  if (std::isinf(v)) { out += v < 0 ? "-Infinity" : "Infinity"; return; }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.17g", v);
  std::string t(buf);
  if (t.find_first_of(".eE") == std::string::npos) t += ".0";
  out += t;
}

static void dump_into(std::string& out, const Value& v) {
  switch (v.type) {
    case Value::Type::Null: out += "null"; break;
    case Value::Type::Bool: out += v.b ? "true" : "false"; break;
    case Value::Type::Integer: out += std::to_string(v.i); break;
    case Value::Type::Number: dump_number(out, v.num); break;
    case Value::Type::String: dump_string(out, v.s); break;
    case Value::Type::Array:
      out.push_back('[');
      for (size_t k = 0; k < v.a.size(); ++k) {
        if (k) out.push_back(',');
        dump_into(out, v.a[k]);
      }
      out.push_back(']');
      break;
    case Value::Type::Object: {
      out.push_back('{');
      bool first = true;
      for (const auto& kv : v.o) {
        if (!first) out.push_back(',');
        first = false;
        dump_string(out, kv.first);
        out.push_back(':');
        dump_into(out, kv.second);
      }
      out.push_back('}');
      break;
    }
  }
}

std::string dump(const Value& v) {
  std::string out;
  dump_into(out, v);
  return out;
}

} // namespace farstore::json
