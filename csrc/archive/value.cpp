#include "value.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cxxabi.h>
#include <memory>

namespace farstore {

static void canonicalize(Generic::Items& v) {
  std::sort(v.begin(), v.end());
  v.erase(std::unique(v.begin(), v.end()), v.end());
}

Generic Generic::set(Items v) {
  canonicalize(v);
  Generic x; x.kind=Kind::Set; x.items=std::move(v); return x;
}

Generic::Items Generic::canonical_items() const {
  Items v = items;
  canonicalize(v);
  return v;
}

Generic Generic::frozenset(Items v) {
  Generic x = set(std::move(v));
  x.kind = Kind::FrozenSet;
  return x;
}

bool Generic::operator==(const Generic& o) const {
  if (kind != o.kind) return false;
  switch (kind) {
    case Kind::Bool: return b == o.b;
    case Kind::Int: return i == o.i;
    case Kind::Float: return f == o.f;
    case Kind::Complex: return c == o.c;
    case Kind::Str: case Kind::Bytes: return s == o.s;
    case Kind::List: case Kind::Tuple: return items == o.items;
    case Kind::Set: case Kind::FrozenSet: return canonical_items() == o.canonical_items();
  }
  return false;
}

static bool real_less(double a, double b) {
  if (std::isnan(a)) return false;
  if (std::isnan(b)) return true;
  return a < b;
}

bool Generic::operator<(const Generic& o) const {
  if (kind != o.kind) return kind < o.kind;
  switch (kind) {
    case Kind::Bool: return b < o.b;
    case Kind::Int: return i < o.i;
    case Kind::Float: return real_less(f, o.f);
    case Kind::Complex:
      if (real_less(c.real(), o.c.real())) return true;
      if (real_less(o.c.real(), c.real())) return false;
      return real_less(c.imag(), o.c.imag());
    case Kind::Str: case Kind::Bytes: return s < o.s;
    case Kind::List: case Kind::Tuple:
      return std::lexicographical_compare(items.begin(), items.end(), o.items.begin(), o.items.end());
    case Kind::Set: case Kind::FrozenSet: {
      const Items a = canonical_items(), b = o.canonical_items();
      return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end());
    }
  }
  return false;
}

const char* kind_name(Generic::Kind k) {
  switch (k) {
    case Generic::Kind::Bool: return "bool";
    case Generic::Kind::Bytes: return "bytes";
    case Generic::Kind::Complex: return "complex";
    case Generic::Kind::Float: return "float";
    case Generic::Kind::FrozenSet: return "frozenset";
    case Generic::Kind::Int: return "int";
    case Generic::Kind::List: return "list";
    case Generic::Kind::Set: return "set";
    case Generic::Kind::Str: return "str";
    case Generic::Kind::Tuple: return "tuple";
  }
  return "?";
}

static std::string repr_real(double v) {
  if (std::isnan(v)) return "nan";
  if (std::isinf(v)) return v < 0 ? "-inf" : "inf";
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.17g", v);
  // shortest form that reads back identically
  for (int prec = 1; prec < 17; ++prec) {
    char shorter[32];
    std::snprintf(shorter, sizeof(shorter), "%.*g", prec, v);
    if (std::strtod(shorter, nullptr) == v) { std::snprintf(buf, sizeof(buf), "%s", shorter); break; }
  }
  std::string t(buf);
  if (t.find_first_of(".e") == std::string::npos) t += ".0";
  return t;
}

static std::string repr_text(const std::string& s, bool is_bytes) {
  std::string out = is_bytes ? "b'" : "'";
  for (char ch : s) {
    unsigned char c = static_cast<unsigned char>(ch);
    if (ch == '\'' || ch == '\\') { out.push_back('\\'); out.push_back(ch); }
    else if (ch == '\n') out += "\\n";
    else if (ch == '\t') out += "\\t";
    else if (c < 0x20 || (is_bytes && c >= 0x7F)) {
      char buf[8];
      std::snprintf(buf, sizeof(buf), "\\x%02x", c);
      out += buf;
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

static std::string repr_items(const Generic::Items& items, const char* open, const char* close, bool lone_comma) {
  std::string out = open;
  for (size_t k = 0; k < items.size(); ++k) {
    if (k) out += ", ";
    out += repr(items[k]);
  }
  if (lone_comma && items.size() == 1) out += ",";
  out += close;
  return out;
}

std::string repr(const Generic& g) {
  switch (g.kind) {
    case Generic::Kind::Bool: return g.b ? "True" : "False";
    case Generic::Kind::Int: return std::to_string(g.i);
    case Generic::Kind::Float: return repr_real(g.f);
    case Generic::Kind::Complex: {
      std::string im = repr_real(g.c.imag());
      if (im[0] != '-') im = "+" + im;
      return "(" + repr_real(g.c.real()) + im + "j)";
    }
    case Generic::Kind::Str: return repr_text(g.s, false);
    case Generic::Kind::Bytes: return repr_text(g.s, true);
    case Generic::Kind::List: return repr_items(g.items, "[", "]", false);
    case Generic::Kind::Tuple: return repr_items(g.items, "(", ")", true);
    case Generic::Kind::Set:
      return g.items.empty() ? "set()" : repr_items(g.canonical_items(), "{", "}", false);
    case Generic::Kind::FrozenSet:
      return g.items.empty() ? "frozenset()" : "frozenset(" + repr_items(g.canonical_items(), "{", "}", false) + ")";
  }
  return "?";
}

std::string Value::demangle(const std::type_info& t) {
  int status = 0;
  std::unique_ptr<char, void (*)(void*)> name(abi::__cxa_demangle(t.name(), nullptr, nullptr, &status), std::free);
  return status == 0 && name ? std::string(name.get()) : std::string(t.name());
}

std::string Value::type_name() const {
  if (!payload_.has_value()) return "<empty>";
  return demangle(payload_.type());
}

} // namespace farstore
