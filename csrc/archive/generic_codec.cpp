#include "generic_codec.hpp"

namespace farstore::generic {

static json::Value envelope(const char* kind, json::Object fields) {
  fields[kKindKey] = json::Value::string(kind);
  return json::Value::object(std::move(fields));
}

static json::Value encode_items(const Generic::Items& items) {
  json::Array a;
  a.reserve(items.size());
  for (const auto& x : items) a.push_back(encode(x));
  return json::Value::array(std::move(a));
}

static std::string to_hex(const std::string& bytes) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (char ch : bytes) {
    unsigned char c = static_cast<unsigned char>(ch);
    out.push_back(digits[c >> 4]);
    out.push_back(digits[c & 0x0F]);
  }
  return out;
}

static std::string from_hex(const std::string& hex) {
  auto nibble = [](char h) -> int {
    if (h>='0'&&h<='9') return h-'0';
    if (h>='a'&&h<='f') return h-'a'+10;
    if (h>='A'&&h<='F') return h-'A'+10;
    return -1;
  };
  if (hex.size() % 2) FARSTORE_THROW(MalformedArchive, "generic: odd-length hex in bytes envelope");
  std::string out;
  out.reserve(hex.size() / 2);
  for (size_t k = 0; k < hex.size(); k += 2) {
    int hi = nibble(hex[k]), lo = nibble(hex[k+1]);
    if (hi < 0 || lo < 0) FARSTORE_THROW(MalformedArchive, "generic: bad hex digit in bytes envelope");
    out.push_back(static_cast<char>((hi << 4) | lo));
  }
  return out;
}

json::Value encode(const Generic& g) {
  switch (g.kind) {
    case Generic::Kind::Bool: return json::Value::boolean(g.b);
    case Generic::Kind::Int: return json::Value::integer(g.i);
    case Generic::Kind::Float: return json::Value::number(g.f);
    case Generic::Kind::Str: return json::Value::string(g.s);
    case Generic::Kind::List: return encode_items(g.items);
    case Generic::Kind::Bytes:
      return envelope("bytes", {{"hex", json::Value::string(to_hex(g.s))}});
    case Generic::Kind::Complex:
      return envelope("complex", {{"real", json::Value::number(g.c.real())},
                                  {"imag", json::Value::number(g.c.imag())}});
    case Generic::Kind::Tuple: return envelope("tuple", {{"items", encode_items(g.items)}});
    case Generic::Kind::Set: return envelope("set", {{"items", encode_items(g.canonical_items())}});
    case Generic::Kind::FrozenSet: return envelope("frozenset", {{"items", encode_items(g.canonical_items())}});
  }
  FARSTORE_THROW(UnsupportedType, "generic: unknown kind");
}

static const json::Value& member(const json::Object& o, const char* kind, const char* key) {
  const json::Value* v = json::get(o, key);
  if (!v) FARSTORE_THROW(MalformedArchive, std::string("generic: ") + kind + " envelope lacks '" + key + "'");
  return *v;
}

static Generic::Items decode_items(const json::Object& o, const char* kind) {
  const json::Value& a = member(o, kind, "items");
  if (!a.is_array()) FARSTORE_THROW(MalformedArchive, std::string("generic: ") + kind + " items is not an array");
  Generic::Items items;
  items.reserve(a.a.size());
  for (const auto& x : a.a) items.push_back(decode(x));
  return items;
}

static double decode_real(const json::Object& o, const char* key) {
  const json::Value& v = member(o, "complex", key);
  if (!v.is_number()) FARSTORE_THROW(MalformedArchive, std::string("generic: complex ") + key + " is not a number");
  return v.as_double();
}

Generic decode(const json::Value& v) {
  switch (v.type) {
    case json::Value::Type::Bool: return Generic::boolean(v.b);
    case json::Value::Type::Integer: return Generic::integer(v.i);
    case json::Value::Type::Number: return Generic::real(v.num);
    case json::Value::Type::String: return Generic::str(v.s);
    case json::Value::Type::Array: {
      Generic::Items items;
      items.reserve(v.a.size());
      for (const auto& x : v.a) items.push_back(decode(x));
      return Generic::list(std::move(items));
    }
    case json::Value::Type::Null:
      FARSTORE_THROW(MalformedArchive, "generic: null has no generic kind");
    case json::Value::Type::Object: break;
  }

  const json::Value* tag = json::get(v.o, kKindKey);
  if (!tag) FARSTORE_THROW(MalformedArchive, std::string("generic: object without '") + kKindKey + "' envelope");
  if (!tag->is_string()) FARSTORE_THROW(MalformedArchive, std::string("generic: '") + kKindKey + "' is not a string");
  const std::string& kind = tag->s;
  if (kind == "tuple") return Generic::tuple(decode_items(v.o, "tuple"));
  if (kind == "set") return Generic::set(decode_items(v.o, "set"));
  if (kind == "frozenset") return Generic::frozenset(decode_items(v.o, "frozenset"));
  if (kind == "complex") return Generic::complex({decode_real(v.o, "real"), decode_real(v.o, "imag")});
  if (kind == "bytes") {
    const json::Value& hex = member(v.o, "bytes", "hex");
    if (!hex.is_string()) FARSTORE_THROW(MalformedArchive, "generic: bytes hex is not a string");
    return Generic::bytes(from_hex(hex.s));
  }
  FARSTORE_THROW(UnknownTypeTag, "generic: unknown kind '" + kind +
                 "'; the archive may come from a newer version of farstore");
}

} // namespace farstore::generic
