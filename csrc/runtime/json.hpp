#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace farstore::json {

struct Value;
// Sorted keys: the same document always dumps to the same bytes.
using Object = std::map<std::string, Value>;
using Array  = std::vector<Value>;

struct Value {
  enum class Type { Null, Bool, Integer, Number, String, Array, Object };
  Type type{Type::Null};
  bool b{false};
  int64_t i{0};
  double num{0};
  std::string s;
  Array a;
  Object o;

  static Value null() { return Value{}; }
  static Value boolean(bool v) { Value x; x.type=Type::Bool; x.b=v; return x; }
  static Value integer(int64_t v) { Value x; x.type=Type::Integer; x.i=v; return x; }
  static Value number(double v) { Value x; x.type=Type::Number; x.num=v; return x; }
  static Value string(std::string v) { Value x; x.type=Type::String; x.s=std::move(v); return x; }
  static Value array(Array v) { Value x; x.type=Type::Array; x.a=std::move(v); return x; }
  static Value object(Object v) { Value x; x.type=Type::Object; x.o=std::move(v); return x; }

  bool is_null() const { return type==Type::Null; }
  bool is_object() const { return type==Type::Object; }
  bool is_array() const { return type==Type::Array; }
  bool is_string() const { return type==Type::String; }
  bool is_integer() const { return type==Type::Integer; }
  bool is_number() const { return type==Type::Number || type==Type::Integer; }
  bool is_bool() const { return type==Type::Bool; }

  // Integer or Number as double.
  double as_double() const { return type==Type::Integer ? static_cast<double>(i) : num; }
};

// Throws farstore::Error(MalformedArchive) on syntax errors.
Value parse(const std::string& s);

// Compact serialization. Floats keep 17 significant digits and always carry
// a '.' or exponent; non-finite floats are written as NaN/Infinity/-Infinity.
std::string dump(const Value& v);

// helpers
inline const Value* get(const Object& o, const std::string& k) {
  auto it = o.find(k);
  return it == o.end() ? nullptr : &it->second;
}

} // namespace farstore::json
