#pragma once

#include <any>
#include <complex>
#include <cstdint>
#include <map>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <vector>

#include "../common.hpp"

namespace farstore {

// Closed set of generic scalar/collection kinds stored in the aggregate entry.
// Same layout idea as json::Value: one tag plus the slot it selects.
struct Generic {
  enum class Kind { Bool, Bytes, Complex, Float, FrozenSet, Int, List, Set, Str, Tuple };
  using Items = std::vector<Generic>;

  Kind kind{Kind::Int};
  bool b{false};
  int64_t i{0};
  double f{0};
  std::complex<double> c;
  std::string s;  // Str text or Bytes content
  Items items;    // List, Tuple, Set, FrozenSet

  static Generic boolean(bool v) { Generic x; x.kind=Kind::Bool; x.b=v; return x; }
  static Generic integer(int64_t v) { Generic x; x.kind=Kind::Int; x.i=v; return x; }
  static Generic real(double v) { Generic x; x.kind=Kind::Float; x.f=v; return x; }
  static Generic complex(std::complex<double> v) { Generic x; x.kind=Kind::Complex; x.c=v; return x; }
  static Generic str(std::string v) { Generic x; x.kind=Kind::Str; x.s=std::move(v); return x; }
  static Generic bytes(std::string v) { Generic x; x.kind=Kind::Bytes; x.s=std::move(v); return x; }
  static Generic bytes(const std::vector<uint8_t>& v) { return bytes(std::string(v.begin(), v.end())); }
  static Generic list(Items v) { Generic x; x.kind=Kind::List; x.items=std::move(v); return x; }
  static Generic tuple(Items v) { Generic x; x.kind=Kind::Tuple; x.items=std::move(v); return x; }
  // Sets keep their elements sorted and deduplicated.
  static Generic set(Items v);
  static Generic frozenset(Items v);

  bool is(Kind k) const { return kind == k; }
  bool is_sequence() const { return kind==Kind::List || kind==Kind::Tuple; }
  bool is_set() const { return kind==Kind::Set || kind==Kind::FrozenSet; }
  // Sorted, deduplicated copy of a set's elements, however `items` was filled.
  Items canonical_items() const;

  bool operator==(const Generic& o) const;
  bool operator!=(const Generic& o) const { return !(*this == o); }
  // Total order: kind first, then content. NaN sorts after every number.
  bool operator<(const Generic& o) const;
};

const char* kind_name(Generic::Kind k);

// Literal-style rendering, e.g. "(1, 'a', 3.0)" or "{1, 2}".
std::string repr(const Generic& g);

// Type-erased value offered to or returned by the archive. Holds a Generic,
// an NdArray, a registered composite record, or anything else (which the
// classifier reports as unsupported).
class Value {
 public:
  Value() = default;
  template <class T, class = std::enable_if_t<!std::is_same<std::decay_t<T>, Value>::value>>
  Value(T&& v) : payload_(std::forward<T>(v)) {}

  bool has_value() const { return payload_.has_value(); }
  const std::type_info& type() const { return payload_.type(); }

  template <class T> bool is() const { return payload_.type() == typeid(T); }
  template <class T> const T* get_if() const { return std::any_cast<T>(&payload_); }
  template <class T> const T& as() const {
    const T* p = get_if<T>();
    if (!p) FARSTORE_THROW(UnsupportedType, "value holds " + type_name() + ", not " + demangle(typeid(T)));
    return *p;
  }

  // Demangled C++ type of the payload ("<empty>" when default-constructed).
  std::string type_name() const;
  static std::string demangle(const std::type_info& t);

 private:
  std::any payload_;
};

using Fields = std::map<std::string, Value>;
using Collection = std::map<std::string, Value>;

} // namespace farstore
