#pragma once

#include <functional>
#include <string>
#include <vector>

#include "../runtime/ndarray.hpp"
#include "value.hpp"

namespace farstore {

// Classification in priority order.
enum class Category { Composite, Array, Generic, Unsupported };

const char* to_string(Category c);

// Registration of one composite record kind. `decode` must rebuild the
// record from exactly the fields `encode` produced; field values may be
// arrays, generics or other registered composites.
struct CompositeKind {
  std::string tag;  // without the '$' marker, e.g. "Signal"
  std::function<bool(const Value&)> is_instance;
  std::function<Fields(const Value&)> encode;
  std::function<Value(const Fields&)> decode;
};

template <class T>
CompositeKind make_kind(std::string tag,
                        std::function<Fields(const T&)> encode,
                        std::function<T(const Fields&)> decode) {
  CompositeKind k;
  k.tag = std::move(tag);
  k.is_instance = [](const Value& v) { return v.is<T>(); };
  k.encode = [encode](const Value& v) { return encode(v.as<T>()); };
  k.decode = [decode](const Fields& f) { return Value(decode(f)); };
  return k;
}

// Table of known composite kinds. Each archive engine owns its own copy.
class Registry {
 public:
  // Throws Error(InvalidName) for a malformed or reserved tag and
  // Error(NameCollision) for a tag already registered.
  void add(CompositeKind kind);

  // First registered kind whose predicate accepts v.
  const CompositeKind* match(const Value& v) const;
  const CompositeKind* find(const std::string& tag) const;
  const std::vector<CompositeKind>& kinds() const { return kinds_; }

  Category classify(const Value& v) const;

 private:
  std::vector<CompositeKind> kinds_;
};

// Field accessors for decode implementations. All throw
// Error(MalformedArchive) naming the record tag and field.
const Value& require_field(const Fields& f, const std::string& tag, const std::string& field);
const NdArray& require_array(const Fields& f, const std::string& tag, const std::string& field);
const Generic& require_generic(const Fields& f, const std::string& tag, const std::string& field, Generic::Kind kind);
const std::string& require_str(const Fields& f, const std::string& tag, const std::string& field);
// int or float
double require_real(const Fields& f, const std::string& tag, const std::string& field);

template <class T>
const T& require_composite(const Fields& f, const std::string& tag, const std::string& field) {
  const Value& v = require_field(f, tag, field);
  const T* p = v.get_if<T>();
  if (!p) FARSTORE_THROW(MalformedArchive, tag + "." + field + ": expected " + Value::demangle(typeid(T)) +
                         ", found " + v.type_name());
  return *p;
}

} // namespace farstore
