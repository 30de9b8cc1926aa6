#include "registry.hpp"
#include "layout.hpp"

namespace farstore {

const char* to_string(Category c) {
  switch (c) {
    case Category::Composite: return "composite";
    case Category::Array: return "array";
    case Category::Generic: return "generic";
    case Category::Unsupported: return "unsupported";
  }
  return "?";
}

void Registry::add(CompositeKind kind) {
  check_name(kind.tag, "composite tag");
  if (composite_tag(kind.tag) == kArrayTag || composite_tag(kind.tag) == kAggregateTag)
    FARSTORE_THROW(InvalidName, "composite tag '" + kind.tag + "' is reserved");
  if (!kind.is_instance || !kind.encode || !kind.decode)
    FARSTORE_THROW(InvalidName, "composite kind '" + kind.tag + "' is missing a predicate or codec");
  if (find(kind.tag)) FARSTORE_THROW(NameCollision, "composite tag '" + kind.tag + "' is already registered");
  kinds_.push_back(std::move(kind));
}

const CompositeKind* Registry::match(const Value& v) const {
  for (const auto& k : kinds_) if (k.is_instance(v)) return &k;
  return nullptr;
}

const CompositeKind* Registry::find(const std::string& tag) const {
  for (const auto& k : kinds_) if (k.tag == tag) return &k;
  return nullptr;
}

Category Registry::classify(const Value& v) const {
  if (match(v)) return Category::Composite;
  if (v.is<NdArray>()) return Category::Array;
  if (v.is<Generic>()) return Category::Generic;
  return Category::Unsupported;
}

const Value& require_field(const Fields& f, const std::string& tag, const std::string& field) {
  auto it = f.find(field);
  if (it == f.end()) FARSTORE_THROW(MalformedArchive, tag + ": required field '" + field + "' is missing");
  return it->second;
}

const NdArray& require_array(const Fields& f, const std::string& tag, const std::string& field) {
  const Value& v = require_field(f, tag, field);
  const NdArray* a = v.get_if<NdArray>();
  if (!a) FARSTORE_THROW(MalformedArchive, tag + "." + field + ": expected an array, found " + v.type_name());
  return *a;
}

const Generic& require_generic(const Fields& f, const std::string& tag, const std::string& field, Generic::Kind kind) {
  const Value& v = require_field(f, tag, field);
  const Generic* g = v.get_if<Generic>();
  if (!g) FARSTORE_THROW(MalformedArchive, tag + "." + field + ": expected " + kind_name(kind) + ", found " + v.type_name());
  if (!g->is(kind))
    FARSTORE_THROW(MalformedArchive, tag + "." + field + ": expected " + kind_name(kind) + ", found " + kind_name(g->kind));
  return *g;
}

const std::string& require_str(const Fields& f, const std::string& tag, const std::string& field) {
  return require_generic(f, tag, field, Generic::Kind::Str).s;
}

double require_real(const Fields& f, const std::string& tag, const std::string& field) {
  const Value& v = require_field(f, tag, field);
  const Generic* g = v.get_if<Generic>();
  if (g && g->is(Generic::Kind::Float)) return g->f;
  if (g && g->is(Generic::Kind::Int)) return static_cast<double>(g->i);
  FARSTORE_THROW(MalformedArchive, tag + "." + field + ": expected a real number, found " +
                 (g ? std::string(kind_name(g->kind)) : v.type_name()));
}

} // namespace farstore
