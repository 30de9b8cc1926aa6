#include "writer.hpp"
#include "generic_codec.hpp"
#include "layout.hpp"
#include "../runtime/fileio.hpp"
#include "../runtime/npy.hpp"

namespace farstore {

[[noreturn]] static void unsupported(const std::string& path, const Value& v) {
  FARSTORE_THROW(UnsupportedType, "'" + path + "' of type " + v.type_name() + " cannot be written to disk");
}

ArchiveWriter::ArchiveWriter(Registry registry, WriteOptions options)
    : registry_(std::move(registry)), options_(options) {}

void ArchiveWriter::encode_object(zip::ZipWriter& zip, const std::string& path, const Value& v) const {
  if (const CompositeKind* kind = registry_.match(v)) {
    encode_composite(zip, path, *kind, v);
  } else if (const NdArray* a = v.get_if<NdArray>()) {
    zip.add(join_path(path, kArrayTag), npy::encode(*a));
  } else {
    unsupported(path, v);
  }
}

void ArchiveWriter::encode_composite(zip::ZipWriter& zip, const std::string& path,
                                     const CompositeKind& kind, const Value& v) const {
  Fields fields = kind.encode(v);
  // Generic fields live in the record's own entry; arrays and records get
  // entries of their own one path segment further down.
  json::Object inline_fields;
  for (const auto& kv : fields) {
    const std::string child = join_path(path, kv.first);
    check_name(kv.first, "field '" + child + "'");
    switch (registry_.classify(kv.second)) {
      case Category::Composite:
      case Category::Array:
        encode_object(zip, child, kv.second);
        break;
      case Category::Generic:
        inline_fields[kv.first] = generic::encode(*kv.second.get_if<Generic>());
        break;
      case Category::Unsupported:
        unsupported(child, kv.second);
    }
  }
  zip.add(join_path(path, composite_tag(kind.tag)), json::dump(json::Value::object(std::move(inline_fields))));
}

std::vector<uint8_t> ArchiveWriter::serialize(const Collection& objects) const {
  if (objects.count(kAggregateName))
    FARSTORE_THROW(NameCollision, std::string("object name '") + kAggregateName + "' is reserved");
  for (const auto& kv : objects) check_name(kv.first, "object");

  zip::ZipWriter zip(options_.compress ? zip::Method::Deflated : zip::Method::Stored, options_.level);
  json::Object aggregate;
  for (const auto& kv : objects) {
    switch (registry_.classify(kv.second)) {
      case Category::Composite:
      case Category::Array:
        encode_object(zip, kv.first, kv.second);
        break;
      case Category::Generic:
        aggregate[kv.first] = generic::encode(*kv.second.get_if<Generic>());
        break;
      case Category::Unsupported:
        unsupported(kv.first, kv.second);
    }
  }
  if (!aggregate.empty()) {
    zip.add(join_path(kAggregateName, kAggregateTag), json::dump(json::Value::object(std::move(aggregate))));
  }
  return zip.finish();
}

std::string ArchiveWriter::write(const std::string& path, const Collection& objects) const {
  std::vector<uint8_t> image = serialize(objects);
  const std::string dest = with_far_extension(path);
  atomic_write(dest, image);
  return dest;
}

} // namespace farstore
