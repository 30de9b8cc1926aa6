#include "reader.hpp"
#include "generic_codec.hpp"
#include "layout.hpp"
#include "../runtime/fileio.hpp"
#include "../runtime/json.hpp"
#include "../runtime/npy.hpp"

#include <map>

namespace farstore {

// One path prefix of the archive: the entry carrying its type tag and the
// prefixes nested one segment below it.
struct ArchiveReader::Node {
  const zip::Entry* entry{nullptr};
  std::string tag;
  std::map<std::string, Node> children;
};

// Re-raises with the object path appended, keeping the error kind.
template <class F>
static auto with_context(const std::string& path, F&& f) -> decltype(f()) {
  try {
    return f();
  } catch (const Error& e) {
    throw Error(e.kind(), std::string(e.what()) + " (in '" + path + "')");
  }
}

ArchiveReader::ArchiveReader(Registry registry) : registry_(std::move(registry)) {}

Collection ArchiveReader::read(const std::string& path) const {
  return parse(slurp(with_far_extension(path)));
}

Value ArchiveReader::decode_node(const zip::ZipReader& zip, const std::string& path, const Node& node) const {
  if (!node.entry) FARSTORE_THROW(MalformedArchive, "'" + path + "' has nested entries but no type tag");

  if (node.tag == kArrayTag) {
    if (!node.children.empty()) FARSTORE_THROW(MalformedArchive, "array '" + path + "' has nested entries");
    return with_context(path, [&] { return Value(npy::decode(zip.read(*node.entry))); });
  }
  if (node.tag == kAggregateTag)
    FARSTORE_THROW(MalformedArchive, "'" + node.entry->name + "' uses the aggregate tag outside '" + kAggregateName + "'");

  const CompositeKind* kind = registry_.find(node.tag.substr(1));
  if (!kind)
    FARSTORE_THROW(UnknownTypeTag, "entry '" + node.entry->name + "' has unknown type tag '" + node.tag +
                   "'; it was probably written by a different version of farstore");

  // children first, then the record itself
  Fields fields;
  for (const auto& kv : node.children) {
    fields.emplace(kv.first, decode_node(zip, join_path(path, kv.first), kv.second));
  }
  return with_context(path, [&] {
    std::vector<uint8_t> raw = zip.read(*node.entry);
    json::Value inline_fields = json::parse(std::string(raw.begin(), raw.end()));
    if (!inline_fields.is_object()) FARSTORE_THROW(MalformedArchive, node.tag + " payload is not a JSON object");
    for (const auto& kv : inline_fields.o) {
      if (fields.count(kv.first))
        FARSTORE_THROW(MalformedArchive, "field '" + kv.first + "' is stored both inline and as an entry");
      fields.emplace(kv.first, Value(generic::decode(kv.second)));
    }
    return kind->decode(fields);
  });
}

Collection ArchiveReader::parse(std::vector<uint8_t> image) const {
  zip::ZipReader zip(std::move(image));

  Node root;
  for (const auto& e : zip.entries()) {
    if (!e.name.empty() && e.name.back() == kPathSeparator) continue;  // directory record
    std::vector<std::string> segs = split_path(e.name);
    if (segs.size() < 2 || !is_tag(segs.back()))
      FARSTORE_THROW(MalformedArchive, "entry '" + e.name + "' does not end in a type tag");
    Node* n = &root;
    for (size_t k = 0; k + 1 < segs.size(); ++k) {
      if (!is_valid_name(segs[k])) FARSTORE_THROW(MalformedArchive, "entry '" + e.name + "' has an invalid path segment");
      n = &n->children[segs[k]];
    }
    if (n->entry) FARSTORE_THROW(MalformedArchive, "entries '" + n->entry->name + "' and '" + e.name + "' share a path");
    n->entry = &e;
    n->tag = segs.back();
  }

  Collection out;
  const Node* aggregate = nullptr;
  for (const auto& kv : root.children) {
    if (kv.first == kAggregateName) {
      if (kv.second.tag != kAggregateTag || !kv.second.children.empty())
        FARSTORE_THROW(MalformedArchive, std::string("'") + kAggregateName + "' is reserved for the generic aggregate");
      aggregate = &kv.second;
      continue;
    }
    out.emplace(kv.first, decode_node(zip, kv.first, kv.second));
  }

  if (aggregate) {
    std::vector<uint8_t> bytes = zip.read(*aggregate->entry);
    json::Value wrapper = with_context(kAggregateName, [&] { return json::parse(std::string(bytes.begin(), bytes.end())); });
    if (!wrapper.is_object()) FARSTORE_THROW(MalformedArchive, "generic aggregate is not a JSON object");
    for (const auto& kv : wrapper.o) {
      if (!is_valid_name(kv.first)) FARSTORE_THROW(MalformedArchive, "generic aggregate holds invalid name '" + kv.first + "'");
      if (kv.first == kAggregateName)
        FARSTORE_THROW(MalformedArchive, std::string("generic aggregate holds the reserved name '") + kAggregateName + "'");
      if (out.count(kv.first)) FARSTORE_THROW(MalformedArchive, "object '" + kv.first + "' is stored twice");
      out.emplace(kv.first, with_context(kv.first, [&] { return Value(generic::decode(kv.second)); }));
    }
  }
  return out;
}

} // namespace farstore
