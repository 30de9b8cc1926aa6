#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "../runtime/json.hpp"
#include "../runtime/zip.hpp"
#include "registry.hpp"

namespace farstore {

struct WriteOptions {
  bool compress{false};  // deflate entries instead of storing them
  int level{-1};         // zlib level, -1 = Z_DEFAULT_COMPRESSION
};

class ArchiveWriter {
 public:
  explicit ArchiveWriter(Registry registry, WriteOptions options = {});

  // Builds the complete archive image in memory. Throws Error with kind
  // NameCollision, InvalidName or UnsupportedType before producing anything.
  std::vector<uint8_t> serialize(const Collection& objects) const;

  // serialize() then one atomic replace of the destination. Returns the
  // path written, with ".far" appended when missing.
  std::string write(const std::string& path, const Collection& objects) const;

  const Registry& registry() const { return registry_; }
  const WriteOptions& options() const { return options_; }

 private:
  void encode_object(zip::ZipWriter& zip, const std::string& path, const Value& v) const;
  void encode_composite(zip::ZipWriter& zip, const std::string& path, const CompositeKind& kind, const Value& v) const;

  Registry registry_;
  WriteOptions options_;
};

} // namespace farstore
