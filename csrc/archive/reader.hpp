#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "../runtime/zip.hpp"
#include "registry.hpp"

namespace farstore {

class ArchiveReader {
 public:
  explicit ArchiveReader(Registry registry);

  // Reads "<path>.far" (the extension is appended when missing).
  Collection read(const std::string& path) const;

  // Decodes an archive image already in memory. Throws Error with kind
  // MalformedArchive or UnknownTypeTag; nothing is returned partially.
  Collection parse(std::vector<uint8_t> image) const;

  const Registry& registry() const { return registry_; }

 private:
  struct Node;
  Value decode_node(const zip::ZipReader& zip, const std::string& path, const Node& node) const;

  Registry registry_;
};

} // namespace farstore
