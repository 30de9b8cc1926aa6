#include "archive.hpp"
#include "../records/records.hpp"

namespace farstore {

std::string write(const std::string& path, const Collection& objects, bool compress) {
  WriteOptions options;
  options.compress = compress;
  return ArchiveWriter(make_default_registry(), options).write(path, objects);
}

Collection read(const std::string& path) {
  return ArchiveReader(make_default_registry()).read(path);
}

} // namespace farstore
