#include "layout.hpp"
#include "../common.hpp"

namespace farstore {

std::vector<std::string> split_path(const std::string& path) {
  std::vector<std::string> out;
  size_t start = 0;
  while (true) {
    size_t sep = path.find(kPathSeparator, start);
    if (sep == std::string::npos) {
      out.push_back(path.substr(start));
      break;
    }
    out.push_back(path.substr(start, sep - start));
    start = sep + 1;
  }
  return out;
}

bool is_valid_name(const std::string& name) {
  return !name.empty() && name[0] != kTagMarker && name.find(kPathSeparator) == std::string::npos;
}

void check_name(const std::string& name, const std::string& what) {
  if (is_valid_name(name)) return;
  FARSTORE_THROW(InvalidName, what + " name '" + name + "' must be non-empty, must not contain '" +
                 std::string(1, kPathSeparator) + "' and must not start with '" +
                 std::string(1, kTagMarker) + "'");
}

} // namespace farstore
