#pragma once

#include <string>
#include <vector>

namespace farstore {

// Entry names are "<object>/<field>/.../<tag>". The last segment is a type
// tag, the only segment allowed to start with the marker.
constexpr char kTagMarker = '$';
constexpr char kPathSeparator = '/';

constexpr const char* kArrayTag = "$ndarray";
constexpr const char* kAggregateTag = "$BuiltinsWrapper";
// Top-level key of the synthetic aggregate. Never visible after a read.
constexpr const char* kAggregateName = "builtin_wrapper";

inline std::string composite_tag(const std::string& kind) { return std::string(1, kTagMarker) + kind; }

inline bool is_tag(const std::string& segment) { return !segment.empty() && segment[0] == kTagMarker; }

inline std::string join_path(const std::string& parent, const std::string& child) {
  return parent + kPathSeparator + child;
}

std::vector<std::string> split_path(const std::string& path);

// Object and field names: non-empty, no '/', no leading '$'.
bool is_valid_name(const std::string& name);
// Throws Error(InvalidName); `what` names the offending object/field.
void check_name(const std::string& name, const std::string& what);

} // namespace farstore
