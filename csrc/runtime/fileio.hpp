#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace farstore {

constexpr const char* kArchiveExtension = ".far";

// Appends ".far" unless the path already ends with it.
std::string with_far_extension(const std::string& path);

// Whole-file read. Throws Error(Io) with the OS reason.
std::vector<uint8_t> slurp(const std::string& path);

// Writes bytes to a temp file beside `path`, fsyncs it and renames it over
// `path`. On failure the temp file is removed and `path` is left as it was.
void atomic_write(const std::string& path, const std::vector<uint8_t>& bytes);

} // namespace farstore
