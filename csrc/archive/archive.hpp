#pragma once

#include <string>

#include "reader.hpp"
#include "writer.hpp"

namespace farstore {

// Writes every object of the collection to one .far archive using the
// built-in record kinds. Returns the path written.
//
//   farstore::write("session", {{"sig", signal}, {"gain", Generic::real(0.5)}});
//   farstore::Collection c = farstore::read("session.far");
std::string write(const std::string& path, const Collection& objects, bool compress = false);

Collection read(const std::string& path);

} // namespace farstore
