#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "ndarray.hpp"

namespace farstore::npy {

// Parsed NPY header dict.
struct Header {
  DType dtype{DType::F64};
  char byte_order{'<'};  // '<', '>' or '|'
  bool fortran_order{false};
  Shape shape;
};

// NPY descr for native little-endian output, e.g. "<f8", "|u1".
std::string descr(DType dt);

// Full NPY file image (header + raw C-order data).
std::vector<uint8_t> encode(const NdArray& a);

// Parse an NPY image. Non-native byte orders are swapped to native.
// Throws Error(MalformedArchive) for bad magic, unknown descr, Fortran
// order or a payload whose length disagrees with the header.
NdArray decode(const uint8_t* data, size_t size);
inline NdArray decode(const std::vector<uint8_t>& buf) { return decode(buf.data(), buf.size()); }

Header parse_header(const uint8_t* data, size_t size, size_t& payload_ofs);

} // namespace farstore::npy
