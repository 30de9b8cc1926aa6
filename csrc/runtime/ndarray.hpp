#pragma once

#include <complex>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

#include "../common.hpp"

namespace farstore {

enum class DType { I8, I16, I32, I64, U8, U16, U32, U64, F32, F64, C64, C128 };

inline size_t itemsize(DType dt) {
  switch (dt) {
    case DType::I8: case DType::U8: return 1;
    case DType::I16: case DType::U16: return 2;
    case DType::I32: case DType::U32: case DType::F32: return 4;
    case DType::I64: case DType::U64: case DType::F64: case DType::C64: return 8;
    case DType::C128: return 16;
  }
  return 0;
}

inline bool is_complex(DType dt) { return dt == DType::C64 || dt == DType::C128; }
inline bool is_floating(DType dt) { return dt == DType::F32 || dt == DType::F64; }

// numpy spelling, e.g. "float64", "complex128".
inline const char* dtype_name(DType dt) {
  switch (dt) {
    case DType::I8: return "int8";
    case DType::I16: return "int16";
    case DType::I32: return "int32";
    case DType::I64: return "int64";
    case DType::U8: return "uint8";
    case DType::U16: return "uint16";
    case DType::U32: return "uint32";
    case DType::U64: return "uint64";
    case DType::F32: return "float32";
    case DType::F64: return "float64";
    case DType::C64: return "complex64";
    case DType::C128: return "complex128";
  }
  return "?";
}

template <class T> struct dtype_of;
template <> struct dtype_of<int8_t> { static constexpr DType value = DType::I8; };
template <> struct dtype_of<int16_t> { static constexpr DType value = DType::I16; };
template <> struct dtype_of<int32_t> { static constexpr DType value = DType::I32; };
template <> struct dtype_of<int64_t> { static constexpr DType value = DType::I64; };
template <> struct dtype_of<uint8_t> { static constexpr DType value = DType::U8; };
template <> struct dtype_of<uint16_t> { static constexpr DType value = DType::U16; };
template <> struct dtype_of<uint32_t> { static constexpr DType value = DType::U32; };
template <> struct dtype_of<uint64_t> { static constexpr DType value = DType::U64; };
template <> struct dtype_of<float> { static constexpr DType value = DType::F32; };
template <> struct dtype_of<double> { static constexpr DType value = DType::F64; };
template <> struct dtype_of<std::complex<float>> { static constexpr DType value = DType::C64; };
template <> struct dtype_of<std::complex<double>> { static constexpr DType value = DType::C128; };

struct Shape {
  std::vector<int64_t> dims;
  int64_t numel() const {
    int64_t n = 1;
    for (auto d : dims) n *= d;
    return n;
  }
  size_t ndim() const { return dims.size(); }
  std::string str() const;
  bool operator==(const Shape& o) const { return dims == o.dims; }
  bool operator!=(const Shape& o) const { return dims != o.dims; }
};

inline std::string Shape::str() const {
  std::string s = "(";
  for (size_t i = 0; i < dims.size(); ++i) {
    s += std::to_string(dims[i]);
    if (dims.size() == 1) s += ",";
    if (i + 1 < dims.size()) s += ", ";
  }
  s += ")";
  return s;
}

// Rectangular C-order buffer in native byte order.
struct NdArray {
  DType dtype{DType::F64};
  Shape shape;
  std::vector<uint8_t> host;

  size_t bytes() const { return static_cast<size_t>(shape.numel()) * itemsize(dtype); }

  void resize(const Shape& s) { shape = s; host.assign(bytes(), 0); }
  void* data() { return host.data(); }
  const void* data() const { return host.data(); }

  template <class T>
  static NdArray from(Shape s, const std::vector<T>& values) {
    NdArray a;
    a.dtype = dtype_of<T>::value;
    a.shape = std::move(s);
    if (static_cast<int64_t>(values.size()) != a.shape.numel())
      FARSTORE_THROW(MalformedArchive, "ndarray: " + std::to_string(values.size()) +
                     " values do not fill shape " + a.shape.str());
    a.host.resize(a.bytes());
    if (!values.empty()) std::memcpy(a.host.data(), values.data(), a.host.size());
    return a;
  }

  // Typed copy of the elements; T must match dtype exactly.
  template <class T>
  std::vector<T> values() const {
    if (dtype_of<T>::value != dtype)
      FARSTORE_THROW(MalformedArchive, std::string("ndarray: requested ") + dtype_name(dtype_of<T>::value) +
                     " from " + dtype_name(dtype) + " array");
    std::vector<T> out(static_cast<size_t>(shape.numel()));
    if (!out.empty()) std::memcpy(out.data(), host.data(), host.size());
    return out;
  }

  bool operator==(const NdArray& o) const { return dtype == o.dtype && shape == o.shape && host == o.host; }
  bool operator!=(const NdArray& o) const { return !(*this == o); }
};

} // namespace farstore
