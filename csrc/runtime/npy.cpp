#include "npy.hpp"
#include "../common.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace farstore::npy {

static uint16_t rd16(const uint8_t* p) { return static_cast<uint16_t>(p[0] | (p[1]<<8)); }
static uint32_t rd32(const uint8_t* p) { return (uint32_t)p[0] | ((uint32_t)p[1]<<8) | ((uint32_t)p[2]<<16) | ((uint32_t)p[3]<<24); }

static bool host_is_little_endian() {
  const uint16_t one = 1;
  uint8_t first;
  std::memcpy(&first, &one, 1);
  return first == 1;
}

static char type_char(DType dt) {
  switch (dt) {
    case DType::I8: case DType::I16: case DType::I32: case DType::I64: return 'i';
    case DType::U8: case DType::U16: case DType::U32: case DType::U64: return 'u';
    case DType::F32: case DType::F64: return 'f';
    case DType::C64: case DType::C128: return 'c';
  }
  return '?';
}

std::string descr(DType dt) {
  const size_t n = itemsize(dt);
  std::string d;
  d.push_back(n == 1 ? '|' : (host_is_little_endian() ? '<' : '>'));
  d.push_back(type_char(dt));
  d += std::to_string(n);
  return d;
}

static bool dtype_from_descr(const std::string& d, DType& dt, char& order) {
  if (d.size() < 3) return false;
  order = d[0];
  if (order != '<' && order != '>' && order != '|' && order != '=') return false;
  if (order == '=') order = host_is_little_endian() ? '<' : '>';
  const char t = d[1];
  const std::string width = d.substr(2);
  struct Row { char t; const char* w; DType dt; };
  static const Row table[] = {
    {'i', "1", DType::I8}, {'i', "2", DType::I16}, {'i', "4", DType::I32}, {'i', "8", DType::I64},
    {'u', "1", DType::U8}, {'u', "2", DType::U16}, {'u', "4", DType::U32}, {'u', "8", DType::U64},
    {'f', "4", DType::F32}, {'f', "8", DType::F64},
    {'c', "8", DType::C64}, {'c', "16", DType::C128},
  };
  for (const auto& r : table) {
    if (r.t == t && width == r.w) { dt = r.dt; return true; }
  }
  return false;
}

static std::string make_npy_header(const NdArray& a) {
  // {'descr': '<f8', 'fortran_order': False, 'shape': (d0, d1, ...), }
  std::ostringstream dict;
  dict << "{";
  dict << "'descr': '" << descr(a.dtype) << "', ";
  dict << "'fortran_order': False, ";
  dict << "'shape': " << a.shape.str() << ", ";
  dict << "}";
  std::string header = dict.str();

  // v1.0 has a 2-byte length field, v2.0 a 4-byte one. The preamble plus the
  // padded header ends on a 64-byte boundary and the header ends with '\n'.
  const char magic[] = "\x93NUMPY";
  uint8_t major = 1;
  size_t preamble = 10;
  size_t pad = (64 - (preamble + header.size() + 1) % 64) % 64;
  if (header.size() + pad + 1 > 0xFFFF) {
    major = 2;
    preamble = 12;
    pad = (64 - (preamble + header.size() + 1) % 64) % 64;
  }
  std::string header_padded = header;
  header_padded.append(pad, ' ');
  header_padded.push_back('\n');

  std::string out;
  out.append(magic, magic + 6);
  out.push_back(static_cast<char>(major));
  out.push_back(0);
  const uint32_t hlen = static_cast<uint32_t>(header_padded.size());
  out.push_back(static_cast<char>(hlen & 0xFF));
  out.push_back(static_cast<char>((hlen >> 8) & 0xFF));
  if (major == 2) {
    out.push_back(static_cast<char>((hlen >> 16) & 0xFF));
    out.push_back(static_cast<char>((hlen >> 24) & 0xFF));
  }
  out += header_padded;
  return out;
}

std::vector<uint8_t> encode(const NdArray& a) {
  if (a.host.size() != a.bytes())
    FARSTORE_THROW(MalformedArchive, "npy: buffer holds " + std::to_string(a.host.size()) +
                   " bytes but shape " + a.shape.str() + " of " + dtype_name(a.dtype) +
                   " needs " + std::to_string(a.bytes()));
  std::string hdr = make_npy_header(a);
  std::vector<uint8_t> out;
  out.reserve(hdr.size() + a.host.size());
  out.insert(out.end(), hdr.begin(), hdr.end());
  out.insert(out.end(), a.host.begin(), a.host.end());
  return out;
}

Header parse_header(const uint8_t* data, size_t size, size_t& payload_ofs) {
  // NPY magic: \x93NUMPY
  if (size < 10) FARSTORE_THROW(MalformedArchive, "npy: file too small");
  if (!(data[0]==0x93 && data[1]=='N' && data[2]=='U' && data[3]=='M' && data[4]=='P' && data[5]=='Y'))
    FARSTORE_THROW(MalformedArchive, "npy: bad magic");
  uint8_t major = data[6];
  size_t pos = 8;
  uint32_t hlen = 0;
  if (major == 1) {
    hlen = rd16(&data[pos]); pos += 2;
  } else if (major == 2 || major == 3) {
    if (size < 12) FARSTORE_THROW(MalformedArchive, "npy: file too small");
    hlen = rd32(&data[pos]); pos += 4;
  } else {
    FARSTORE_THROW(MalformedArchive, "npy: unsupported version " + std::to_string(major));
  }
  if (pos + hlen > size) FARSTORE_THROW(MalformedArchive, "npy: short header");
  std::string header(reinterpret_cast<const char*>(&data[pos]), hlen);
  pos += hlen;

  // The dict format is restricted enough for plain searches.
  auto find_str = [&](const char* key)->std::string{
    size_t k = header.find(std::string("'") + key + "':");
    if (k==std::string::npos) k = header.find(std::string("\"") + key + "\":");
    if (k==std::string::npos) FARSTORE_THROW(MalformedArchive, std::string("npy: missing key ")+key);
    size_t colon = header.find(':', k);
    size_t q1 = header.find_first_of("'\"", colon);
    if (q1==std::string::npos) FARSTORE_THROW(MalformedArchive, "npy: bad header (q1)");
    size_t q2 = header.find(header[q1], q1+1);
    if (q2==std::string::npos) FARSTORE_THROW(MalformedArchive, "npy: bad header (q2)");
    return header.substr(q1+1, q2-(q1+1));
  };
  auto find_bool = [&](const char* key)->bool{
    size_t k = header.find(std::string("'") + key + "':");
    if (k==std::string::npos) return false;
    size_t v = header.find_first_not_of(" ", header.find(':', k) + 1);
    return v != std::string::npos && header.compare(v, 4, "True") == 0;
  };
  auto find_shape = [&](){
    size_t k = header.find("'shape'");
    if (k==std::string::npos) FARSTORE_THROW(MalformedArchive, "npy: missing shape");
    size_t l = header.find('(', k);
    size_t r = header.find(')', l);
    if (l==std::string::npos || r==std::string::npos || r<l) FARSTORE_THROW(MalformedArchive, "npy: bad shape");
    Shape shp;
    std::string inside = header.substr(l+1, r-(l+1));
    size_t start=0;
    while (start < inside.size()) {
      while (start<inside.size() && std::isspace(static_cast<unsigned char>(inside[start]))) ++start;
      if (start<inside.size() && inside[start]=='-') FARSTORE_THROW(MalformedArchive, "npy: negative dimension");
      size_t end=start;
      while (end<inside.size() && (std::isdigit(static_cast<unsigned char>(inside[end])))) ++end;
      if (end>start) {
        const std::string digits = inside.substr(start, end-start);
        try {
          shp.dims.push_back(std::stoll(digits));
        } catch (const std::out_of_range&) {
          FARSTORE_THROW(MalformedArchive, "npy: dimension out of range: " + digits);
        }
      }
      size_t comma = inside.find(',', end);
      if (comma==std::string::npos) break;
      start = comma+1;
    }
    return shp;
  };

  Header h;
  const std::string d = find_str("descr");
  if (!dtype_from_descr(d, h.dtype, h.byte_order))
    FARSTORE_THROW(MalformedArchive, "npy: unsupported element type '" + d + "'");
  h.fortran_order = find_bool("fortran_order");
  h.shape = find_shape();
  // element count and byte size must fit before anything trusts numel()
  const int64_t limit = std::numeric_limits<int64_t>::max() / static_cast<int64_t>(itemsize(h.dtype));
  int64_t n = 1;
  for (int64_t dim : h.shape.dims) {
    if (dim != 0 && n > limit / dim)
      FARSTORE_THROW(MalformedArchive, "npy: shape " + h.shape.str() + " overflows the addressable size");
    n *= dim;
  }
  payload_ofs = pos;
  return h;
}

static void swap_elements(std::vector<uint8_t>& buf, size_t width) {
  for (size_t i = 0; i + width <= buf.size(); i += width) {
    std::reverse(buf.begin() + static_cast<std::ptrdiff_t>(i),
                 buf.begin() + static_cast<std::ptrdiff_t>(i + width));
  }
}

NdArray decode(const uint8_t* data, size_t size) {
  size_t pos = 0;
  Header h = parse_header(data, size, pos);
  if (h.fortran_order) FARSTORE_THROW(MalformedArchive, "npy: Fortran-ordered arrays are not supported");

  NdArray arr;
  arr.dtype = h.dtype;
  arr.shape = h.shape;
  const size_t expected = arr.bytes();
  const size_t actual = size - pos;
  if (actual != expected)
    FARSTORE_THROW(MalformedArchive, "npy: payload holds " + std::to_string(actual) + " bytes, header " +
                   descr(h.dtype) + " " + h.shape.str() + " implies " + std::to_string(expected));
  arr.host.assign(data + pos, data + size);

  const bool native_little = host_is_little_endian();
  const bool data_little = h.byte_order != '>';
  if (h.byte_order != '|' && data_little != native_little) {
    // complex values swap each real/imag half separately
    size_t width = itemsize(h.dtype);
    if (is_complex(h.dtype)) width /= 2;
    swap_elements(arr.host, width);
  }
  return arr;
}

} // namespace farstore::npy
