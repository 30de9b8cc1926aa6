#include "zip.hpp"
#include "../common.hpp"

#include <algorithm>
#include <ctime>
#include <limits>
#include <zlib.h>

namespace farstore::zip {

static uint16_t rd16(const uint8_t* p) { return static_cast<uint16_t>(p[0] | (p[1]<<8)); }
static uint32_t rd32(const uint8_t* p) { return (uint32_t)p[0] | ((uint32_t)p[1]<<8) | ((uint32_t)p[2]<<16) | ((uint32_t)p[3]<<24); }

static void wr16(std::vector<uint8_t>& b, uint16_t v) { b.push_back(v & 0xFF); b.push_back((v >> 8) & 0xFF); }
static void wr32(std::vector<uint8_t>& b, uint32_t v) { for (int k = 0; k < 4; ++k) b.push_back((v >> (8*k)) & 0xFF); }

static constexpr uint32_t kLocalSig   = 0x04034b50;
static constexpr uint32_t kCentralSig = 0x02014b50;
static constexpr uint32_t kEocdSig    = 0x06054b50;
static constexpr uint16_t kVersion    = 20;
static constexpr uint16_t kFlagUtf8   = 0x0800;

static uint16_t name_flags(const std::string& name) {
  bool ascii = std::all_of(name.begin(), name.end(), [](char c){ return static_cast<unsigned char>(c) < 0x80; });
  return ascii ? 0 : kFlagUtf8;
}

static uint32_t crc_of(const uint8_t* data, size_t size) {
  uLong crc = crc32(0L, Z_NULL, 0);
  // crc32 takes a uInt length; feed large buffers in chunks
  while (size > 0) {
    uInt n = static_cast<uInt>(std::min<size_t>(size, std::numeric_limits<uInt>::max()));
    crc = crc32(crc, data, n);
    data += n; size -= n;
  }
  return static_cast<uint32_t>(crc);
}

static std::vector<uint8_t> deflate_raw(const uint8_t* data, size_t size, int level) {
  z_stream strm{};
  if (deflateInit2(&strm, level, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK)
    FARSTORE_THROW(Io, "zlib deflateInit2 failed");
  std::vector<uint8_t> out(deflateBound(&strm, static_cast<uLong>(size)));
  strm.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data));
  strm.avail_in = static_cast<uInt>(size);
  strm.next_out = reinterpret_cast<Bytef*>(out.data());
  strm.avail_out = static_cast<uInt>(out.size());
  int ret = deflate(&strm, Z_FINISH);
  size_t produced = out.size() - strm.avail_out;
  deflateEnd(&strm);
  if (ret != Z_STREAM_END) FARSTORE_THROW(Io, "zlib deflate failed: " + std::to_string(ret));
  out.resize(produced);
  return out;
}

ZipWriter::ZipWriter(Method method, int level) : method_(method), level_(level) {
  std::time_t now = std::time(nullptr);
  std::tm tm{};
  localtime_r(&now, &tm);
  int year = std::max(tm.tm_year + 1900, 1980);
  dos_time_ = static_cast<uint16_t>((tm.tm_hour << 11) | (tm.tm_min << 5) | (tm.tm_sec / 2));
  dos_date_ = static_cast<uint16_t>(((year - 1980) << 9) | ((tm.tm_mon + 1) << 5) | tm.tm_mday);
}

void ZipWriter::add(const std::string& name, const uint8_t* data, size_t size) {
  if (finished_) FARSTORE_THROW(Io, "zip: archive already finished");
  if (name.empty() || name.size() > 0xFFFF) FARSTORE_THROW(MalformedArchive, "zip: bad entry name length");
  if (!names_.insert(name).second) FARSTORE_THROW(MalformedArchive, "zip: duplicate entry '" + name + "'");
  if (size > std::numeric_limits<uint32_t>::max())
    FARSTORE_THROW(MalformedArchive, "zip: entry '" + name + "' exceeds 4 GiB");
  if (entries_.size() >= 0xFFFF) FARSTORE_THROW(MalformedArchive, "zip: too many entries");

  Entry e;
  e.name = name;
  e.method = method_;
  e.crc = crc_of(data, size);
  e.uncomp_size = static_cast<uint32_t>(size);
  if (buf_.size() > std::numeric_limits<uint32_t>::max())
    FARSTORE_THROW(MalformedArchive, "zip: archive exceeds 4 GiB");
  e.local_header_ofs = static_cast<uint32_t>(buf_.size());

  std::vector<uint8_t> packed;
  if (method_ == Method::Deflated) packed = deflate_raw(data, size, level_);
  const uint8_t* payload = method_ == Method::Deflated ? packed.data() : data;
  const size_t payload_size = method_ == Method::Deflated ? packed.size() : size;
  e.comp_size = static_cast<uint32_t>(payload_size);

  wr32(buf_, kLocalSig);
  wr16(buf_, kVersion);
  wr16(buf_, name_flags(name));
  wr16(buf_, static_cast<uint16_t>(e.method));
  wr16(buf_, dos_time_);
  wr16(buf_, dos_date_);
  wr32(buf_, e.crc);
  wr32(buf_, e.comp_size);
  wr32(buf_, e.uncomp_size);
  wr16(buf_, static_cast<uint16_t>(name.size()));
  wr16(buf_, 0);
  buf_.insert(buf_.end(), name.begin(), name.end());
  if (payload_size) buf_.insert(buf_.end(), payload, payload + payload_size);
  entries_.push_back(std::move(e));
}

std::vector<uint8_t> ZipWriter::finish() {
  if (finished_) FARSTORE_THROW(Io, "zip: archive already finished");
  finished_ = true;
  const size_t cd_ofs = buf_.size();
  for (const auto& e : entries_) {
    wr32(buf_, kCentralSig);
    wr16(buf_, kVersion);   // made by
    wr16(buf_, kVersion);   // needed
    wr16(buf_, name_flags(e.name));
    wr16(buf_, static_cast<uint16_t>(e.method));
    wr16(buf_, dos_time_);
    wr16(buf_, dos_date_);
    wr32(buf_, e.crc);
    wr32(buf_, e.comp_size);
    wr32(buf_, e.uncomp_size);
    wr16(buf_, static_cast<uint16_t>(e.name.size()));
    wr16(buf_, 0);          // extra
    wr16(buf_, 0);          // comment
    wr16(buf_, 0);          // disk
    wr16(buf_, 0);          // internal attrs
    wr32(buf_, 0);          // external attrs
    wr32(buf_, e.local_header_ofs);
    buf_.insert(buf_.end(), e.name.begin(), e.name.end());
  }
  const size_t cd_size = buf_.size() - cd_ofs;
  if (buf_.size() > std::numeric_limits<uint32_t>::max())
    FARSTORE_THROW(MalformedArchive, "zip: archive exceeds 4 GiB");
  wr32(buf_, kEocdSig);
  wr16(buf_, 0);
  wr16(buf_, 0);
  wr16(buf_, static_cast<uint16_t>(entries_.size()));
  wr16(buf_, static_cast<uint16_t>(entries_.size()));
  wr32(buf_, static_cast<uint32_t>(cd_size));
  wr32(buf_, static_cast<uint32_t>(cd_ofs));
  wr16(buf_, 0);
  return std::move(buf_);
}

static bool parse_eocd(const std::vector<uint8_t>& z, uint32_t& cd_ofs, uint32_t& cd_size, uint16_t& entries) {
  // EOCD signature 0x06054b50, located within last 64K+22 bytes
  if (z.size() < 22) return false;
  size_t max_back = std::min<size_t>(z.size(), 0xFFFF + 22);
  for (size_t back = 22; back <= max_back; ++back) {
    size_t i = z.size() - back;
    if (rd32(&z[i]) == kEocdSig) {
      entries = rd16(&z[i+10]);
      cd_size = rd32(&z[i+12]);
      cd_ofs  = rd32(&z[i+16]);
      return true;
    }
  }
  return false;
}

static std::vector<Entry> parse_central_dir(const std::vector<uint8_t>& z, uint32_t cd_ofs, uint16_t entries) {
  std::vector<Entry> out;
  size_t i = cd_ofs;
  for (uint16_t e = 0; e < entries; ++e) {
    if (i + 46 > z.size() || rd32(&z[i]) != kCentralSig) FARSTORE_THROW(MalformedArchive, "zip: bad central dir sig");
    uint16_t method = rd16(&z[i+10]);
    uint32_t crc    = rd32(&z[i+16]);
    uint32_t comp   = rd32(&z[i+20]);
    uint32_t uncomp = rd32(&z[i+24]);
    uint16_t nlen   = rd16(&z[i+28]);
    uint16_t xlen   = rd16(&z[i+30]);
    uint16_t clen   = rd16(&z[i+32]);
    uint32_t lho    = rd32(&z[i+42]);
    i += 46;
    if (i + nlen > z.size()) FARSTORE_THROW(MalformedArchive, "zip: truncated central dir");
    std::string name(reinterpret_cast<const char*>(&z[i]), nlen);
    i += nlen + xlen + clen;
    if (method != 0 && method != 8)
      FARSTORE_THROW(MalformedArchive, "zip: unsupported compression method " + std::to_string(method) + " for '" + name + "'");
    out.push_back({name, static_cast<Method>(method), crc, comp, uncomp, lho});
  }
  return out;
}

static size_t data_offset(const std::vector<uint8_t>& z, const Entry& e) {
  size_t i = e.local_header_ofs;
  if (i + 30 > z.size() || rd32(&z[i]) != kLocalSig) FARSTORE_THROW(MalformedArchive, "zip: bad local header sig for '" + e.name + "'");
  uint16_t nlen = rd16(&z[i+26]);
  uint16_t xlen = rd16(&z[i+28]);
  size_t ofs = i + 30 + nlen + xlen;
  if (ofs + e.comp_size > z.size()) FARSTORE_THROW(MalformedArchive, "zip: truncated data for '" + e.name + "'");
  return ofs;
}

ZipReader::ZipReader(std::vector<uint8_t> image) : z_(std::move(image)) {
  uint32_t cd_ofs=0, cd_size=0; uint16_t count=0;
  if (!parse_eocd(z_, cd_ofs, cd_size, count)) FARSTORE_THROW(MalformedArchive, "zip: end of central directory not found");
  if (static_cast<size_t>(cd_ofs) + cd_size > z_.size()) FARSTORE_THROW(MalformedArchive, "zip: central directory out of range");
  entries_ = parse_central_dir(z_, cd_ofs, count);
}

const Entry* ZipReader::find(const std::string& name) const {
  for (const auto& e : entries_) if (e.name == name) return &e;
  return nullptr;
}

std::vector<uint8_t> ZipReader::read(const Entry& e) const {
  const uint8_t* src = &z_[0] + data_offset(z_, e);
  std::vector<uint8_t> out;
  if (e.method == Method::Stored) {
    if (e.comp_size != e.uncomp_size) FARSTORE_THROW(MalformedArchive, "zip: stored size mismatch for '" + e.name + "'");
    out.assign(src, src + e.comp_size);
  } else {
    // grow with the output actually produced; the header size is only a claim
    constexpr size_t kChunk = 64 * 1024;
    z_stream strm{};
    strm.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(src));
    strm.avail_in = e.comp_size;
    if (inflateInit2(&strm, -MAX_WBITS) != Z_OK) FARSTORE_THROW(Io, "zlib inflateInit2 failed");
    size_t produced = 0;
    int ret = Z_OK;
    while (ret == Z_OK && produced <= e.uncomp_size) {
      out.resize(produced + kChunk);
      strm.next_out = reinterpret_cast<Bytef*>(out.data() + produced);
      strm.avail_out = static_cast<uInt>(kChunk);
      ret = inflate(&strm, Z_NO_FLUSH);
      produced = out.size() - strm.avail_out;
    }
    inflateEnd(&strm);
    if (ret != Z_STREAM_END || produced != e.uncomp_size)
      FARSTORE_THROW(MalformedArchive, "zip: inflate failed for '" + e.name + "'");
    out.resize(produced);
  }
  if (crc_of(out.data(), out.size()) != e.crc) FARSTORE_THROW(MalformedArchive, "zip: CRC mismatch for '" + e.name + "'");
  return out;
}

} // namespace farstore::zip
