#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace farstore::zip {

enum class Method : uint16_t { Stored = 0, Deflated = 8 };

struct Entry {
  std::string name;
  Method method{Method::Stored};
  uint32_t crc{0};
  uint32_t comp_size{0};
  uint32_t uncomp_size{0};
  uint32_t local_header_ofs{0};
};

// Builds a complete archive in memory. Nothing touches the disk.
class ZipWriter {
 public:
  explicit ZipWriter(Method method = Method::Stored, int level = -1);

  // Throws Error(MalformedArchive) on a duplicate name or an entry too large
  // for the non-Zip64 format.
  void add(const std::string& name, const uint8_t* data, size_t size);
  void add(const std::string& name, const std::vector<uint8_t>& data) { add(name, data.data(), data.size()); }
  void add(const std::string& name, const std::string& text) {
    add(name, reinterpret_cast<const uint8_t*>(text.data()), text.size());
  }

  const std::vector<Entry>& entries() const { return entries_; }

  // Appends the central directory and returns the archive image.
  std::vector<uint8_t> finish();

 private:
  Method method_;
  int level_;
  uint16_t dos_time_{0};
  uint16_t dos_date_{0};
  std::vector<uint8_t> buf_;
  std::vector<Entry> entries_;
  std::set<std::string> names_;
  bool finished_{false};
};

// Read-only view over an archive image held in memory.
class ZipReader {
 public:
  explicit ZipReader(std::vector<uint8_t> image);

  const std::vector<Entry>& entries() const { return entries_; }
  const Entry* find(const std::string& name) const;
  // Inflates if needed and verifies the CRC-32.
  std::vector<uint8_t> read(const Entry& e) const;

 private:
  std::vector<uint8_t> z_;
  std::vector<Entry> entries_;
};

} // namespace farstore::zip
