#include <gtest/gtest.h>
#include "runtime/zip.hpp"
#include "common.hpp"

#include <string>
#include <vector>

using namespace farstore;

namespace {

std::string text_of(const std::vector<uint8_t>& v) { return std::string(v.begin(), v.end()); }

std::vector<uint8_t> repetitive(size_t n) {
  std::vector<uint8_t> v(n);
  for (size_t i = 0; i < n; ++i) v[i] = static_cast<uint8_t>(i % 7);
  return v;
}

} // namespace

class ZipTest : public ::testing::TestWithParam<zip::Method> {};

TEST_P(ZipTest, EntriesReadBackInOrder) {
  zip::ZipWriter w(GetParam());
  w.add("a/$ndarray", repetitive(5000));
  w.add("builtin_wrapper/$BuiltinsWrapper", std::string("{\"x\":[1,2,3]}"));
  w.add("empty/$Thing", std::string());
  zip::ZipReader r(w.finish());

  ASSERT_EQ(r.entries().size(), 3u);
  EXPECT_EQ(r.entries()[0].name, "a/$ndarray");
  EXPECT_EQ(r.entries()[1].name, "builtin_wrapper/$BuiltinsWrapper");
  EXPECT_EQ(r.entries()[2].name, "empty/$Thing");
  for (const auto& e : r.entries()) EXPECT_EQ(e.method, GetParam());

  EXPECT_EQ(r.read(r.entries()[0]), repetitive(5000));
  EXPECT_EQ(text_of(r.read(*r.find("builtin_wrapper/$BuiltinsWrapper"))), "{\"x\":[1,2,3]}");
  EXPECT_TRUE(r.read(r.entries()[2]).empty());
  EXPECT_EQ(r.find("missing"), nullptr);
}

INSTANTIATE_TEST_SUITE_P(Methods, ZipTest, ::testing::Values(zip::Method::Stored, zip::Method::Deflated));

TEST(ZipWriterTest, DeflateShrinksRepetitiveData) {
  zip::ZipWriter stored(zip::Method::Stored);
  zip::ZipWriter deflated(zip::Method::Deflated, 9);
  stored.add("x/$ndarray", repetitive(100000));
  deflated.add("x/$ndarray", repetitive(100000));
  EXPECT_LT(deflated.finish().size(), stored.finish().size() / 10);
}

TEST(ZipWriterTest, DuplicateNameIsRejected) {
  zip::ZipWriter w;
  w.add("x/$ndarray", std::string("1"));
  try {
    w.add("x/$ndarray", std::string("2"));
    FAIL() << "duplicate accepted";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::MalformedArchive);
  }
}

TEST(ZipWriterTest, LayoutMatchesZipSpec) {
  zip::ZipWriter w;
  w.add("n/$ndarray", std::string("abc"));
  std::vector<uint8_t> img = w.finish();
  // local header, then 30 + 10 name bytes + 3 data bytes before the central directory
  EXPECT_EQ(img[0], 0x50);
  EXPECT_EQ(img[1], 0x4b);
  EXPECT_EQ(img[2], 0x03);
  EXPECT_EQ(img[3], 0x04);
  EXPECT_EQ(img[43], 0x50);
  EXPECT_EQ(img[44], 0x4b);
  EXPECT_EQ(img[45], 0x01);
  EXPECT_EQ(img[46], 0x02);
  const size_t eocd = img.size() - 22;
  EXPECT_EQ(img[eocd + 2], 0x05);
  EXPECT_EQ(img[eocd + 3], 0x06);
  EXPECT_EQ(img[eocd + 10], 1);  // entry count
}

TEST(ZipReaderTest, CorruptedPayloadFailsCrc) {
  zip::ZipWriter w;
  w.add("n/$ndarray", std::string("payload"));
  std::vector<uint8_t> img = w.finish();
  img[30 + 10] ^= 0xFF;  // first data byte
  zip::ZipReader r(img);
  try {
    r.read(r.entries()[0]);
    FAIL() << "corruption not detected";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::MalformedArchive);
    EXPECT_NE(std::string(e.what()).find("CRC"), std::string::npos);
  }
}

TEST(ZipReaderTest, NotAZipIsMalformed) {
  std::vector<uint8_t> junk(100, 0x20);
  try {
    zip::ZipReader r(junk);
    FAIL() << "junk accepted";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::MalformedArchive);
  }
  EXPECT_THROW(zip::ZipReader(std::vector<uint8_t>{}), Error);
}

TEST(ZipReaderTest, TruncatedArchiveIsMalformed) {
  zip::ZipWriter w;
  w.add("n/$ndarray", repetitive(1000));
  std::vector<uint8_t> img = w.finish();
  img.erase(img.begin() + 500, img.begin() + 700);
  EXPECT_THROW({ zip::ZipReader r(img); r.read(r.entries().at(0)); }, Error);
}

TEST(ZipReaderTest, InflatedSizeIsNotTakenOnTrust) {
  zip::ZipWriter w(zip::Method::Deflated);
  w.add("n/$ndarray", repetitive(1000));
  std::vector<uint8_t> img = w.finish();
  auto put32 = [&img](size_t at, uint32_t v) {
    for (int k = 0; k < 4; ++k) img[at + k] = static_cast<uint8_t>((v >> (8*k)) & 0xFF);
  };
  const size_t eocd = img.size() - 22;
  const size_t cd = img[eocd + 16] | (img[eocd + 17] << 8) | (img[eocd + 18] << 16) | (static_cast<size_t>(img[eocd + 19]) << 24);
  put32(22, 0xFFFFFFF0u);      // local header
  put32(cd + 24, 0xFFFFFFF0u); // central directory
  zip::ZipReader r(img);
  ASSERT_EQ(r.entries().at(0).uncomp_size, 0xFFFFFFF0u);
  try {
    r.read(r.entries()[0]);
    FAIL() << "oversized claim accepted";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::MalformedArchive);
  }
}

TEST(ZipReaderTest, InflatedSizeSmallerThanClaimIsMalformed) {
  zip::ZipWriter w(zip::Method::Deflated);
  w.add("a", repetitive(200000));
  std::vector<uint8_t> img = w.finish();
  const size_t eocd = img.size() - 22;
  const size_t cd = img[eocd + 16] | (img[eocd + 17] << 8) | (img[eocd + 18] << 16) | (static_cast<size_t>(img[eocd + 19]) << 24);
  img[cd + 24] = 0x3f;  // 200000 = 0x00030d40 becomes 0x00030d3f
  zip::ZipReader r(img);
  ASSERT_EQ(r.entries()[0].uncomp_size, 199999u);
  EXPECT_THROW(r.read(r.entries()[0]), Error);
}
