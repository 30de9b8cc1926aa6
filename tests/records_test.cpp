#include <gtest/gtest.h>
#include "archive/reader.hpp"
#include "archive/writer.hpp"
#include "records/records.hpp"

#include <cmath>
#include <complex>
#include <limits>

using namespace farstore;

namespace {

Signal make_signal() {
  Signal s;
  s.time = NdArray::from<double>(Shape{{2, 4}}, {0, 1, 0, -1, 0.5, 0.5, 0.5, 0.5});
  s.sampling_rate = 48000;
  s.fft_norm = "rms";
  s.comment = "two channels";
  return s;
}

Coordinates make_coordinates() {
  Coordinates c;
  c.points = NdArray::from<double>(Shape{{2, 3}}, {1, 0, 0, 0, 1, 0});
  c.domain = "cart";
  c.comment = "speakers";
  return c;
}

Value through_archive(const Value& v) {
  Collection in{{"obj", v}};
  Collection out = ArchiveReader(make_default_registry()).parse(ArchiveWriter(make_default_registry()).serialize(in));
  EXPECT_EQ(out.size(), 1u);
  return out.at("obj");
}

ErrorKind decode_error(const CompositeKind& kind, const Fields& f) {
  try {
    kind.decode(f);
  } catch (const Error& e) {
    return e.kind();
  }
  ADD_FAILURE() << kind.tag << " accepted invalid fields";
  return ErrorKind::Io;
}

} // namespace

TEST(RecordsTest, DefaultRegistryHoldsAllKinds) {
  Registry r = make_default_registry();
  for (const char* tag : {"Signal", "TimeData", "FrequencyData", "Coordinates", "Orientations"}) {
    EXPECT_NE(r.find(tag), nullptr) << tag;
  }
  EXPECT_EQ(r.kinds().size(), 5u);
  EXPECT_THROW(register_records(r), Error);
}

TEST(RecordsTest, SignalSurvivesArchive) {
  Signal s = make_signal();
  Value back = through_archive(s);
  ASSERT_TRUE(back.is<Signal>()) << back.type_name();
  EXPECT_EQ(back.as<Signal>(), s);
  EXPECT_EQ(back.as<Signal>().cshape(), Shape{{2}});
  EXPECT_EQ(back.as<Signal>().n_samples(), 4);
}

TEST(RecordsTest, TimeDataSurvivesArchive) {
  TimeData d;
  d.data = NdArray::from<float>(Shape{{3}}, {1.f, 2.f, 3.f});
  d.times = NdArray::from<double>(Shape{{3}}, {0.0, 0.1, 0.35});
  d.comment = "uneven";
  Value back = through_archive(d);
  ASSERT_TRUE(back.is<TimeData>());
  EXPECT_EQ(back.as<TimeData>(), d);
}

TEST(RecordsTest, FrequencyDataKeepsComplexBins) {
  FrequencyData d;
  d.freq = NdArray::from<std::complex<double>>(Shape{{1, 2}}, {{1, -1}, {0.5, 0}});
  d.frequencies = NdArray::from<double>(Shape{{2}}, {100, 1000});
  d.fft_norm = "none";
  Value back = through_archive(d);
  ASSERT_TRUE(back.is<FrequencyData>());
  EXPECT_EQ(back.as<FrequencyData>(), d);
  EXPECT_EQ(back.as<FrequencyData>().freq.values<std::complex<double>>()[0], std::complex<double>(1, -1));
}

TEST(RecordsTest, CoordinatesAndOrientationsSurviveArchive) {
  Coordinates c = make_coordinates();
  c.domain = "sph";
  c.unit = "rad";
  Value back = through_archive(c);
  ASSERT_TRUE(back.is<Coordinates>());
  EXPECT_EQ(back.as<Coordinates>(), c);
  EXPECT_EQ(back.as<Coordinates>().csize(), 2);

  Orientations o;
  o.quat = NdArray::from<double>(Shape{{1, 4}}, {0, 0, 0, 1});
  Value oback = through_archive(o);
  ASSERT_TRUE(oback.is<Orientations>());
  EXPECT_EQ(oback.as<Orientations>(), o);
}

TEST(RecordsTest, SignalFieldsAreSplitByCategory) {
  Fields f = signal_kind().encode(make_signal());
  EXPECT_TRUE(f.at("time").is<NdArray>());
  EXPECT_TRUE(f.at("sampling_rate").is<Generic>());
  EXPECT_TRUE(f.at("fft_norm").is<Generic>());
  EXPECT_TRUE(f.at("comment").is<Generic>());
}

TEST(RecordsTest, SignalValidation) {
  const CompositeKind k = signal_kind();
  Fields good = k.encode(make_signal());
  EXPECT_NO_THROW(k.decode(good));

  Fields f = good;
  f.erase("time");
  EXPECT_EQ(decode_error(k, f), ErrorKind::MalformedArchive);

  f = good;
  f["sampling_rate"] = Generic::real(0);
  EXPECT_EQ(decode_error(k, f), ErrorKind::MalformedArchive);

  f = good;
  f["sampling_rate"] = Generic::real(std::numeric_limits<double>::infinity());
  EXPECT_EQ(decode_error(k, f), ErrorKind::MalformedArchive);

  f = good;
  f["sampling_rate"] = Generic::integer(8000);
  EXPECT_EQ(k.decode(f).as<Signal>().sampling_rate, 8000.0);

  f = good;
  f["fft_norm"] = Generic::str("bogus");
  EXPECT_EQ(decode_error(k, f), ErrorKind::MalformedArchive);

  f = good;
  f["time"] = NdArray::from<std::complex<float>>(Shape{{1}}, {{1.f, 0.f}});
  EXPECT_EQ(decode_error(k, f), ErrorKind::MalformedArchive);

  f = good;
  f["comment"] = Generic::integer(1);
  EXPECT_EQ(decode_error(k, f), ErrorKind::MalformedArchive);
}

TEST(RecordsTest, AxisLengthMustMatchData) {
  const CompositeKind k = time_data_kind();
  TimeData d;
  d.data = NdArray::from<double>(Shape{{2, 3}}, {1, 2, 3, 4, 5, 6});
  d.times = NdArray::from<double>(Shape{{2}}, {0, 1});
  EXPECT_EQ(decode_error(k, k.encode(d)), ErrorKind::MalformedArchive);

  d.times = NdArray::from<int64_t>(Shape{{3}}, {0, 1, 2});
  EXPECT_EQ(decode_error(k, k.encode(d)), ErrorKind::MalformedArchive);

  d.times = NdArray::from<double>(Shape{{3}}, {0, 1, 2});
  EXPECT_NO_THROW(k.decode(k.encode(d)));
}

TEST(RecordsTest, CoordinatesValidation) {
  const CompositeKind k = coordinates_kind();
  Coordinates c = make_coordinates();
  c.domain = "polar";
  EXPECT_EQ(decode_error(k, k.encode(c)), ErrorKind::MalformedArchive);

  c = make_coordinates();
  c.points = NdArray::from<double>(Shape{{3}}, {1, 2, 3});
  EXPECT_EQ(decode_error(k, k.encode(c)), ErrorKind::MalformedArchive);

  c.points = NdArray::from<float>(Shape{{1, 3}}, {1.f, 2.f, 3.f});
  EXPECT_EQ(decode_error(k, k.encode(c)), ErrorKind::MalformedArchive);

  const CompositeKind ok = orientations_kind();
  Orientations o;
  o.quat = NdArray::from<double>(Shape{{1, 3}}, {0, 0, 1});
  EXPECT_EQ(decode_error(ok, ok.encode(o)), ErrorKind::MalformedArchive);
}

TEST(RecordsTest, FftNorms) {
  for (const char* n : {"none", "unitary", "amplitude", "rms", "power", "psd"}) EXPECT_TRUE(is_valid_fft_norm(n)) << n;
  EXPECT_FALSE(is_valid_fft_norm("RMS"));
  EXPECT_FALSE(is_valid_fft_norm(""));
}
