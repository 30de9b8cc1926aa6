#include <gtest/gtest.h>
#include "archive/layout.hpp"
#include "archive/registry.hpp"

#include <string>

using namespace farstore;

namespace {

struct Point {
  double x{0}, y{0};
};

CompositeKind point_kind(const std::string& tag = "Point") {
  return make_kind<Point>(
      tag,
      [](const Point& p) { return Fields{{"x", Generic::real(p.x)}, {"y", Generic::real(p.y)}}; },
      [](const Fields& f) { return Point{require_real(f, "Point", "x"), require_real(f, "Point", "y")}; });
}

ErrorKind add_error(Registry& r, CompositeKind k) {
  try {
    r.add(std::move(k));
  } catch (const Error& e) {
    return e.kind();
  }
  ADD_FAILURE() << "registration accepted";
  return ErrorKind::Io;
}

} // namespace

TEST(RegistryTest, ClassifiesInPriorityOrder) {
  Registry r;
  r.add(point_kind());
  EXPECT_EQ(r.classify(Point{1, 2}), Category::Composite);
  EXPECT_EQ(r.classify(NdArray::from<int32_t>(Shape{{2}}, {1, 2})), Category::Array);
  EXPECT_EQ(r.classify(Generic::integer(3)), Category::Generic);
  EXPECT_EQ(r.classify(std::string("plain string")), Category::Unsupported);
  EXPECT_EQ(r.classify(Value()), Category::Unsupported);
  EXPECT_EQ(Registry().classify(Point{1, 2}), Category::Unsupported);
}

TEST(RegistryTest, CompositeWinsOverArray) {
  // a kind that claims arrays takes precedence over the array codec
  Registry r;
  r.add(make_kind<NdArray>(
      "Wrapped", [](const NdArray& a) { return Fields{{"a", a}}; },
      [](const Fields& f) { return require_array(f, "Wrapped", "a"); }));
  EXPECT_EQ(r.classify(NdArray::from<double>(Shape{{1}}, {1.0})), Category::Composite);
}

TEST(RegistryTest, FindAndMatch) {
  Registry r;
  r.add(point_kind());
  ASSERT_NE(r.find("Point"), nullptr);
  EXPECT_EQ(r.find("Point")->tag, "Point");
  EXPECT_EQ(r.find("$Point"), nullptr);
  EXPECT_EQ(r.find("Missing"), nullptr);
  EXPECT_EQ(r.match(Point{}), r.find("Point"));
  EXPECT_EQ(r.match(Generic::integer(1)), nullptr);
  EXPECT_EQ(r.kinds().size(), 1u);
}

TEST(RegistryTest, CodecRoundTripThroughErasure) {
  Registry r;
  r.add(point_kind());
  const CompositeKind& k = *r.find("Point");
  Fields f = k.encode(Point{1.5, -2});
  ASSERT_EQ(f.size(), 2u);
  Value back = k.decode(f);
  ASSERT_TRUE(back.is<Point>());
  EXPECT_EQ(back.as<Point>().x, 1.5);
  EXPECT_EQ(back.as<Point>().y, -2.0);
}

TEST(RegistryTest, DuplicateTagIsCollision) {
  Registry r;
  r.add(point_kind());
  EXPECT_EQ(add_error(r, point_kind()), ErrorKind::NameCollision);
}

TEST(RegistryTest, ReservedAndMalformedTagsAreRejected) {
  Registry r;
  EXPECT_EQ(add_error(r, point_kind("ndarray")), ErrorKind::InvalidName);
  EXPECT_EQ(add_error(r, point_kind("BuiltinsWrapper")), ErrorKind::InvalidName);
  EXPECT_EQ(add_error(r, point_kind("")), ErrorKind::InvalidName);
  EXPECT_EQ(add_error(r, point_kind("a/b")), ErrorKind::InvalidName);
  EXPECT_EQ(add_error(r, point_kind("$Point")), ErrorKind::InvalidName);
  CompositeKind incomplete = point_kind();
  incomplete.decode = nullptr;
  EXPECT_EQ(add_error(r, incomplete), ErrorKind::InvalidName);
  EXPECT_TRUE(r.kinds().empty());
}

TEST(RegistryTest, RegistriesAreIndependent) {
  Registry a;
  Registry b;
  a.add(point_kind());
  EXPECT_EQ(b.find("Point"), nullptr);
  b.add(point_kind());
  EXPECT_EQ(a.kinds().size(), 1u);
}

TEST(RequireFieldTest, ReportsTagAndField) {
  Fields f{{"n", Generic::integer(4)}, {"s", Generic::str("x")}, {"a", NdArray::from<float>(Shape{{1}}, {1.f})}};
  EXPECT_EQ(require_real(f, "Rec", "n"), 4.0);
  EXPECT_EQ(require_str(f, "Rec", "s"), "x");
  EXPECT_EQ(require_array(f, "Rec", "a").dtype, DType::F32);

  try {
    require_field(f, "Rec", "missing");
    FAIL() << "missing field accepted";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::MalformedArchive);
    EXPECT_NE(std::string(e.what()).find("Rec: required field 'missing'"), std::string::npos) << e.what();
  }
  try {
    require_str(f, "Rec", "n");
    FAIL() << "int accepted as str";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::MalformedArchive);
    EXPECT_NE(std::string(e.what()).find("Rec.n: expected str, found int"), std::string::npos) << e.what();
  }
  EXPECT_THROW(require_array(f, "Rec", "s"), Error);
  EXPECT_THROW(require_real(f, "Rec", "a"), Error);
  EXPECT_THROW(require_composite<Point>(f, "Rec", "a"), Error);
}

TEST(LayoutTest, NamesAndPaths) {
  EXPECT_TRUE(is_valid_name("signal_1"));
  EXPECT_TRUE(is_valid_name("with space and $ inside"));
  EXPECT_FALSE(is_valid_name(""));
  EXPECT_FALSE(is_valid_name("$x"));
  EXPECT_FALSE(is_valid_name("a/b"));
  EXPECT_EQ(split_path("a/b/$ndarray"), (std::vector<std::string>{"a", "b", "$ndarray"}));
  EXPECT_EQ(split_path("solo"), (std::vector<std::string>{"solo"}));
  EXPECT_EQ(join_path("a", composite_tag("Signal")), "a/$Signal");
  EXPECT_TRUE(is_tag("$ndarray"));
  EXPECT_FALSE(is_tag("ndarray"));
  try {
    check_name("a/b", "object");
    FAIL() << "slash accepted";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::InvalidName);
  }
}

TEST(ValueTest, TypeNamesAreReadable) {
  Value v(Point{});
  EXPECT_NE(v.type_name().find("Point"), std::string::npos);
  EXPECT_EQ(Value().type_name(), "<empty>");
  EXPECT_EQ(Value(Generic::integer(1)).type_name(), "farstore::Generic");
  try {
    v.as<Generic>();
    FAIL() << "wrong cast accepted";
  } catch (const Error& e) {
    EXPECT_EQ(e.kind(), ErrorKind::UnsupportedType);
  }
}
