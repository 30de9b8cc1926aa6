#include "coordinates.hpp"

namespace farstore {

static void check_rows(const std::string& tag, const std::string& field, const NdArray& a, int64_t width) {
  if (a.dtype != DType::F64 || a.shape.ndim() != 2 || a.shape.dims[1] != width)
    FARSTORE_THROW(MalformedArchive, tag + "." + field + ": expected float64 (N, " + std::to_string(width) +
                   "), found " + dtype_name(a.dtype) + " " + a.shape.str());
}

static Fields encode_coordinates(const Coordinates& c) {
  return {
    {"points", c.points},
    {"domain", Generic::str(c.domain)},
    {"convention", Generic::str(c.convention)},
    {"unit", Generic::str(c.unit)},
    {"comment", Generic::str(c.comment)},
  };
}

static Coordinates decode_coordinates(const Fields& f) {
  Coordinates c;
  c.points = require_array(f, "Coordinates", "points");
  check_rows("Coordinates", "points", c.points, 3);
  c.domain = require_str(f, "Coordinates", "domain");
  if (c.domain != "cart" && c.domain != "sph" && c.domain != "cyl")
    FARSTORE_THROW(MalformedArchive, "Coordinates.domain: unknown domain '" + c.domain + "'");
  c.convention = require_str(f, "Coordinates", "convention");
  c.unit = require_str(f, "Coordinates", "unit");
  c.comment = require_str(f, "Coordinates", "comment");
  return c;
}

static Fields encode_orientations(const Orientations& o) {
  return {
    {"quat", o.quat},
    {"comment", Generic::str(o.comment)},
  };
}

static Orientations decode_orientations(const Fields& f) {
  Orientations o;
  o.quat = require_array(f, "Orientations", "quat");
  check_rows("Orientations", "quat", o.quat, 4);
  o.comment = require_str(f, "Orientations", "comment");
  return o;
}

CompositeKind coordinates_kind() {
  return make_kind<Coordinates>("Coordinates", encode_coordinates, decode_coordinates);
}

CompositeKind orientations_kind() {
  return make_kind<Orientations>("Orientations", encode_orientations, decode_orientations);
}

} // namespace farstore
