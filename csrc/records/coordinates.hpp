#pragma once

#include <string>

#include "../archive/registry.hpp"
#include "../runtime/ndarray.hpp"

namespace farstore {

// N points, stored as an (N, 3) float64 array in the given domain.
struct Coordinates {
  NdArray points;
  std::string domain{"cart"};       // cart | sph | cyl
  std::string convention{"right"};
  std::string unit{"met"};
  std::string comment;

  int64_t csize() const { return points.shape.ndim() ? points.shape.dims[0] : 0; }

  bool operator==(const Coordinates& o) const {
    return points == o.points && domain == o.domain && convention == o.convention && unit == o.unit &&
           comment == o.comment;
  }
};

// N rotations as (N, 4) float64 quaternions (x, y, z, w).
struct Orientations {
  NdArray quat;
  std::string comment;

  bool operator==(const Orientations& o) const { return quat == o.quat && comment == o.comment; }
};

CompositeKind coordinates_kind();
CompositeKind orientations_kind();

} // namespace farstore
