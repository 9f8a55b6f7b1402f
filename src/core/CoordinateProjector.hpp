#pragma once

#include "models/CoreTypes.hpp"
#include <boost/geometry/srs/projection.hpp>
#include <string>
#include <vector>

// Converts between geographic lon/lat and one fixed planar projection.
// Built once per run from configuration and shared by every caller.
class CoordinateProjector {
public:
  explicit CoordinateProjector(const std::string &proj4);

  // Throws InvalidCoordinate on non-finite or out-of-domain input.
  PlanarPoint to_planar(double lon, double lat) const;
  GeoPoint to_geographic(double x, double y) const;

  Polyline to_planar(const std::vector<GeoPoint> &coords) const;
  std::vector<GeoPoint> to_geographic(const Polyline &line) const;

  const std::string &definition() const noexcept { return definition_; }

private:
  std::string definition_;
  boost::geometry::srs::projection<> proj_;
};
