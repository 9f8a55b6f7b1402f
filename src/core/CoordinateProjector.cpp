// CoordinateProjector wraps a dynamic Boost.Geometry projection built from a
// proj4 definition string.

#include "core/CoordinateProjector.hpp"
#include "core/Errors.hpp"
#include <boost/geometry/core/cs.hpp>
#include <boost/geometry/geometries/point.hpp>
#include <boost/geometry/srs/projections/exception.hpp>
#include <cmath>
#include <sstream>

namespace bg = boost::geometry;

using LonLat = bg::model::point<double, 2, bg::cs::geographic<bg::degree>>;

static bg::srs::projection<> make_projection(const std::string &proj4) {
  try {
    return bg::srs::projection<>(bg::srs::proj4(proj4));
  } catch (const std::exception &e) {
    // projection_exception, or bad_str_cast from a malformed parameter
    throw ConfigError("invalid projection '" + proj4 + "': " + e.what());
  }
}

static std::string describe(const char *what, double a, double b) {
  std::ostringstream os;
  os.precision(12);
  os << what << " (" << a << ", " << b << ")";
  return os.str();
}

CoordinateProjector::CoordinateProjector(const std::string &proj4)
    : definition_(proj4), proj_(make_projection(proj4)) {}

PlanarPoint CoordinateProjector::to_planar(double lon, double lat) const {
  if (!std::isfinite(lon) || !std::isfinite(lat) || lat < -90.0 ||
      lat > 90.0 || lon < -180.0 || lon > 180.0)
    throw InvalidCoordinate(describe("lon/lat out of domain", lon, lat));

  LonLat ll(lon, lat);
  PlanarPoint xy;
  bool ok = false;
  try {
    ok = proj_.forward(ll, xy);
  } catch (const bg::projection_exception &e) {
    throw InvalidCoordinate(describe("forward projection failed", lon, lat) +
                            ": " + e.what());
  }
  if (!ok || !std::isfinite(xy.x()) || !std::isfinite(xy.y()))
    throw InvalidCoordinate(describe("forward projection failed", lon, lat));
  return xy;
}

GeoPoint CoordinateProjector::to_geographic(double x, double y) const {
  if (!std::isfinite(x) || !std::isfinite(y))
    throw InvalidCoordinate(describe("non-finite planar point", x, y));

  PlanarPoint xy(x, y);
  LonLat ll;
  bool ok = false;
  try {
    ok = proj_.inverse(xy, ll);
  } catch (const bg::projection_exception &e) {
    throw InvalidCoordinate(describe("inverse projection failed", x, y) +
                            ": " + e.what());
  }
  const double lon = bg::get<0>(ll);
  const double lat = bg::get<1>(ll);
  if (!ok || !std::isfinite(lon) || !std::isfinite(lat))
    throw InvalidCoordinate(describe("inverse projection failed", x, y));
  return GeoPoint{lon, lat};
}

Polyline
CoordinateProjector::to_planar(const std::vector<GeoPoint> &coords) const {
  Polyline out;
  out.reserve(coords.size());
  for (const auto &c : coords)
    out.push_back(to_planar(c.lon, c.lat));
  return out;
}

std::vector<GeoPoint>
CoordinateProjector::to_geographic(const Polyline &line) const {
  std::vector<GeoPoint> out;
  out.reserve(line.size());
  for (const auto &p : line)
    out.push_back(to_geographic(p.x(), p.y()));
  return out;
}
