#pragma once

#include <boost/geometry/geometries/box.hpp>
#include <boost/geometry/geometries/linestring.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>
#include <boost/geometry/geometries/point_xy.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <cstdint>

// Geographic coordinate in decimal degrees (WGS84).
struct GeoPoint {
  double lon;
  double lat;
};

// Planar geometry in projected (metric) units.
using PlanarPoint = boost::geometry::model::d2::point_xy<double>;
using Polyline = boost::geometry::model::linestring<PlanarPoint>;
using Polygon = boost::geometry::model::polygon<PlanarPoint>;
using BufferShape = boost::geometry::model::multi_polygon<Polygon>;
using Box = boost::geometry::model::box<PlanarPoint>;

// Coarse cardinal orientation of a polyline.
enum class MajorDirection : uint8_t { EastWest, NorthSouth };
enum class LatDirection : uint8_t { North, South };
enum class LonDirection : uint8_t { East, West };

struct Direction {
  LonDirection lon_direction = LonDirection::East;
  LatDirection lat_direction = LatDirection::North;
  MajorDirection major_direction = MajorDirection::EastWest;
};

inline bool operator==(const Direction &a, const Direction &b) {
  return a.lon_direction == b.lon_direction &&
         a.lat_direction == b.lat_direction &&
         a.major_direction == b.major_direction;
}

inline const char *MajorDirectionToString(MajorDirection d) {
  switch (d) {
  case MajorDirection::NorthSouth:
    return "North/South";
  case MajorDirection::EastWest:
    return "East/West";
  }
  return "unknown";
}

inline const char *LatDirectionToString(LatDirection d) {
  return d == LatDirection::North ? "North" : "South";
}

inline const char *LonDirectionToString(LonDirection d) {
  return d == LonDirection::East ? "East" : "West";
}
