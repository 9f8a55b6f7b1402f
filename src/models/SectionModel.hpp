#pragma once

#include "models/CoreTypes.hpp"
#include <string>
#include <vector>

// Reference street section as stored: three characteristic planar points.
struct SectionRow {
  long long id = 0;
  std::string street_name;
  PlanarPoint start{0.0, 0.0};
  PlanarPoint middle{0.0, 0.0};
  PlanarPoint end{0.0, 0.0};
  double length_m = 0.0;
};

// A section with its derived geometry, ready for matching.
struct GeoSection {
  long long id = 0;
  std::string street_name;
  Polyline line;  // start, middle, end (planar)
  Box bbox;       // envelope of the three points
  // Axis only; extents carry no heading.
  MajorDirection street_direction = MajorDirection::NorthSouth; // whole street
  MajorDirection section_direction = MajorDirection::NorthSouth; // own points
  BufferShape thin;
  BufferShape fat;
  std::vector<GeoPoint> display_line; // line in lon/lat for map display
};
