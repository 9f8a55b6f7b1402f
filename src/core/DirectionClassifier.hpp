#pragma once

#include "models/CoreTypes.hpp"
#include <optional>
#include <vector>

// Derives coarse cardinal orientation from net displacement. Only the first
// and last points of a sequence matter.
class DirectionClassifier {
public:
  // North when dy >= 0, East when dx >= 0; North/South only when
  // |dy| > |dx| (ties resolve to East/West).
  static Direction from_displacement(double dx, double dy);

  // std::nullopt for fewer than two points.
  static std::optional<Direction>
  classify(const std::vector<GeoPoint> &coords);
  static std::optional<Direction> classify(const Polyline &line);

  // Major axis of an extent. A box has no heading, so only the axis is
  // reported: North/South when height >= width (a square or a point
  // resolves to North/South).
  static MajorDirection classify_extent(const Box &box);
};
