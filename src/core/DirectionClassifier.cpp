#include "core/DirectionClassifier.hpp"
#include <cmath>

Direction DirectionClassifier::from_displacement(double dx, double dy) {
  Direction d;
  d.lat_direction = dy >= 0 ? LatDirection::North : LatDirection::South;
  d.lon_direction = dx >= 0 ? LonDirection::East : LonDirection::West;
  d.major_direction = std::fabs(dy) > std::fabs(dx) ? MajorDirection::NorthSouth
                                                    : MajorDirection::EastWest;
  return d;
}

std::optional<Direction>
DirectionClassifier::classify(const std::vector<GeoPoint> &coords) {
  if (coords.size() < 2)
    return std::nullopt;
  const auto &first = coords.front();
  const auto &last = coords.back();
  return from_displacement(last.lon - first.lon, last.lat - first.lat);
}

std::optional<Direction> DirectionClassifier::classify(const Polyline &line) {
  if (line.size() < 2)
    return std::nullopt;
  const auto &first = line.front();
  const auto &last = line.back();
  return from_displacement(last.x() - first.x(), last.y() - first.y());
}

MajorDirection DirectionClassifier::classify_extent(const Box &box) {
  const double width = box.max_corner().x() - box.min_corner().x();
  const double height = box.max_corner().y() - box.min_corner().y();
  return height >= width ? MajorDirection::NorthSouth
                         : MajorDirection::EastWest;
}
