// GeometryBuilder derives buffers, bounding boxes and directions for the
// reference sections (once per run) and for each page of jams.

#include "core/GeometryBuilder.hpp"
#include "core/DirectionClassifier.hpp"
#include <boost/geometry.hpp>
#include <cmath>
#include <iostream>
#include <unordered_map>

namespace bg = boost::geometry;

static bool finite_point(const PlanarPoint &p) {
  return std::isfinite(p.x()) && std::isfinite(p.y());
}

BufferShape GeometryBuilder::buffer(const Polyline &line,
                                    double radius) const {
  namespace bs = bg::strategy::buffer;
  bs::distance_symmetric<double> distance(radius);
  bs::side_straight side;
  bs::join_round join(params_.points_per_circle);
  bs::end_round end(params_.points_per_circle);
  bs::point_circle circle(params_.points_per_circle);

  BufferShape out;
  if (line.empty())
    return out;

  Polyline clean = line;
  bg::unique(clean); // repeated vertices removed before buffering
  if (clean.size() < 2) {
    bg::model::multi_point<PlanarPoint> single;
    single.push_back(clean.front());
    bg::buffer(single, out, distance, side, join, end, circle);
  } else {
    bg::buffer(clean, out, distance, side, join, end, circle);
  }
  return out;
}

std::vector<GeoSection>
GeometryBuilder::build_sections(const std::vector<SectionRow> &rows) const {
  std::vector<GeoSection> out;
  out.reserve(rows.size());
  std::size_t dropped = 0;

  for (const auto &row : rows) {
    if (!finite_point(row.start) || !finite_point(row.middle) ||
        !finite_point(row.end)) {
      ++dropped;
      continue;
    }
    GeoSection s;
    s.id = row.id;
    s.street_name = row.street_name;
    s.line = Polyline{row.start, row.middle, row.end};
    bg::envelope(s.line, s.bbox);
    s.section_direction = DirectionClassifier::classify_extent(s.bbox);
    out.push_back(std::move(s));
  }

  // Corridor orientation: aggregate extent of every section on the street.
  std::unordered_map<std::string, Box> street_extent;
  for (const auto &s : out) {
    auto it = street_extent.find(s.street_name);
    if (it == street_extent.end())
      street_extent.emplace(s.street_name, s.bbox);
    else
      bg::expand(it->second, s.bbox);
  }

  for (auto &s : out) {
    s.street_direction =
        DirectionClassifier::classify_extent(street_extent.at(s.street_name));
    s.thin = buffer(s.line, params_.section_thin_buffer);
    s.fat = buffer(s.line, params_.section_fat_buffer);
    s.display_line = projector_.to_geographic(s.line);
  }

  if (dropped > 0)
    std::cout << "[geometry] dropped " << dropped
              << " section(s) with non-finite coordinates\n";
  return out;
}

std::vector<GeoJam>
GeometryBuilder::build_jams(const std::vector<JamRow> &rows) const {
  std::vector<GeoJam> out;
  out.reserve(rows.size());
  std::size_t dropped = 0;

  for (const auto &row : rows) {
    auto direction = DirectionClassifier::classify(row.coords);
    if (!direction) {
      ++dropped;
      continue;
    }
    GeoJam j;
    j.id = row.id;
    j.uuid = row.uuid;
    j.start_time = row.start_time;
    j.end_time = row.end_time;
    j.line = projector_.to_planar(row.coords);
    j.direction = *direction;
    j.thin = buffer(j.line, params_.jam_thin_buffer);
    j.fat = buffer(j.line, params_.jam_fat_buffer);
    out.push_back(std::move(j));
  }

  if (dropped > 0)
    std::cout << "[geometry] dropped " << dropped
              << " jam(s) with fewer than two usable points\n";
  return out;
}
