#pragma once

#include "core/CoordinateProjector.hpp"
#include "models/JamModel.hpp"
#include "models/SectionModel.hpp"
#include "models/params.hpp"
#include <vector>

// Turns raw section and jam rows into matchable geometry: thin and fat
// buffers around each polyline plus direction classifications.
class GeometryBuilder {
public:
  GeometryBuilder(const CoordinateProjector &projector, const MatchParams &p)
      : projector_(projector), params_(p) {}

  // Sections with a non-finite coordinate are dropped. street_direction is
  // computed over the surviving sections that share a street name.
  std::vector<GeoSection>
  build_sections(const std::vector<SectionRow> &rows) const;

  // Jams with fewer than two points have no direction and are dropped.
  // Throws InvalidCoordinate if a point cannot be projected.
  std::vector<GeoJam> build_jams(const std::vector<JamRow> &rows) const;

  // Dilates a planar polyline by `radius` with round joins and ends. A
  // zero-length line is buffered as a single point (a disc).
  BufferShape buffer(const Polyline &line, double radius) const;

private:
  const CoordinateProjector &projector_;
  MatchParams params_;
};
