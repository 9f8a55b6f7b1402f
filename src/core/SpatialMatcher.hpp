#pragma once

#include "models/JamModel.hpp"
#include "models/SectionModel.hpp"
#include <boost/geometry/index/rtree.hpp>
#include <cstddef>
#include <set>
#include <utility>
#include <vector>

// Result of running a single tier over a jam page.
struct TierResult {
  std::vector<JamPerSection> matches;
  std::set<long long> matched;   // jam ids accepted by this tier
  std::set<long long> unmatched; // jam ids still without a section
  std::size_t direction_rejections = 0;
};

// Result of the full three-tier cascade over a jam page.
struct MatchReport {
  std::vector<JamPerSection> pairs; // tier A, then B, then C
  std::size_t containment_pairs = 0;
  std::size_t within_pairs = 0;
  std::size_t intersection_pairs = 0;
  std::size_t direction_rejections = 0;
  std::vector<long long> unmatched; // jam ids accepted by no tier
};

// Tiered spatial join of jams onto reference sections:
//   A  section.thin contains jam.fat
//   B  jam.thin within section.fat
//   C  jam.thin intersects section.thin, and the jam's major direction
//      agrees with the section's street or section direction
// A jam accepted by one tier is not considered by later tiers. Within a tier
// a jam may be accepted against several sections.
class SpatialMatcher {
public:
  // `sections` must outlive the matcher.
  explicit SpatialMatcher(const std::vector<GeoSection> &sections);

  // Runs one tier over the jams whose id is not in `excluded`.
  TierResult run_tier(MatchTier tier, const std::vector<GeoJam> &jams,
                      const std::set<long long> &excluded) const;

  MatchReport match(const std::vector<GeoJam> &jams) const;

  std::size_t section_count() const noexcept { return sections_.size(); }

private:
  using IndexValue = std::pair<Box, std::size_t>;
  using Index =
      boost::geometry::index::rtree<IndexValue,
                                    boost::geometry::index::quadratic<16>>;

  std::vector<std::size_t> candidates(const GeoJam &jam) const;
  bool accepts(MatchTier tier, const GeoJam &jam, const GeoSection &section,
               bool &direction_rejected) const;

  const std::vector<GeoSection> &sections_;
  Index index_;
};
