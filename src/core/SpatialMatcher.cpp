// SpatialMatcher runs the containment / within / intersection cascade over
// one page of jams against the fixed section set.

#include "core/SpatialMatcher.hpp"
#include <algorithm>
#include <boost/geometry.hpp>
#include <iostream>
#include <iterator>

namespace bg = boost::geometry;
namespace bgi = boost::geometry::index;

// Envelope covering both buffers of an entity; empty when both are empty.
template <typename T>
static bool combined_envelope(const T &entity, Box &out) {
  bool have = false;
  for (const BufferShape *shape : {&entity.thin, &entity.fat}) {
    if (bg::is_empty(*shape))
      continue;
    Box b;
    bg::envelope(*shape, b);
    if (!have) {
      out = b;
      have = true;
    } else {
      bg::expand(out, b);
    }
  }
  return have;
}

static bool directions_agree(const GeoJam &jam, const GeoSection &section) {
  const auto major = jam.direction.major_direction;
  return major == section.street_direction ||
         major == section.section_direction;
}

SpatialMatcher::SpatialMatcher(const std::vector<GeoSection> &sections)
    : sections_(sections) {
  std::vector<IndexValue> values;
  values.reserve(sections.size());
  for (std::size_t i = 0; i < sections.size(); ++i) {
    Box b;
    if (combined_envelope(sections[i], b))
      values.emplace_back(b, i);
  }
  index_ = Index(values.begin(), values.end()); // bulk-loaded
}

std::vector<std::size_t> SpatialMatcher::candidates(const GeoJam &jam) const {
  std::vector<std::size_t> out;
  Box query;
  if (!combined_envelope(jam, query))
    return out;

  std::vector<IndexValue> hits;
  index_.query(bgi::intersects(query), std::back_inserter(hits));
  out.reserve(hits.size());
  for (const auto &h : hits)
    out.push_back(h.second);
  // Section order, so output does not depend on the tree layout.
  std::sort(out.begin(), out.end());
  return out;
}

bool SpatialMatcher::accepts(MatchTier tier, const GeoJam &jam,
                             const GeoSection &section,
                             bool &direction_rejected) const {
  direction_rejected = false;
  switch (tier) {
  case MatchTier::Containment:
    return bg::within(jam.fat, section.thin);
  case MatchTier::Within:
    return bg::within(jam.thin, section.fat);
  case MatchTier::Intersection:
    if (!bg::intersects(jam.thin, section.thin))
      return false;
    if (!directions_agree(jam, section)) {
      direction_rejected = true;
      return false;
    }
    return true;
  }
  return false;
}

TierResult SpatialMatcher::run_tier(MatchTier tier,
                                    const std::vector<GeoJam> &jams,
                                    const std::set<long long> &excluded) const {
  TierResult out;
  for (const auto &jam : jams) {
    if (excluded.count(jam.id))
      continue;

    bool hit = false;
    for (std::size_t idx : candidates(jam)) {
      const auto &section = sections_[idx];
      bool rejected = false;
      if (accepts(tier, jam, section, rejected)) {
        out.matches.push_back(
            JamPerSection{jam.start_time, jam.uuid, section.id, jam.id, tier});
        hit = true;
      } else if (rejected) {
        ++out.direction_rejections;
      }
    }

    if (hit)
      out.matched.insert(jam.id);
    else
      out.unmatched.insert(jam.id);
  }
  return out;
}

MatchReport SpatialMatcher::match(const std::vector<GeoJam> &jams) const {
  MatchReport report;
  std::set<long long> excluded;
  std::set<long long> unmatched;

  for (MatchTier tier : {MatchTier::Containment, MatchTier::Within,
                         MatchTier::Intersection}) {
    TierResult r = run_tier(tier, jams, excluded);
    excluded.insert(r.matched.begin(), r.matched.end());
    unmatched = std::move(r.unmatched);

    switch (tier) {
    case MatchTier::Containment:
      report.containment_pairs = r.matches.size();
      break;
    case MatchTier::Within:
      report.within_pairs = r.matches.size();
      break;
    case MatchTier::Intersection:
      report.intersection_pairs = r.matches.size();
      break;
    }
    report.direction_rejections += r.direction_rejections;
    report.pairs.insert(report.pairs.end(),
                        std::make_move_iterator(r.matches.begin()),
                        std::make_move_iterator(r.matches.end()));
  }
  report.unmatched.assign(unmatched.begin(), unmatched.end());

  std::cout << "[matcher] " << jams.size() << " jam(s): "
            << report.containment_pairs << " containment, "
            << report.within_pairs << " within, "
            << report.intersection_pairs << " intersection pair(s); "
            << report.direction_rejections << " rejected by direction, "
            << report.unmatched.size() << " jam(s) unmatched\n";
  return report;
}
