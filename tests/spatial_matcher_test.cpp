#include "TestFixtures.hpp"
#include "core/CoordinateProjector.hpp"
#include "core/SpatialMatcher.hpp"
#include <gtest/gtest.h>

namespace {

class SpatialMatcherTest : public ::testing::Test {
protected:
  CoordinateProjector proj{ProjectionParams().proj4};
  MatchParams params = tight_jam_params();
  GeometryBuilder builder{proj, params};

  const PlanarPoint origin{670000.0, 7185000.0};
  PlanarPoint at(double dx, double dy) const {
    return PlanarPoint(origin.x() + dx, origin.y() + dy);
  }
  GeoJam jam(long long id, std::initializer_list<PlanarPoint> pts) const {
    return make_planar_jam(builder, params, id, Polyline(pts));
  }

  // S1 runs North/South and S2 East/West; they cross at the origin.
  std::vector<GeoSection> crossing_streets() const {
    return builder.build_sections(
        {make_section_row(1, "Rua Norte", at(0, -100), at(0, 0), at(0, 100)),
         make_section_row(2, "Rua Leste", at(-100, 0), at(0, 0), at(100, 0))});
  }
};

TEST_F(SpatialMatcherTest, EndToEndScenario) {
  auto sections = crossing_streets();
  SpatialMatcher matcher(sections);

  // J1 nested deep inside S1's thin corridor.
  GeoJam j1 = jam(1, {at(2, 40), at(2, 80)});
  // J2 runs alongside S2, 8 m off its axis: its fat buffer spills out of
  // S2's thin corridor, its thin buffer stays inside S2's fat one.
  GeoJam j2 = jam(2, {at(40, 8), at(80, 8)});
  // J3 heads North through the crossing and beyond S1's end.
  GeoJam j3 = jam(3, {at(5, -30), at(5, 150)});

  MatchReport report = matcher.match({j1, j2, j3});

  ASSERT_EQ(report.pairs.size(), 3u);
  EXPECT_EQ(report.pairs[0].jam_uuid, "jam-1");
  EXPECT_EQ(report.pairs[0].section_id, 1);
  EXPECT_EQ(report.pairs[0].tier, MatchTier::Containment);

  EXPECT_EQ(report.pairs[1].jam_uuid, "jam-2");
  EXPECT_EQ(report.pairs[1].section_id, 2);
  EXPECT_EQ(report.pairs[1].tier, MatchTier::Within);

  EXPECT_EQ(report.pairs[2].jam_uuid, "jam-3");
  EXPECT_EQ(report.pairs[2].section_id, 1);
  EXPECT_EQ(report.pairs[2].tier, MatchTier::Intersection);

  EXPECT_EQ(report.containment_pairs, 1u);
  EXPECT_EQ(report.within_pairs, 1u);
  EXPECT_EQ(report.intersection_pairs, 1u);
  EXPECT_EQ(report.direction_rejections, 1u); // J3 against S2
  EXPECT_TRUE(report.unmatched.empty());
}

TEST_F(SpatialMatcherTest, PairsCarryJamStartTime) {
  auto sections = crossing_streets();
  SpatialMatcher matcher(sections);
  GeoJam j = jam(1, {at(2, 40), at(2, 80)});
  j.start_time = "2019-05-02 17:45:00";
  auto report = matcher.match({j});
  ASSERT_EQ(report.pairs.size(), 1u);
  EXPECT_EQ(report.pairs[0].jam_start_time, "2019-05-02 17:45:00");
  EXPECT_EQ(report.pairs[0].jam_id, 1);
}

TEST_F(SpatialMatcherTest, PerpendicularJamRejectedByDirection) {
  auto sections = builder.build_sections(
      {make_section_row(1, "Rua Norte", at(0, -100), at(0, 0), at(0, 100))});
  SpatialMatcher matcher(sections);
  GeoJam cross = jam(9, {at(-50, 0), at(50, 0)});
  ASSERT_EQ(cross.direction.major_direction, MajorDirection::EastWest);

  // The thin buffers do overlap.
  TierResult c = matcher.run_tier(MatchTier::Intersection, {cross}, {});
  EXPECT_TRUE(c.matches.empty());
  EXPECT_EQ(c.direction_rejections, 1u);

  MatchReport report = matcher.match({cross});
  EXPECT_TRUE(report.pairs.empty());
  ASSERT_EQ(report.unmatched.size(), 1u);
  EXPECT_EQ(report.unmatched[0], 9);
}

TEST_F(SpatialMatcherTest, SectionDirectionAlsoSatisfiesFilter) {
  // Street runs East/West overall but this block is locally North/South.
  auto sections = builder.build_sections(
      {make_section_row(1, "Av Sete", at(0, 0), at(1, 50), at(2, 100)),
       make_section_row(2, "Av Sete", at(300, 0), at(301, 50), at(302, 100)),
       make_section_row(3, "Av Sete", at(600, 0), at(601, 50), at(602, 100))});
  ASSERT_EQ(sections[0].street_direction, MajorDirection::EastWest);
  SpatialMatcher matcher(sections);

  // North/South jam grazing block 1 and running past its end.
  GeoJam j = jam(4, {at(9, 20), at(9, 180)});
  auto report = matcher.match({j});
  ASSERT_EQ(report.pairs.size(), 1u);
  EXPECT_EQ(report.pairs[0].section_id, 1);
  EXPECT_EQ(report.pairs[0].tier, MatchTier::Intersection);
}

TEST_F(SpatialMatcherTest, NorthSouthJamAcceptedOnDiagonalSection) {
  // A 45 degree section has a square extent, which classifies North/South.
  auto sections = builder.build_sections(
      {make_section_row(1, "Diagonal", at(0, 0), at(50, 50), at(100, 100))});
  SpatialMatcher matcher(sections);
  GeoJam j = jam(3, {at(50, 20), at(50, 80)});
  ASSERT_EQ(j.direction.major_direction, MajorDirection::NorthSouth);

  auto report = matcher.match({j});
  ASSERT_EQ(report.pairs.size(), 1u);
  EXPECT_EQ(report.pairs[0].section_id, 1);
  EXPECT_EQ(report.pairs[0].tier, MatchTier::Intersection);
  EXPECT_EQ(report.direction_rejections, 0u);
  EXPECT_TRUE(report.unmatched.empty());

  // An East/West jam over the same spot is still rejected.
  GeoJam across = jam(4, {at(20, 50), at(80, 50)});
  auto rejected = matcher.match({across});
  EXPECT_TRUE(rejected.pairs.empty());
  EXPECT_EQ(rejected.direction_rejections, 1u);
}

TEST_F(SpatialMatcherTest, JamAcceptedEarlierIsNotReconsidered) {
  auto sections = crossing_streets();
  SpatialMatcher matcher(sections);
  GeoJam j1 = jam(1, {at(2, 40), at(2, 80)});

  TierResult a = matcher.run_tier(MatchTier::Containment, {j1}, {});
  ASSERT_EQ(a.matched.count(1), 1u);

  // On its own J1 would also pass tier B and tier C against S1.
  EXPECT_EQ(matcher.run_tier(MatchTier::Within, {j1}, {}).matches.size(), 1u);
  EXPECT_EQ(
      matcher.run_tier(MatchTier::Intersection, {j1}, {}).matches.size(), 1u);

  // Excluded, it is neither a candidate nor reported as unmatched.
  TierResult b = matcher.run_tier(MatchTier::Within, {j1}, a.matched);
  TierResult c = matcher.run_tier(MatchTier::Intersection, {j1}, a.matched);
  EXPECT_TRUE(b.matches.empty());
  EXPECT_TRUE(b.unmatched.empty());
  EXPECT_TRUE(c.matches.empty());
  EXPECT_TRUE(c.unmatched.empty());

  auto report = matcher.match({j1});
  ASSERT_EQ(report.pairs.size(), 1u);
  EXPECT_EQ(report.pairs[0].tier, MatchTier::Containment);
}

TEST_F(SpatialMatcherTest, OneJamMayMatchSeveralSectionsInOneTier) {
  // Two consecutive blocks of the same street; the jam straddles the joint.
  auto sections = builder.build_sections(
      {make_section_row(1, "Rua Norte", at(0, 0), at(0, 50), at(0, 100)),
       make_section_row(2, "Rua Norte", at(0, 100), at(0, 150), at(0, 200))});
  SpatialMatcher matcher(sections);
  GeoJam j = jam(5, {at(1, 90), at(1, 110)});

  auto report = matcher.match({j});
  ASSERT_EQ(report.pairs.size(), 2u);
  EXPECT_EQ(report.pairs[0].section_id, 1);
  EXPECT_EQ(report.pairs[1].section_id, 2);
  EXPECT_EQ(report.pairs[0].tier, MatchTier::Within);
  EXPECT_EQ(report.pairs[1].tier, MatchTier::Within);
  EXPECT_EQ(report.within_pairs, 2u);
}

TEST_F(SpatialMatcherTest, FarAwayJamIsUnmatched) {
  auto sections = crossing_streets();
  SpatialMatcher matcher(sections);
  auto report = matcher.match({jam(6, {at(5000, 5000), at(5000, 5100)})});
  EXPECT_TRUE(report.pairs.empty());
  ASSERT_EQ(report.unmatched.size(), 1u);
  EXPECT_EQ(report.unmatched[0], 6);
}

TEST_F(SpatialMatcherTest, EmptyInputs) {
  std::vector<GeoSection> none;
  SpatialMatcher empty_sections(none);
  auto r1 = empty_sections.match({jam(1, {at(0, 0), at(0, 10)})});
  EXPECT_TRUE(r1.pairs.empty());
  EXPECT_EQ(r1.unmatched.size(), 1u);

  auto sections = crossing_streets();
  SpatialMatcher matcher(sections);
  auto r2 = matcher.match({});
  EXPECT_TRUE(r2.pairs.empty());
  EXPECT_TRUE(r2.unmatched.empty());
}

TEST_F(SpatialMatcherTest, DefaultRadiiFallThroughToWithin) {
  // With the default radii a jam's fat buffer (20) is never inside a
  // section's thin one (10), so a well aligned jam lands in tier B.
  MatchParams defaults;
  GeometryBuilder b(proj, defaults);
  auto sections = b.build_sections(
      {make_section_row(1, "Rua Norte", at(0, -100), at(0, 0), at(0, 100))});
  SpatialMatcher matcher(sections);
  GeoJam j = make_planar_jam(b, defaults, 1, Polyline{at(0, -20), at(0, 20)});
  auto report = matcher.match({j});
  ASSERT_EQ(report.pairs.size(), 1u);
  EXPECT_EQ(report.pairs[0].tier, MatchTier::Within);
}

} // namespace
