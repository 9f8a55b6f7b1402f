#pragma once

#include "models/CoreTypes.hpp"
#include <optional>
#include <string>
#include <vector>

// Congestion event as loaded from the jam table. Timestamps are carried
// verbatim in the store's DATETIME text form ("YYYY-MM-DD HH:MM:SS").
struct JamRow {
  long long id = 0;
  std::string uuid;
  std::string start_time;
  std::string end_time;
  std::vector<GeoPoint> coords; // ordered [lon, lat]

  // Descriptive attributes; absent when the source event omitted them.
  std::optional<std::string> street;
  std::optional<std::string> city;
  std::optional<int> level;
  std::optional<int> delay_s;
  std::optional<double> speed_mps;
  std::optional<double> length_m;
};

// A jam with its derived geometry, ready for matching.
struct GeoJam {
  long long id = 0;
  std::string uuid;
  std::string start_time;
  std::string end_time;
  Polyline line; // planar
  Direction direction;
  BufferShape thin;
  BufferShape fat;
};

// Tier of the matching cascade that accepted a pair.
enum class MatchTier : uint8_t { Containment = 0, Within = 1, Intersection = 2 };

inline const char *MatchTierToString(MatchTier t) {
  switch (t) {
  case MatchTier::Containment:
    return "containment";
  case MatchTier::Within:
    return "within";
  case MatchTier::Intersection:
    return "intersection";
  }
  return "unknown";
}

// Output fact: one row per accepted (jam, section) pair.
struct JamPerSection {
  std::string jam_start_time;
  std::string jam_uuid;
  long long section_id = 0;
  long long jam_id = 0;                     // not persisted
  MatchTier tier = MatchTier::Containment;  // not persisted
};
