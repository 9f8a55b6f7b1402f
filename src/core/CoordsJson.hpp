#pragma once
#include "models/CoreTypes.hpp"
#include <string>
#include <vector>

// Parses a jam coordinate column. Accepts [{"x": lon, "y": lat}, ...] and
// [[lon, lat], ...]. Unparsable text, or any entry that is neither form,
// yields an empty sequence so the jam is excluded as a whole.
std::vector<GeoPoint> parse_coords_json(const std::string &coords_json);
