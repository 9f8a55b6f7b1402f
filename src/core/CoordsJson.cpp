#include "core/CoordsJson.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

static bool read_number(const json &v, double &out) {
  if (!v.is_number())
    return false;
  out = v.get<double>();
  return true;
}

std::vector<GeoPoint> parse_coords_json(const std::string &coords_json) {
  std::vector<GeoPoint> out;
  if (coords_json.empty())
    return out;
  json arr = json::parse(coords_json, /*cb=*/nullptr,
                         /*allow_exceptions=*/false);
  if (!arr.is_array())
    return out;

  out.reserve(arr.size());
  for (const auto &v : arr) {
    GeoPoint p{0.0, 0.0};
    bool ok = false;
    if (v.is_object() && v.contains("x") && v.contains("y"))
      ok = read_number(v.at("x"), p.lon) && read_number(v.at("y"), p.lat);
    else if (v.is_array() && v.size() >= 2)
      ok = read_number(v[0], p.lon) && read_number(v[1], p.lat);
    if (!ok)
      return {};
    out.push_back(p);
  }
  return out;
}
