#pragma once

#include "core/Errors.hpp"
#include <cmath>
#include <nlohmann/json.hpp>
#include <string>

// Reads `key` into `out` when present; a value of the wrong type is a
// ConfigError. Missing keys keep the caller's default.
template <typename T>
inline void read_config_key(const nlohmann::json &j, const char *key,
                            T &out) {
  if (!j.contains(key))
    return;
  try {
    out = j.at(key).get<T>();
  } catch (const nlohmann::json::exception &e) {
    throw ConfigError(std::string("config key '") + key + "': " + e.what());
  }
}

// Buffer radii (projected units) for both entity kinds, plus buffer
// resolution.
struct MatchParams {
  double section_thin_buffer = 10.0;
  double section_fat_buffer = 20.0;
  double jam_thin_buffer = 10.0;
  double jam_fat_buffer = 20.0;
  int points_per_circle = 16;

  void validate() const {
    auto check = [](const char *name, double r) {
      if (!std::isfinite(r) || r <= 0.0)
        throw ConfigError(std::string("matching.") + name +
                          " must be a positive radius");
    };
    check("section_thin_buffer", section_thin_buffer);
    check("section_fat_buffer", section_fat_buffer);
    check("jam_thin_buffer", jam_thin_buffer);
    check("jam_fat_buffer", jam_fat_buffer);
    if (points_per_circle < 4)
      throw ConfigError("matching.points_per_circle must be at least 4");
  }

  static MatchParams from_json(const nlohmann::json &j) {
    MatchParams p;
    read_config_key(j, "section_thin_buffer", p.section_thin_buffer);
    read_config_key(j, "section_fat_buffer", p.section_fat_buffer);
    read_config_key(j, "jam_thin_buffer", p.jam_thin_buffer);
    read_config_key(j, "jam_fat_buffer", p.jam_fat_buffer);
    read_config_key(j, "points_per_circle", p.points_per_circle);
    p.validate();
    return p;
  }
};

struct ProjectionParams {
  // UTM zone 22 south, WGS84, metres.
  std::string proj4 =
      "+proj=utm +zone=22 +south +ellps=WGS84 +datum=WGS84 +units=m +no_defs";

  static ProjectionParams from_json(const nlohmann::json &j) {
    ProjectionParams p;
    read_config_key(j, "proj4", p.proj4);
    if (p.proj4.empty())
      throw ConfigError("projection.proj4 must not be empty");
    return p;
  }
};

struct BatchParams {
  // Keeps offset + page_size well inside long long.
  static constexpr long long kMaxPageSize = 100000000;

  long long page_size = 20000;
  bool resume = false;

  static BatchParams from_json(const nlohmann::json &j) {
    BatchParams p;
    read_config_key(j, "page_size", p.page_size);
    read_config_key(j, "resume", p.resume);
    if (p.page_size <= 0 || p.page_size > kMaxPageSize)
      throw ConfigError("batch.page_size must be in [1, " +
                        std::to_string(kMaxPageSize) + "]");
    return p;
  }
};

struct DatabaseParams {
  std::string uri = "tcp://127.0.0.1:3306";
  std::string user;
  std::string password;
  std::string schema;

  static DatabaseParams from_json(const nlohmann::json &j) {
    DatabaseParams p;
    read_config_key(j, "uri", p.uri);
    read_config_key(j, "user", p.user);
    read_config_key(j, "password", p.password);
    read_config_key(j, "schema", p.schema);
    return p;
  }
};

// Whole run configuration, normally read from config/settings.json.
struct Settings {
  MatchParams matching;
  ProjectionParams projection;
  BatchParams batch;
  DatabaseParams database;

  static Settings from_json(const nlohmann::json &j) {
    if (!j.is_object())
      throw ConfigError("settings root must be a JSON object");
    auto section = [&j](const char *name) {
      if (!j.contains(name))
        return nlohmann::json::object();
      const auto &s = j.at(name);
      if (!s.is_object())
        throw ConfigError(std::string("settings section '") + name +
                          "' must be an object");
      return s;
    };
    Settings s;
    s.matching = MatchParams::from_json(section("matching"));
    s.projection = ProjectionParams::from_json(section("projection"));
    s.batch = BatchParams::from_json(section("batch"));
    s.database = DatabaseParams::from_json(section("database"));
    return s;
  }
};
