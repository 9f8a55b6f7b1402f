#pragma once

#include <stdexcept>
#include <string>

// Coordinate outside the projection's domain, or a failed transform.
class InvalidCoordinate : public std::runtime_error {
public:
  explicit InvalidCoordinate(const std::string &what)
      : std::runtime_error(what) {}
};

// Malformed or out-of-range configuration.
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string &what) : std::runtime_error(what) {}
};

// Read or write failure in the jam/section store.
class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string &what) : std::runtime_error(what) {}
};
