#pragma once
#include <numbers>
#include <optional>
#include <vector>

namespace rgeo {

// Constant naming convention (kCamelCase)
inline constexpr double kPI        = std::numbers::pi_v<double>;
inline constexpr double kDegToRad  = kPI / 180.0;
inline constexpr double kRadToDeg  = 180.0 / kPI;
inline constexpr double kEarthRadiusM = 6'371'000.0; // mean radius, spherical model

// Geographic position in degrees.
struct Coordinate {
  double lat{};
  double lon{};

  bool operator==(const Coordinate&) const = default;
};

struct GeoBounds {
  double min_lat{};
  double min_lon{};
  double max_lat{};
  double max_lon{};
};

// Great-circle distance (meters) on a sphere of the given radius.
double haversine_m(const Coordinate& a, const Coordinate& b, double radius_m = kEarthRadiusM);

// Initial bearing from -> to, degrees in [0, 360). 0 = north, 90 = east.
double forward_bearing_deg(const Coordinate& from, const Coordinate& to);

// Axis-aligned bounding box in degrees; nullopt for an empty path.
std::optional<GeoBounds> path_bounds(const std::vector<Coordinate>& path);

} // namespace rgeo
