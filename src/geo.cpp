#include <rgeo/geo.hpp>
#include <algorithm>
#include <cmath>

namespace rgeo {

double haversine_m(const Coordinate& a, const Coordinate& b, double radius_m) {
  const double lat1 = a.lat * kDegToRad;
  const double lat2 = b.lat * kDegToRad;
  const double dlat = lat2 - lat1;
  const double dlon = (b.lon - a.lon) * kDegToRad;

  const double s_lat = std::sin(dlat * 0.5);
  const double s_lon = std::sin(dlon * 0.5);
  double h = s_lat * s_lat + std::cos(lat1) * std::cos(lat2) * s_lon * s_lon;
  h = std::clamp(h, 0.0, 1.0); // rounding can push antipodal points past 1

  return 2.0 * radius_m * std::asin(std::sqrt(h));
}

double forward_bearing_deg(const Coordinate& from, const Coordinate& to) {
  const double lat1 = from.lat * kDegToRad;
  const double lat2 = to.lat * kDegToRad;
  const double dlon = (to.lon - from.lon) * kDegToRad;

  const double y = std::sin(dlon) * std::cos(lat2);
  const double x = std::cos(lat1) * std::sin(lat2)
                 - std::sin(lat1) * std::cos(lat2) * std::cos(dlon);

  return std::fmod(std::atan2(y, x) * kRadToDeg + 360.0, 360.0);
}

std::optional<GeoBounds> path_bounds(const std::vector<Coordinate>& path) {
  if (path.empty()) return std::nullopt;
  GeoBounds b{path.front().lat, path.front().lon, path.front().lat, path.front().lon};
  for (const auto& c : path) {
    b.min_lat = std::min(b.min_lat, c.lat);
    b.min_lon = std::min(b.min_lon, c.lon);
    b.max_lat = std::max(b.max_lat, c.lat);
    b.max_lon = std::max(b.max_lon, c.lon);
  }
  return b;
}

} // namespace rgeo
