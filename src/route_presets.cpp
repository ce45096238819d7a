#include <rgeo/route_presets.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>

namespace rgeo {

// Heartland Motorsports Park, Topeka KS (central daylight time).
static constexpr Coordinate kPresetCenter{39.0081, -95.6786};
static constexpr double kPresetTimeZoneS = -5.0 * 3600.0;
static constexpr double kPresetBaseElevationM = 300.0;

Coordinate offset_coordinate(const Coordinate& origin, const Vec2& offset_m, double radius_m) {
  const double dlat = offset_m.y / radius_m;
  const double dlon = offset_m.x / (radius_m * std::cos(origin.lat * kDegToRad));
  return Coordinate{origin.lat + dlat * kRadToDeg, origin.lon + dlon * kRadToDeg};
}

std::vector<Coordinate> stadium_loop(const Coordinate& center, double straight_m, double radius_m,
                                     int arc_pts_per_quadrant) {
  std::vector<Coordinate> pts;
  if (arc_pts_per_quadrant < 1 || radius_m <= 0.0 || straight_m < 0.0) return pts;

  const double R = radius_m;
  const double L = straight_m * 0.5;

  auto arc = [&](double cx, double a0, double a1, int steps) {
    for (int i = 0; i <= steps; ++i) {
      const double a = a0 + (a1 - a0) * (double(i) / double(steps));
      pts.push_back(offset_coordinate(center, Vec2{cx + R * std::cos(a), R * std::sin(a)}));
    }
  };

  // Right arc (center +L,0) from the bottom (L,-R) up to (L,+R); the top
  // straight is the segment to the first left-arc vertex.
  arc(+L, -kPI / 2.0, +kPI / 2.0, arc_pts_per_quadrant * 2);
  // Left arc (center -L,0) from (-L,+R) down to (-L,-R); the bottom straight
  // is the closing segment back to the first vertex.
  arc(-L, +kPI / 2.0, 3.0 * kPI / 2.0, arc_pts_per_quadrant * 2);
  return pts;
}

// Inverse of offset_coordinate().
static Vec2 local_offset_(const Coordinate& origin, const Coordinate& c, double radius_m) {
  return Vec2{(c.lon - origin.lon) * kDegToRad * radius_m * std::cos(origin.lat * kDegToRad),
              (c.lat - origin.lat) * kDegToRad * radius_m};
}

// Point on the uniform Catmull-Rom span from b to c at u in [0, 1].
static Vec2 spline_point_(const Vec2& a, const Vec2& b, const Vec2& c, const Vec2& d, double u) {
  const double u2 = u * u;
  const double u3 = u2 * u;
  // Hermite form with tangents (c - a) / 2 and (d - b) / 2
  const double h00 = 2.0 * u3 - 3.0 * u2 + 1.0;
  const double h10 = u3 - 2.0 * u2 + u;
  const double h01 = -2.0 * u3 + 3.0 * u2;
  const double h11 = u3 - u2;
  return Vec2{h00 * b.x + h10 * 0.5 * (c.x - a.x) + h01 * c.x + h11 * 0.5 * (d.x - b.x),
              h00 * b.y + h10 * 0.5 * (c.y - a.y) + h01 * c.y + h11 * 0.5 * (d.y - b.y)};
}

std::vector<Coordinate> closed_catmull_rom(const std::vector<Coordinate>& ctrl, int samples_per_seg) {
  std::vector<Coordinate> pts;
  const std::size_t n = ctrl.size();
  if (n < 3 || samples_per_seg < 1) return pts;

  // Spline in meters around the first control point, then project back.
  const Coordinate& origin = ctrl.front();
  std::vector<Vec2> local;
  local.reserve(n);
  for (const auto& c : ctrl) local.push_back(local_offset_(origin, c, kEarthRadiusM));

  const auto steps = static_cast<std::size_t>(samples_per_seg);
  pts.reserve(n * steps);
  for (std::size_t i = 0; i < n; ++i) {
    const Vec2& a = local[(i + n - 1) % n];
    const Vec2& b = local[i];
    const Vec2& c = local[(i + 1) % n];
    const Vec2& d = local[(i + 2) % n];
    pts.push_back(ctrl[i]); // spans start exactly on their control point
    for (std::size_t s = 1; s < steps; ++s) {
      const double u = static_cast<double>(s) / static_cast<double>(steps);
      pts.push_back(offset_coordinate(origin, spline_point_(a, b, c, d, u)));
    }
  }
  return pts;
}

std::optional<RouteData> tile_laps(const std::vector<Coordinate>& lap,
                                   const std::vector<double>& lap_elevations,
                                   double time_zone_s,
                                   std::size_t laps) {
  if (lap.empty() || laps == 0) return std::nullopt;
  if (lap_elevations.size() != lap.size()) return std::nullopt;

  RouteData out;
  out.num_unique_coords = lap.size();
  out.path.reserve(lap.size() * laps);
  out.elevations.reserve(lap.size() * laps);
  for (std::size_t k = 0; k < laps; ++k) {
    out.path.insert(out.path.end(), lap.begin(), lap.end());
    out.elevations.insert(out.elevations.end(), lap_elevations.begin(), lap_elevations.end());
  }
  out.time_zones.assign(out.path.size(), time_zone_s);
  return out;
}

const char* preset_name(RoutePreset p) {
  switch (p) {
    case RoutePreset::Stadium:  return "stadium";
    case RoutePreset::HillLoop: return "hill_loop";
    default: return "unknown";
  }
}

static inline std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

std::optional<RoutePreset> preset_by_name(const std::string& name) {
  const auto key = lower(name);
  for (int i = 0; i < static_cast<int>(RoutePreset::Count); ++i) {
    const auto p = static_cast<RoutePreset>(i);
    if (key == preset_name(p)) return p;
  }
  return std::nullopt;
}

RouteData make_preset(RoutePreset p, std::size_t laps) {
  laps = std::max<std::size_t>(laps, 1);

  std::vector<Coordinate> lap;
  std::vector<double> elev;

  switch (p) {
    case RoutePreset::HillLoop: {
      // Compact GP-like shape: right side -> chicane -> top straight -> hairpin -> return
      std::vector<Coordinate> ctrl;
      auto add = [&](double x, double y) { ctrl.push_back(offset_coordinate(kPresetCenter, Vec2{x, y})); };
      add( 600, -240); add( 600,  240);
      add( 160,  320); add( -40,  240);
      add(-160,  120); add(-480,  120);
      add(-640,    0); add(-600, -240);
      add(-480, -400); add(-240, -440);
      add( 160, -360); add( 480, -320);
      lap = closed_catmull_rom(ctrl, 20);

      // One 40 m climb and descent per lap
      const std::size_t n = lap.size();
      elev.resize(n);
      for (std::size_t i = 0; i < n; ++i) {
        const double t = double(i) / double(n);
        elev[i] = kPresetBaseElevationM + 20.0 * (1.0 - std::cos(2.0 * kPI * t));
      }
      break;
    }

    case RoutePreset::Stadium:
    default:
      lap = stadium_loop(kPresetCenter, /*straight_m*/ 1000.0, /*radius_m*/ 320.0, /*arc detail*/ 14);
      elev.assign(lap.size(), kPresetBaseElevationM);
      break;
  }

  // Both inputs are non-empty and aligned by construction.
  return *tile_laps(lap, elev, kPresetTimeZoneS, laps);
}

} // namespace rgeo
