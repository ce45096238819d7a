#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <rgeo/geo.hpp>
#include <rgeo/path_model.hpp>

namespace rgeo {

enum class RoutePreset : int {
  Stadium = 0,
  HillLoop = 1,
  Count
};

// Local planar offset in meters (x east, y north).
struct Vec2 {
  double x{};
  double y{};
};

// Equirectangular projection of a local offset around `origin`.
// Good to well under a meter over a few kilometers.
Coordinate offset_coordinate(const Coordinate& origin, const Vec2& offset_m,
                             double radius_m = kEarthRadiusM);

// Rounded-rectangle "stadium" loop centered at `center`.
// straight_m: length of each straight (centerline)
// radius_m: corner radius (centerline)
// The first vertex is not repeated at the end; the closing segment is implied.
std::vector<Coordinate> stadium_loop(const Coordinate& center, double straight_m, double radius_m,
                                     int arc_pts_per_quadrant = 12);

// Smooth closed loop through control coordinates using a uniform Catmull-Rom spline.
// - ctrl: control polygon, treated as closed by wrapping
// - samples_per_seg: vertices generated between each pair of control points
// Fewer than 3 control points -> empty.
std::vector<Coordinate> closed_catmull_rom(const std::vector<Coordinate>& ctrl,
                                           int samples_per_seg = 24);

// Repeat one lap `laps` times. num_unique_coords is set to lap.size().
// Returns nullopt for an empty lap, zero laps, or mismatched elevations.
std::optional<RouteData> tile_laps(const std::vector<Coordinate>& lap,
                                   const std::vector<double>& lap_elevations,
                                   double time_zone_s,
                                   std::size_t laps);

const char* preset_name(RoutePreset p);

// Case-insensitive lookup by preset_name().
std::optional<RoutePreset> preset_by_name(const std::string& name);

// Built-in route with a synthetic elevation profile; laps < 1 is treated as 1.
RouteData make_preset(RoutePreset p, std::size_t laps = 1);

} // namespace rgeo
