#include <catch2/catch.hpp>
#include <cmath>
#include <vector>

#include <rgeo/path_model.hpp>
#include <rgeo/route_presets.hpp>
#include <rgeo/segments.hpp>

using Catch::Detail::Approx;
using namespace rgeo;

static double loop_length(const std::vector<Coordinate>& pts) {
  double sum = 0.0;
  for (double d : path_distances(pts)) sum += d;
  return sum;
}

TEST_CASE("offset_coordinate projects local meters") {
  const Coordinate origin{39.0, -95.6};

  const auto north = offset_coordinate(origin, Vec2{0.0, 1000.0});
  REQUIRE(north.lon == origin.lon);
  REQUIRE(haversine_m(origin, north) == Approx(1000.0));

  const auto east = offset_coordinate(origin, Vec2{1000.0, 0.0});
  REQUIRE(east.lat == origin.lat);
  REQUIRE(haversine_m(origin, east) == Approx(1000.0).epsilon(1e-6));
}

TEST_CASE("stadium_loop builds an open rounded rectangle") {
  const Coordinate c{39.0, -95.6};
  const auto pts = stadium_loop(c, 1000.0, 320.0, 14);
  REQUIRE(pts.size() == 2u * (2u * 14u + 1u));

  // Perimeter: two straights and one full circle
  REQUIRE(loop_length(pts) == Approx(2.0 * 1000.0 + 2.0 * kPI * 320.0).epsilon(0.005));

  // No repeated vertices, including across the implied closing segment
  for (double d : path_distances(pts)) REQUIRE(d > 1.0);

  SECTION("invalid dimensions give an empty loop") {
    REQUIRE(stadium_loop(c, 1000.0, 0.0).empty());
    REQUIRE(stadium_loop(c, -1.0, 100.0).empty());
    REQUIRE(stadium_loop(c, 100.0, 100.0, 0).empty());
  }
}

TEST_CASE("closed_catmull_rom passes through its control points") {
  const std::vector<Coordinate> ctrl{{0.0, 0.0}, {0.0, 0.01}, {0.01, 0.01}, {0.01, 0.0}};
  const auto pts = closed_catmull_rom(ctrl, 5);
  REQUIRE(pts.size() == 20);
  for (std::size_t i = 0; i < ctrl.size(); ++i) {
    REQUIRE(pts[i * 5].lat == Approx(ctrl[i].lat).margin(1e-12));
    REQUIRE(pts[i * 5].lon == Approx(ctrl[i].lon).margin(1e-12));
  }

  REQUIRE(closed_catmull_rom({{0.0, 0.0}, {1.0, 1.0}}).empty());
  REQUIRE(closed_catmull_rom(ctrl, 0).empty());
}

TEST_CASE("closed_catmull_rom rounds a square in metres") {
  const Coordinate center{39.0, -95.6};
  std::vector<Coordinate> ctrl;
  for (const Vec2 v : {Vec2{500.0, -500.0}, Vec2{500.0, 500.0}, Vec2{-500.0, 500.0}, Vec2{-500.0, -500.0}}) {
    ctrl.push_back(offset_coordinate(center, v));
  }
  const auto pts = closed_catmull_rom(ctrl, 16);
  REQUIRE(pts.size() == 64);

  // Corners sit ~707 m out; mid-span samples bulge to ~625 m
  for (const auto& p : pts) {
    const double r = haversine_m(center, p);
    REQUIRE(r > 610.0);
    REQUIRE(r < 712.0);
  }
  REQUIRE(haversine_m(center, pts[8]) == Approx(625.0).epsilon(0.002));
}

TEST_CASE("tile_laps repeats one lap") {
  const std::vector<Coordinate> lap{{0.0, 0.0}, {0.0, 0.01}, {0.01, 0.01}};
  const std::vector<double> elev{1.0, 2.0, 3.0};

  const auto r = tile_laps(lap, elev, -18000.0, 4);
  REQUIRE(r.has_value());
  REQUIRE(r->path.size() == 12);
  REQUIRE(r->elevations.size() == 12);
  REQUIRE(r->time_zones.size() == 12);
  REQUIRE(r->num_unique_coords == 3);
  REQUIRE(r->path[3] == lap[0]);
  REQUIRE(r->path[11] == lap[2]);
  REQUIRE(r->elevations[7] == 2.0);
  for (double tz : r->time_zones) REQUIRE(tz == -18000.0);

  REQUIRE_FALSE(tile_laps(lap, elev, 0.0, 0).has_value());
  REQUIRE_FALSE(tile_laps({}, {}, 0.0, 2).has_value());
  REQUIRE_FALSE(tile_laps(lap, {1.0}, 0.0, 2).has_value());
}

TEST_CASE("preset lookup by name") {
  REQUIRE(preset_by_name("stadium") == RoutePreset::Stadium);
  REQUIRE(preset_by_name("Stadium") == RoutePreset::Stadium);
  REQUIRE(preset_by_name("HILL_LOOP") == RoutePreset::HillLoop);
  REQUIRE_FALSE(preset_by_name("monza").has_value());
  REQUIRE_FALSE(preset_by_name("").has_value());
}

TEST_CASE("make_preset builds valid routes") {
  SECTION("stadium, three laps") {
    const PathModel m{make_preset(RoutePreset::Stadium, 3)};
    REQUIRE(m.num_unique_coords() == 58);
    REQUIRE(m.size() == 3 * 58);
    REQUIRE(m.lap_length() == Approx(2.0 * 1000.0 + 2.0 * kPI * 320.0).epsilon(0.005));
    for (double g : m.gradients()) REQUIRE(g == 0.0); // flat
  }

  SECTION("hill loop climbs and descends") {
    const PathModel m{make_preset(RoutePreset::HillLoop, 2)};
    REQUIRE(m.size() == 2 * m.num_unique_coords());
    bool up = false, down = false;
    for (double g : m.gradients()) {
      REQUIRE(std::isfinite(g));
      up = up || g > 0.0;
      down = down || g < 0.0;
    }
    REQUIRE(up);
    REQUIRE(down);
  }

  SECTION("zero laps is treated as one") {
    const auto r = make_preset(RoutePreset::Stadium, 0);
    REQUIRE(r.path.size() == r.num_unique_coords);
  }
}
