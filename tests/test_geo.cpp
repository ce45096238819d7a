#include <catch2/catch.hpp>
#include <vector>

#include <rgeo/geo.hpp>

using Catch::Detail::Approx;
using namespace rgeo;

// One degree of arc on the default sphere.
static const double kDegreeM = kEarthRadiusM * kPI / 180.0;

TEST_CASE("haversine_m measures great-circle distance") {
  SECTION("one degree along the equator") {
    REQUIRE(haversine_m({0.0, 0.0}, {0.0, 1.0}) == Approx(kDegreeM));
  }

  SECTION("one degree along a meridian") {
    REQUIRE(haversine_m({10.0, 20.0}, {11.0, 20.0}) == Approx(kDegreeM));
  }

  SECTION("same point is zero") {
    REQUIRE(haversine_m({39.0, -95.6}, {39.0, -95.6}) == 0.0);
  }

  SECTION("symmetric") {
    const Coordinate a{39.0081, -95.6786};
    const Coordinate b{39.0120, -95.6701};
    REQUIRE(haversine_m(a, b) == Approx(haversine_m(b, a)));
  }

  SECTION("radius scales linearly") {
    REQUIRE(haversine_m({0.0, 0.0}, {0.0, 90.0}, 1.0) == Approx(kPI / 2.0));
  }

  SECTION("antipodal points stay finite") {
    REQUIRE(haversine_m({0.0, 0.0}, {0.0, 180.0}, 1.0) == Approx(kPI));
  }
}

TEST_CASE("forward_bearing_deg follows compass convention") {
  REQUIRE(forward_bearing_deg({0.0, 0.0}, {0.0, 1.0})  == Approx(90.0));
  REQUIRE(forward_bearing_deg({0.0, 0.0}, {1.0, 0.0})  == Approx(0.0).margin(1e-9));
  REQUIRE(forward_bearing_deg({0.0, 0.0}, {0.0, -1.0}) == Approx(270.0));
  REQUIRE(forward_bearing_deg({0.0, 0.0}, {-1.0, 0.0}) == Approx(180.0));
}

TEST_CASE("forward_bearing_deg stays in [0, 360)") {
  const std::vector<Coordinate> pts{
    {0.0, 0.0}, {0.5, 0.5}, {-0.5, 0.7}, {-0.2, -0.9}, {45.0, 170.0}, {44.0, -170.0}
  };
  for (const auto& a : pts) {
    for (const auto& b : pts) {
      if (a == b) continue;
      const double deg = forward_bearing_deg(a, b);
      REQUIRE(deg >= 0.0);
      REQUIRE(deg < 360.0);
    }
  }
}

TEST_CASE("path_bounds returns min/max per component") {
  REQUIRE_FALSE(path_bounds({}).has_value());

  const auto b = path_bounds({{1.0, -3.0}, {-2.0, 4.0}, {0.5, 0.0}});
  REQUIRE(b.has_value());
  REQUIRE(b->min_lat == -2.0);
  REQUIRE(b->max_lat == 1.0);
  REQUIRE(b->min_lon == -3.0);
  REQUIRE(b->max_lon == 4.0);
}
