#pragma once
#include <vector>
#include <rgeo/geo.hpp>

namespace rgeo {

// Forward bearing (degrees, [0, 360)) from each vertex to the next.
// No bearing exists past the last vertex, so the last entry repeats the one
// before it. Single vertex -> {0}; empty path -> {}.
std::vector<double> heading_array(const std::vector<Coordinate>& path);

} // namespace rgeo
