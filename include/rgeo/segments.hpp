#pragma once
#include <cstddef>
#include <optional>
#include <vector>
#include <rgeo/geo.hpp>

namespace rgeo {

// Segment lengths with wraparound: out[i] = distance(path[i-1], path[i]),
// out[0] = distance(path[N-1], path[0]) closes the loop.
// Empty path -> empty table; single vertex -> {0}.
std::vector<double> path_distances(const std::vector<Coordinate>& path,
                                   double radius_m = kEarthRadiusM);

// Closing orientation -> forward orientation:
// forward[i] = distance(path[i], path[i+1 mod N]) = closing[(i+1) mod N].
std::vector<double> forward_distances(const std::vector<double>& closing);

// Length of one lap: path_distances over the first num_unique_coords vertices,
// treated as a closed loop, summed. num_unique_coords is clamped to path size.
double lap_length(const std::vector<Coordinate>& path,
                  std::size_t num_unique_coords,
                  double radius_m = kEarthRadiusM);

// Road gradient per segment, aligned with path_distances():
// (elev[i] - elev[i-1 wrapped]) / dist[i]; > 0 uphill, < 0 downhill.
// Non-finite results (zero-length segments) become 0.
// Returns nullopt if the inputs differ in length.
std::optional<std::vector<double>> path_gradients(const std::vector<double>& elevations,
                                                  const std::vector<double>& distances);

} // namespace rgeo
