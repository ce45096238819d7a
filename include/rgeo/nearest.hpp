#pragma once
#include <cstddef>
#include <optional>
#include <vector>
#include <rgeo/geo.hpp>

namespace rgeo {

// Index of the path vertex nearest to `current`, measured as squared
// difference in raw degrees (planar, not geodesic). First index wins ties.
// Returns nullopt for an empty path.
std::optional<std::size_t> closest_coordinate_index(const Coordinate& current,
                                                    const std::vector<Coordinate>& path);

} // namespace rgeo
