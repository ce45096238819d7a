#include <rgeo/nearest.hpp>

namespace rgeo {

static inline double square_magnitude(double dlat, double dlon) {
  return dlat * dlat + dlon * dlon;
}

std::optional<std::size_t> closest_coordinate_index(const Coordinate& current,
                                                    const std::vector<Coordinate>& path) {
  if (path.empty()) return std::nullopt;

  std::size_t best = 0;
  double best_d2 = square_magnitude(path[0].lat - current.lat, path[0].lon - current.lon);
  for (std::size_t i = 1; i < path.size(); ++i) {
    const double d2 = square_magnitude(path[i].lat - current.lat, path[i].lon - current.lon);
    if (d2 < best_d2) { best_d2 = d2; best = i; } // strict: earlier index keeps ties
  }
  return best;
}

} // namespace rgeo
