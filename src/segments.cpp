#include <rgeo/segments.hpp>
#include <algorithm>
#include <cmath>

namespace rgeo {

std::vector<double> path_distances(const std::vector<Coordinate>& path, double radius_m) {
  const std::size_t n = path.size();
  std::vector<double> out(n, 0.0);
  for (std::size_t i = 0; i < n; ++i) {
    const std::size_t prev = (i == 0) ? n - 1 : i - 1;
    out[i] = haversine_m(path[prev], path[i], radius_m);
  }
  return out;
}

std::vector<double> forward_distances(const std::vector<double>& closing) {
  std::vector<double> out(closing.size(), 0.0);
  if (closing.empty()) return out;
  std::rotate_copy(closing.begin(), closing.begin() + 1, closing.end(), out.begin());
  return out;
}

double lap_length(const std::vector<Coordinate>& path,
                  std::size_t num_unique_coords,
                  double radius_m) {
  const std::size_t n = std::min(num_unique_coords, path.size());
  const std::vector<Coordinate> lap(path.begin(), path.begin() + static_cast<std::ptrdiff_t>(n));
  double sum = 0.0;
  for (double d : path_distances(lap, radius_m)) sum += d;
  return sum;
}

std::optional<std::vector<double>> path_gradients(const std::vector<double>& elevations,
                                                  const std::vector<double>& distances) {
  if (elevations.size() != distances.size()) return std::nullopt;

  const std::size_t n = elevations.size();
  std::vector<double> out(n, 0.0);
  for (std::size_t i = 0; i < n; ++i) {
    const std::size_t prev = (i == 0) ? n - 1 : i - 1;
    const double g = (elevations[i] - elevations[prev]) / distances[i];
    out[i] = std::isfinite(g) ? g : 0.0;
  }
  return out;
}

} // namespace rgeo
