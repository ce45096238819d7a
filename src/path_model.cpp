#include <rgeo/path_model.hpp>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>
#include <boost/log/trivial.hpp>
#include <rgeo/heading.hpp>
#include <rgeo/nearest.hpp>
#include <rgeo/segments.hpp>

namespace rgeo {

template <class T>
static std::vector<T> gather_(const std::vector<T>& src,
                              const std::vector<PathIndex>& indices,
                              const char* what) {
  std::vector<T> out;
  out.reserve(indices.size());
  for (PathIndex i : indices) {
    if (i >= src.size()) {
      throw std::out_of_range{std::string{what} + ": index " + std::to_string(i)
                              + " outside route of " + std::to_string(src.size()) + " vertices"};
    }
    out.push_back(src[i]);
  }
  return out;
}

void PathModel::validate_(const RouteData& route, const std::optional<Coordinate>& current) {
  const std::size_t n = route.path.size();
  if (n < 2) {
    throw ConfigurationError{"Route requires at least 2 coordinates, got " + std::to_string(n)};
  }
  for (const auto& c : route.path) {
    if (!std::isfinite(c.lat) || !std::isfinite(c.lon)) {
      throw ConfigurationError{"Route contains a non-finite coordinate"};
    }
  }
  if (route.elevations.size() != n) {
    throw ConfigurationError{"Elevation profile has " + std::to_string(route.elevations.size())
                             + " entries for " + std::to_string(n) + " coordinates"};
  }
  if (route.time_zones.size() != n) {
    throw ConfigurationError{"Time zone profile has " + std::to_string(route.time_zones.size())
                             + " entries for " + std::to_string(n) + " coordinates"};
  }
  if (route.num_unique_coords == 0 || route.num_unique_coords > n) {
    throw ConfigurationError{"num_unique_coords must be in [1, " + std::to_string(n) + "], got "
                             + std::to_string(route.num_unique_coords)};
  }
  if (current.has_value() && (!std::isfinite(current->lat) || !std::isfinite(current->lon))) {
    throw ConfigurationError{"Current position is not a finite coordinate"};
  }
}

PathModel::PathModel(RouteData route, std::optional<Coordinate> current, PathOptions options)
  : options_(options) {
  validate_(route, current);

  num_unique_coords_ = route.num_unique_coords;
  launch_point_ = route.path.front();
  // Lap length always comes from the full route.
  lap_length_ = rgeo::lap_length(route.path, num_unique_coords_, options_.earth_radius_m);

  path_ = std::move(route.path);
  elevations_ = std::move(route.elevations);
  time_zones_ = std::move(route.time_zones);

  if (current.has_value() && !(*current == launch_point_)) {
    const std::size_t idx = closest_coordinate_index(*current, path_).value_or(0);
    BOOST_LOG_TRIVIAL(warning) << "Current position (" << current->lat << ", " << current->lon
                               << ") is not the route origin; route starts at vertex " << idx;
    if (path_.size() - idx < 2) {
      throw ConfigurationError{"Current position is at the route end; fewer than 2 vertices remain"};
    }
    const auto cut = static_cast<std::ptrdiff_t>(idx);
    path_.erase(path_.begin(), path_.begin() + cut);
    elevations_.erase(elevations_.begin(), elevations_.begin() + cut);
    time_zones_.erase(time_zones_.begin(), time_zones_.begin() + cut);
    start_offset_ = idx;
  }

  distances_ = path_distances(path_, options_.earth_radius_m);
  forward_ = rgeo::forward_distances(distances_);
  // Sizes match by construction.
  gradients_ = path_gradients(elevations_, distances_).value_or(std::vector<double>(path_.size(), 0.0));

  BOOST_LOG_TRIVIAL(debug) << "PathModel: " << path_.size() << " vertices, lap "
                           << lap_length_ << " m, offset " << start_offset_;
}

std::vector<double> PathModel::time_zones_at(const std::vector<PathIndex>& indices) const {
  return gather_(time_zones_, indices, "time_zones_at");
}

std::vector<double> PathModel::gradients_at(const std::vector<PathIndex>& indices) const {
  return gather_(gradients_, indices, "gradients_at");
}

std::vector<double> PathModel::elevations_at(const std::vector<PathIndex>& indices) const {
  return gather_(elevations_, indices, "elevations_at");
}

std::vector<Coordinate> PathModel::coordinates_at(const std::vector<PathIndex>& indices) const {
  return gather_(path_, indices, "coordinates_at");
}

std::vector<double> PathModel::heading_array() const {
  return rgeo::heading_array(path_);
}

GeoBounds PathModel::bounds() const {
  // path_ holds at least 2 vertices.
  return *path_bounds(path_);
}

std::vector<PathIndex> PathModel::closest_indices(const std::vector<double>& increments) const {
  return closest_indices_fast(increments, forward_);
}

} // namespace rgeo
