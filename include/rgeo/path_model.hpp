#pragma once
#include <cstddef>
#include <optional>
#include <vector>
#include <rgeo/geo.hpp>
#include <rgeo/closest_index.hpp>
#include <rgeo/errors.hpp>

namespace rgeo {

// Raw route arrays, index-aligned.
struct RouteData {
  std::vector<Coordinate> path;
  std::vector<double> elevations;      // meters
  std::vector<double> time_zones;      // UTC offset, seconds
  std::size_t num_unique_coords = 0;   // vertices in one lap of a tiled route
};

struct PathOptions {
  double earth_radius_m = kEarthRadiusM;
};

// Immutable route geometry. Everything is derived once in the constructor;
// accessors are pure lookups.
class PathModel {
public:
  // Throws ConfigurationError if the route is shorter than 2 vertices, holds a
  // non-finite coordinate, has mismatched array lengths, or num_unique_coords
  // is outside [1, path.size()], or if `current` is given but not finite.
  //
  // If `current` is given and differs from the first vertex, the route is cut
  // to start at the vertex nearest to it. lap_length() is unaffected.
  explicit PathModel(RouteData route,
                     std::optional<Coordinate> current = std::nullopt,
                     PathOptions options = {});

  const std::vector<Coordinate>& path() const { return path_; }
  const std::vector<double>& elevations() const { return elevations_; }
  const std::vector<double>& time_zones() const { return time_zones_; }
  // Closing orientation: distances()[i] runs from vertex i-1 (wrapped) to i.
  const std::vector<double>& distances() const { return distances_; }
  // Forward orientation: forward_distances()[i] runs from vertex i to i+1.
  const std::vector<double>& forward_distances() const { return forward_; }
  const std::vector<double>& gradients() const { return gradients_; }

  double lap_length() const { return lap_length_; }
  std::size_t num_unique_coords() const { return num_unique_coords_; }
  std::size_t size() const { return path_.size(); }
  const Coordinate& launch_point() const { return launch_point_; }
  std::size_t start_offset() const { return start_offset_; }
  bool truncated() const { return start_offset_ > 0; }
  const PathOptions& options() const { return options_; }

  // Gather by index; throws std::out_of_range for an index >= size().
  std::vector<double> time_zones_at(const std::vector<PathIndex>& indices) const;
  std::vector<double> gradients_at(const std::vector<PathIndex>& indices) const;
  std::vector<double> elevations_at(const std::vector<PathIndex>& indices) const;
  std::vector<Coordinate> coordinates_at(const std::vector<PathIndex>& indices) const;

  std::vector<double> heading_array() const;
  GeoBounds bounds() const;

  // Distance increments -> vertex indices over forward_distances().
  std::vector<PathIndex> closest_indices(const std::vector<double>& increments) const;
  IndexSweep sweep() const { return IndexSweep{forward_}; }

private:
  static void validate_(const RouteData& route, const std::optional<Coordinate>& current);

  PathOptions options_;
  std::vector<Coordinate> path_;
  std::vector<double> elevations_;
  std::vector<double> time_zones_;
  std::vector<double> distances_;
  std::vector<double> forward_;
  std::vector<double> gradients_;
  std::size_t num_unique_coords_{0};
  double lap_length_{0.0};
  Coordinate launch_point_{};
  std::size_t start_offset_{0};
};

} // namespace rgeo
