#include <rgeo/drive.hpp>
#include <cmath>

namespace rgeo {

std::vector<RouteSample> RouteDrive::step(const std::vector<double>& speeds_mps, double dt_sec) {
  const std::size_t n = speeds_mps.size();
  std::vector<double> increments(n, 0.0);
  if (dt_sec > 0.0) {
    for (std::size_t i = 0; i < n; ++i) {
      if (speeds_mps[i] > 0.0) increments[i] = speeds_mps[i] * dt_sec; // meters advanced
    }
  }

  const std::vector<PathIndex> indices = sweep_.advance(increments);
  for (double d : increments) distance_m_ += d;
  ticks_ += n;

  const auto& path = model_->path();
  const auto& gradients = model_->gradients();
  const auto& time_zones = model_->time_zones();

  std::vector<RouteSample> out;
  out.reserve(n);
  for (PathIndex i : indices) {
    out.push_back(RouteSample{i, path[i], gradients[i], time_zones[i]});
  }
  return out;
}

std::uint64_t RouteDrive::laps_completed() const {
  const double lap = model_->lap_length();
  if (lap <= 0.0) return 0;
  return static_cast<std::uint64_t>(std::floor(distance_m_ / lap));
}

} // namespace rgeo
