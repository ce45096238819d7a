#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include <rgeo/closest_index.hpp>
#include <rgeo/path_model.hpp>

namespace rgeo {

// Environment at the vehicle's route position for one tick.
struct RouteSample {
  PathIndex index{};
  Coordinate coord{};
  double gradient{};
  double time_zone{};
};

// Drives a vehicle along a PathModel in tick-batches.
// The model must outlive the drive.
class RouteDrive {
public:
  explicit RouteDrive(const PathModel& model) : model_(&model), sweep_(model.sweep()) {}

  // One sample per entry of `speeds_mps`, each tick lasting dt_sec.
  // Non-positive speeds or dt advance nothing.
  std::vector<RouteSample> step(const std::vector<double>& speeds_mps, double dt_sec);

  double distance_m() const { return distance_m_; }
  std::uint64_t ticks() const { return ticks_; }
  std::uint64_t laps_completed() const;
  PathIndex current_index() const { return sweep_.current_index(); }
  bool finished() const { return sweep_.finished(); }

private:
  const PathModel* model_;
  IndexSweep sweep_;
  double distance_m_{0.0};
  std::uint64_t ticks_{0};
};

} // namespace rgeo
