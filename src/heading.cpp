#include <rgeo/heading.hpp>

namespace rgeo {

std::vector<double> heading_array(const std::vector<Coordinate>& path) {
  std::vector<double> out(path.size(), 0.0);
  if (path.size() < 2) return out;

  for (std::size_t i = 0; i + 1 < path.size(); ++i) {
    out[i] = forward_bearing_deg(path[i], path[i + 1]);
  }
  out[out.size() - 1] = out[out.size() - 2];
  return out;
}

} // namespace rgeo
