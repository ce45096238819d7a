#include <rgeo/closest_index.hpp>
#include <algorithm>

namespace rgeo {

// Shared by closest_indices_fast() and IndexSweep.
static void sweep_kernel_(const double* table, std::size_t n,
                          const double* inc, std::size_t count, PathIndex* out,
                          PathIndex& index, double& travelled) {
  const PathIndex last = (n == 0) ? 0 : n - 1;
  std::size_t k = 0;
  for (; k < count && index < last; ++k) {
    travelled += inc[k];
    while (index < last && travelled > table[index]) {
      travelled -= table[index];
      ++index;
    }
    out[k] = index;
  }
  // Route finished: every remaining element maps to the last vertex.
  std::fill(out + k, out + count, last);
}

std::vector<PathIndex> closest_indices_reference(const std::vector<double>& increments,
                                                 const std::vector<double>& forward) {
  std::vector<PathIndex> result;
  result.reserve(increments.size());

  const PathIndex last = forward.empty() ? 0 : forward.size() - 1;
  PathIndex current = 0;
  double travelled = 0.0;

  for (double d : increments) {
    travelled += d;
    while (current < last && travelled > forward[current]) {
      travelled -= forward[current];
      ++current;
    }
    result.push_back(current);
  }
  return result;
}

std::vector<PathIndex> closest_indices_fast(const std::vector<double>& increments,
                                            const std::vector<double>& forward) {
  std::vector<PathIndex> result(increments.size());
  PathIndex index = 0;
  double travelled = 0.0;
  sweep_kernel_(forward.data(), forward.size(),
                increments.data(), increments.size(), result.data(),
                index, travelled);
  return result;
}

const char* mapper_name(MapperKind kind) {
  switch (kind) {
    case MapperKind::Reference: return "reference";
    case MapperKind::Fast:      return "fast";
    default: return "unknown";
  }
}

std::vector<PathIndex> closest_indices_with(MapperKind kind,
                                            const std::vector<double>& increments,
                                            const std::vector<double>& forward) {
  if (kind == MapperKind::Reference) return closest_indices_reference(increments, forward);
  return closest_indices_fast(increments, forward);
}

std::vector<PathIndex> IndexSweep::advance(const std::vector<double>& increments) {
  std::vector<PathIndex> out(increments.size());
  advance(increments.data(), increments.size(), out.data());
  return out;
}

void IndexSweep::advance(const double* increments, std::size_t count, PathIndex* out) {
  sweep_kernel_(table_.data(), table_.size(), increments, count, out, index_, travelled_);
}

} // namespace rgeo
