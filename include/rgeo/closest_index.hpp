#pragma once
#include <cstddef>
#include <utility>
#include <vector>

namespace rgeo {

// Position on a route, in [0, N-1].
using PathIndex = std::size_t;

// Maps distance increments onto route vertices.
//
// `increments[k]` is the distance travelled since element k-1 (non-negative;
// unchecked). `forward[i]` is the distance from vertex i to vertex i+1.
// result[k] is the vertex reached after travelling increments[0..k] from the
// route start. One sweep, O(M + N): the running remainder is carried across
// elements and never reset. Once the sweep reaches vertex N-1 it stays there.
//
// An empty or single-entry table always yields index 0.
//
// Both implementations return identical sequences for every input.
std::vector<PathIndex> closest_indices_reference(const std::vector<double>& increments,
                                                 const std::vector<double>& forward);

// Preallocated output, pointer walk, and a bulk fill once saturated.
std::vector<PathIndex> closest_indices_fast(const std::vector<double>& increments,
                                            const std::vector<double>& forward);

inline std::vector<PathIndex> closest_indices(const std::vector<double>& increments,
                                              const std::vector<double>& forward) {
  return closest_indices_fast(increments, forward);
}

enum class MapperKind : int {
  Reference = 0,
  Fast = 1,
  Count
};

const char* mapper_name(MapperKind kind);

std::vector<PathIndex> closest_indices_with(MapperKind kind,
                                            const std::vector<double>& increments,
                                            const std::vector<double>& forward);

// The same sweep kept alive across tick-batches. Feeding a query through any
// sequence of advance() calls yields exactly the indices of one
// closest_indices() call over the concatenated query.
class IndexSweep {
public:
  IndexSweep() = default;
  explicit IndexSweep(std::vector<double> forward) : table_(std::move(forward)) {}

  std::vector<PathIndex> advance(const std::vector<double>& increments);

  // Writes `count` indices to `out`.
  void advance(const double* increments, std::size_t count, PathIndex* out);

  PathIndex current_index() const { return index_; }
  // Distance past the current vertex. Frozen once finished().
  double segment_progress_m() const { return travelled_; }
  bool finished() const { return index_ >= last_index(); }
  std::size_t size() const { return table_.size(); }
  const std::vector<double>& table() const { return table_; }

  void reset() { index_ = 0; travelled_ = 0.0; }

private:
  PathIndex last_index() const { return table_.empty() ? 0 : table_.size() - 1; }

  std::vector<double> table_;
  PathIndex index_{0};
  double travelled_{0.0};
};

} // namespace rgeo
