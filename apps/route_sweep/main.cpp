#include <chrono>
#include <exception>
#include <string>
#include <vector>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include <rgeo/closest_index.hpp>
#include <rgeo/drive.hpp>
#include <rgeo/path_model.hpp>
#include <rgeo/route_presets.hpp>

using namespace rgeo;

namespace {

constexpr double kSpeedMps = 25.0;
constexpr double kTickS = 1.0;
constexpr std::size_t kTicksPerBatch = 600; // ten simulated minutes

template <class F>
double time_ms(F&& f) {
  using clock = std::chrono::steady_clock;
  const auto t0 = clock::now();
  f();
  return std::chrono::duration<double, std::milli>(clock::now() - t0).count();
}

} // namespace

// route_sweep [preset] [laps]
int main(int argc, char** argv) {
  namespace logging = boost::log;
  logging::core::get()->set_filter(logging::trivial::severity >= logging::trivial::info);

  RoutePreset preset = RoutePreset::Stadium;
  std::size_t laps = 3;
  if (argc > 1) {
    const auto p = preset_by_name(argv[1]);
    if (!p) {
      BOOST_LOG_TRIVIAL(error) << "Unknown preset '" << argv[1] << "' (expected stadium or hill_loop)";
      return 2;
    }
    preset = *p;
  }
  if (argc > 2) {
    try {
      laps = std::stoul(argv[2]);
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Invalid lap count '" << argv[2] << "': " << e.what();
      return 2;
    }
    if (laps == 0 || laps > 1000) {
      BOOST_LOG_TRIVIAL(error) << "Lap count must be in [1, 1000], got " << argv[2];
      return 2;
    }
  }

  std::vector<PathIndex> driven;
  std::vector<double> query;
  try {
    const PathModel model{make_preset(preset, laps)};
    BOOST_LOG_TRIVIAL(info) << "Route " << preset_name(preset) << ": " << model.size()
                            << " vertices, lap " << model.lap_length() << " m";

    RouteDrive drive(model);
    const std::vector<double> speeds(kTicksPerBatch, kSpeedMps);
    while (!drive.finished()) {
      const auto samples = drive.step(speeds, kTickS);
      for (const auto& s : samples) driven.push_back(s.index);
      query.insert(query.end(), kTicksPerBatch, kSpeedMps * kTickS);

      const auto& last = samples.back();
      BOOST_LOG_TRIVIAL(info) << "tick " << drive.ticks() << ": vertex " << last.index
                              << ", lap " << drive.laps_completed()
                              << ", gradient " << last.gradient;
    }

    std::vector<PathIndex> ref, fast;
    const double ref_ms = time_ms([&] {
      ref = closest_indices_with(MapperKind::Reference, query, model.forward_distances());
    });
    const double fast_ms = time_ms([&] {
      fast = closest_indices_with(MapperKind::Fast, query, model.forward_distances());
    });
    BOOST_LOG_TRIVIAL(info) << query.size() << " ticks: " << mapper_name(MapperKind::Reference)
                            << " " << ref_ms << " ms, " << mapper_name(MapperKind::Fast)
                            << " " << fast_ms << " ms";

    if (ref != fast || ref != driven) {
      BOOST_LOG_TRIVIAL(error) << "Index mappers disagree";
      return 1;
    }
  } catch (const ConfigurationError& e) {
    BOOST_LOG_TRIVIAL(error) << "Bad route: " << e.what();
    return 2;
  }

  BOOST_LOG_TRIVIAL(info) << "Index mappers agree";
  return 0;
}
