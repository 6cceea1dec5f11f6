#include <pitwall/podium.hpp>
#include <algorithm>
#include <pitwall/errors.hpp>

namespace pitwall {

const PositionDistribution* PositionTable::find(const std::string& entity_id) const {
  auto it = std::lower_bound(entities.begin(), entities.end(), entity_id,
                             [](const PositionDistribution& d, const std::string& id) {
                               return d.entity_id < id;
                             });
  if (it == entities.end() || it->entity_id != entity_id) return nullptr;
  return &*it;
}

PositionTable predict_positions(const Ensemble& ensemble) {
  if (ensemble.empty()) {
    throw InvalidConfigurationError("podium prediction needs at least one run");
  }

  const auto& first = ensemble.front().laps;
  const std::size_t positions = first.size();

  PositionTable table;
  table.runs = ensemble.size();
  table.entities.reserve(positions);
  for (const auto& [id, points] : first) {
    PositionDistribution d;
    d.entity_id = id;
    d.counts.assign(positions, 0);
    table.entities.push_back(std::move(d));
  }

  for (const auto& run : ensemble) {
    if (run.laps.size() != positions) {
      throw InvalidConfigurationError("ensemble runs disagree on roster size");
    }
    std::size_t k = 0;
    for (const auto& [id, points] : run.laps) {
      auto& d = table.entities[k++];
      if (id != d.entity_id) throw InvalidConfigurationError("ensemble runs disagree on roster", id);
      const int pos = points.empty() ? 0 : points.back().position;
      if (pos < 1 || static_cast<std::size_t>(pos) > positions) {
        throw InvalidConfigurationError("finishing position out of range", id, pos);
      }
      ++d.counts[static_cast<std::size_t>(pos - 1)];
    }
  }

  const double n = static_cast<double>(table.runs);
  for (auto& d : table.entities) {
    d.probability.resize(positions);
    double mean = 0.0;
    for (std::size_t p = 0; p < positions; ++p) {
      d.probability[p] = static_cast<double>(d.counts[p]) / n;
      mean += static_cast<double>(p + 1) * d.probability[p];
    }
    d.win_probability = d.probability.empty() ? 0.0 : d.probability[0];
    const std::size_t podium = std::min<std::size_t>(3, positions);
    std::size_t podium_count = 0;
    for (std::size_t p = 0; p < podium; ++p) podium_count += d.counts[p];
    d.podium_probability = static_cast<double>(podium_count) / n;
    d.mean_position = mean;
  }
  return table;
}

std::vector<PodiumEntry> rank_podium(const PositionTable& table, std::size_t top_n) {
  std::vector<PodiumEntry> out;
  out.reserve(table.entities.size());
  for (const auto& d : table.entities) {
    out.push_back(PodiumEntry{d.entity_id, d.podium_probability, d.win_probability, d.mean_position});
  }
  std::sort(out.begin(), out.end(), [](const PodiumEntry& a, const PodiumEntry& b) {
    if (a.podium_probability != b.podium_probability) return a.podium_probability > b.podium_probability;
    if (a.mean_position != b.mean_position) return a.mean_position < b.mean_position;
    return a.entity_id < b.entity_id;
  });
  if (out.size() > top_n) out.resize(top_n);
  return out;
}

PositionTable predict_podium(const LapProfile& profile,
                             const std::vector<std::string>& roster,
                             const SimulationConfig& config,
                             std::size_t runs,
                             const EnsembleOptions& options) {
  const Ensemble ensemble = run_ensemble(profile, roster, config, runs, options);
  return predict_positions(ensemble);
}

} // namespace pitwall
