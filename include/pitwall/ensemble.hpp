#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include <pitwall/race_sim.hpp>

namespace pitwall {

// N independent runs of one configuration, in run-index order.
using Ensemble = std::vector<SimulatedTrajectory>;

struct EnsembleOptions {
  std::size_t workers = 0;              // 0 = std::thread::hardware_concurrency()
  std::vector<StrategyPlan> plans;      // fixed plans; other entities get per-run plans
  const std::atomic<bool>* cancel = nullptr; // stops scheduling new runs when set
  // Called from worker threads after each finished run with (finished, total).
  std::function<void(std::size_t, std::size_t)> progress;
};

// Seed of run `run_index`, derived through std::seed_seq so the ensemble does
// not depend on worker count or scheduling.
std::uint64_t derive_run_seed(std::uint64_t base_seed, std::size_t run_index);

// Runs `runs` simulations on a pool of worker threads. Each run owns a
// generator seeded with derive_run_seed(config.seed, i). Profile and
// configuration errors are raised before any thread starts. A run that has
// started always finishes, so a cancelled ensemble is the prefix of runs
// 0..k-1 that were scheduled, in index order.
// If a worker cannot be started, the ones already running are stopped and
// joined before the std::system_error propagates.
Ensemble run_ensemble(const LapProfile& profile,
                      const std::vector<std::string>& roster,
                      const SimulationConfig& config,
                      std::size_t runs,
                      const EnsembleOptions& options = {});

} // namespace pitwall
