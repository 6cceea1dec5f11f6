#include <pitwall/ensemble.hpp>
#include <algorithm>
#include <exception>
#include <mutex>
#include <optional>
#include <random>
#include <thread>
#include <pitwall/log.hpp>
#include <pitwall/worker_group.hpp>

namespace pitwall {

std::uint64_t derive_run_seed(std::uint64_t base_seed, std::size_t run_index) {
  const auto idx = static_cast<std::uint64_t>(run_index);
  std::seed_seq seq{
    static_cast<std::uint32_t>(base_seed), static_cast<std::uint32_t>(base_seed >> 32),
    static_cast<std::uint32_t>(idx),       static_cast<std::uint32_t>(idx >> 32)
  };
  std::uint32_t words[2];
  seq.generate(words, words + 2);
  return (static_cast<std::uint64_t>(words[1]) << 32) | words[0];
}

Ensemble run_ensemble(const LapProfile& profile,
                      const std::vector<std::string>& roster,
                      const SimulationConfig& config,
                      std::size_t runs,
                      const EnsembleOptions& options) {
  validate_profile(profile);
  validate_simulation(roster, config, options.plans);
  if (runs == 0) return {};

  std::size_t workers = options.workers;
  if (workers == 0) workers = std::max(1u, std::thread::hardware_concurrency());
  workers = std::min(workers, runs);

  logger()->debug("ensemble: {} runs, {} entities, {} laps, {} workers",
                  runs, roster.size(), config.race_length, workers);

  std::vector<std::optional<SimulatedTrajectory>> results(runs);
  std::atomic<std::size_t> next{0};
  std::atomic<std::size_t> completed{0};
  std::atomic<bool> failed{false};
  std::mutex err_mu;
  std::exception_ptr first_error;

  auto cancelled = [&] {
    return failed.load(std::memory_order_relaxed) ||
           (options.cancel && options.cancel->load(std::memory_order_relaxed));
  };

  auto worker = [&] {
    while (!cancelled()) {
      const std::size_t i = next.fetch_add(1, std::memory_order_relaxed);
      if (i >= runs) return;
      SimulationConfig run_cfg = config;
      run_cfg.seed = derive_run_seed(config.seed, i);
      try {
        results[i] = simulate_race(profile, roster, run_cfg, options.plans);
        const std::size_t done = completed.fetch_add(1, std::memory_order_relaxed) + 1;
        if (options.progress) options.progress(done, runs);
      } catch (...) {
        std::lock_guard<std::mutex> lk(err_mu);
        if (!first_error) first_error = std::current_exception();
        failed.store(true, std::memory_order_relaxed);
        return;
      }
    }
  };

  {
    WorkerGroup pool(failed);
    for (std::size_t w = 0; w < workers; ++w) pool.spawn(worker);
    pool.join();
  }

  if (first_error) std::rethrow_exception(first_error);

  Ensemble out;
  out.reserve(runs);
  for (auto& r : results) {
    if (r) out.push_back(std::move(*r));
  }
  if (out.size() < runs) {
    logger()->warn("ensemble: cancelled after {} of {} runs", out.size(), runs);
  } else {
    logger()->debug("ensemble: {} runs complete", out.size());
  }
  return out;
}

} // namespace pitwall
