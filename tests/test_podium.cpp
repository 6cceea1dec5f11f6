#include <catch2/catch.hpp>
#include <numeric>

#include <pitwall/errors.hpp>
#include <pitwall/podium.hpp>
#include <pitwall/profile.hpp>
#include <pitwall/synthetic.hpp>

using Catch::Detail::Approx;
using namespace pitwall;

static const std::vector<std::string> kRoster{"1", "11", "16", "44", "55", "63"};

TEST_CASE("predict_positions aggregates finishing positions") {
  LapProfile p;
  p.baseline_duration = 95.0;
  p.duration_stddev = 1.0;
  p.pit_loss_mean = 20.0;
  p.pit_loss_stddev = 2.0;
  SimulationConfig cfg;
  cfg.race_length = 10;

  const std::size_t runs = 200;
  const auto ens = run_ensemble(p, kRoster, cfg, runs);
  const auto table = predict_positions(ens);

  REQUIRE(table.runs == runs);
  REQUIRE(table.entities.size() == kRoster.size());

  SECTION("each entity's counts sum to the run count") {
    for (const auto& d : table.entities) {
      REQUIRE(d.counts.size() == kRoster.size());
      REQUIRE(std::accumulate(d.counts.begin(), d.counts.end(), std::size_t{0}) == runs);
      REQUIRE(std::accumulate(d.probability.begin(), d.probability.end(), 0.0) == Approx(1.0));
      REQUIRE(d.mean_position >= 1.0);
      REQUIRE(d.mean_position <= double(kRoster.size()));
      REQUIRE(d.podium_probability >= d.win_probability);
    }
  }

  SECTION("each position is taken once per run") {
    for (std::size_t pos = 0; pos < kRoster.size(); ++pos) {
      std::size_t total = 0;
      for (const auto& d : table.entities) total += d.counts[pos];
      REQUIRE(total == runs);
    }
  }

  SECTION("win probabilities sum to one, podium probabilities to three") {
    double win = 0.0, podium = 0.0;
    for (const auto& d : table.entities) { win += d.win_probability; podium += d.podium_probability; }
    REQUIRE(win == Approx(1.0));
    REQUIRE(podium == Approx(3.0));
  }

  SECTION("find by id") {
    REQUIRE(table.find("44") != nullptr);
    REQUIRE(table.find("44")->entity_id == "44");
    REQUIRE(table.find("99") == nullptr);
  }
}

TEST_CASE("predict_positions on a deterministic race") {
  LapProfile flat;
  flat.baseline_duration = 90.0;
  SimulationConfig cfg;
  cfg.race_length = 3;
  cfg.pit_stops = PitCountBounds{0, 0};

  // Identical times every run: id order decides, so "a" always wins.
  const auto table = predict_positions(run_ensemble(flat, {"c", "a", "b"}, cfg, 10));
  const auto* a = table.find("a");
  REQUIRE(a != nullptr);
  REQUIRE(a->win_probability == Approx(1.0));
  REQUIRE(a->mean_position == Approx(1.0));
  REQUIRE(table.find("c")->probability[2] == Approx(1.0));

  const auto top = rank_podium(table, 2);
  REQUIRE(top.size() == 2);
  REQUIRE(top[0].entity_id == "a");
  REQUIRE(top[1].entity_id == "b");
}

TEST_CASE("predict_positions rejects bad ensembles") {
  SECTION("empty") {
    REQUIRE_THROWS_AS(predict_positions(Ensemble{}), InvalidConfigurationError);
  }
  SECTION("differing rosters") {
    LapProfile flat;
    flat.baseline_duration = 90.0;
    SimulationConfig cfg;
    cfg.race_length = 3;
    Ensemble ens;
    ens.push_back(simulate_race(flat, {"a", "b"}, cfg));
    ens.push_back(simulate_race(flat, {"a", "c"}, cfg));
    REQUIRE_THROWS_AS(predict_positions(ens), InvalidConfigurationError);
  }
}

TEST_CASE("predict_podium runs and aggregates") {
  LapProfile p;
  p.baseline_duration = 95.0;
  p.duration_stddev = 0.5;
  p.pit_loss_mean = 20.0;
  SimulationConfig cfg;
  cfg.race_length = 8;
  const auto table = predict_podium(p, kRoster, cfg, 50);
  REQUIRE(table.runs == 50);
  REQUIRE(rank_podium(table).size() == 3);
}

TEST_CASE("predict_podium favors the historically faster entity") {
  SyntheticHistorySpec hist;
  hist.laps = 40;
  hist.pace_offsets_s = {-2.0};   // entity "1" laps two seconds quicker
  const LapProfile profile = build_lap_profile(synthetic_lap_history(hist));

  SimulationConfig cfg;
  cfg.race_length = 20;
  cfg.seed = 3;
  const auto table = predict_podium(profile, {"1", "2", "3", "4", "5"}, cfg, 500);

  const auto* quick = table.find("1");
  REQUIRE(quick != nullptr);
  REQUIRE(quick->win_probability > 0.9);
  REQUIRE(quick->mean_position < 1.2);
  REQUIRE(rank_podium(table).front().entity_id == "1");
}
