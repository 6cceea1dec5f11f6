#include <catch2/catch.hpp>
#include <limits>
#include <vector>

#include <pitwall/errors.hpp>
#include <pitwall/profile.hpp>
#include <pitwall/synthetic.hpp>

using Catch::Detail::Approx;
using namespace pitwall;

static LapRecord lap(const std::string& id, int n, double d, bool valid = true, bool pit = false) {
  return LapRecord{"2024", id, n, d, valid, pit};
}

// Exactly linear laps 100 + 0.1 * n, one pit lap 20 s slower than the trend.
static std::vector<LapRecord> linear_history() {
  std::vector<LapRecord> out;
  for (int n = 1; n <= 10; ++n) {
    const bool pit = n == 6;
    out.push_back(lap("1", n, 100.0 + 0.1 * n + (pit ? 20.0 : 0.0), true, pit));
  }
  return out;
}

TEST_CASE("median_of") {
  REQUIRE(median_of({}) == Approx(0.0));
  REQUIRE(median_of({3.0}) == Approx(3.0));
  REQUIRE(median_of({5.0, 1.0, 3.0}) == Approx(3.0));
  REQUIRE(median_of({4.0, 1.0, 3.0, 2.0}) == Approx(2.5));
}

TEST_CASE("fit_line recovers an exact line") {
  const std::vector<double> xs{1, 2, 3, 4, 5};
  const std::vector<double> ys{3, 5, 7, 9, 11};
  const auto fit = fit_line(xs, ys);
  REQUIRE(fit.slope == Approx(2.0));
  REQUIRE(fit.intercept == Approx(1.0));
  REQUIRE(fit.residual_stddev == Approx(0.0).margin(1e-12));

  SECTION("constant x gives zero slope") {
    const auto flat = fit_line({2, 2, 2}, {1, 2, 3});
    REQUIRE(flat.slope == Approx(0.0));
    REQUIRE(flat.intercept == Approx(2.0));
  }
}

TEST_CASE("build_lap_profile on a noiseless trend") {
  FilterReport rep;
  const LapProfile p = build_lap_profile(linear_history(), {}, &rep);

  REQUIRE(rep.total == 10);
  REQUIRE(rep.clean_laps == 9);
  REQUIRE(rep.pit_laps == 1);
  REQUIRE(rep.dropped() == 0);

  REQUIRE(p.degradation_per_lap == Approx(0.1));
  REQUIRE(p.duration_stddev == Approx(0.0).margin(1e-9));
  // clean laps 1..5, 7..10: median is lap 5
  REQUIRE(p.baseline_duration == Approx(100.5));
  REQUIRE(p.pit_loss_mean == Approx(20.0));
  // a single pit lap cannot give a spread; the default is used
  REQUIRE(p.pit_loss_stddev == Approx(ProfileFilter{}.default_pit_loss_stddev));
}

TEST_CASE("build_lap_profile filters and counts") {
  auto recs = linear_history();
  recs.push_back(lap("1", 4, 100.4));           // lap number repeats -> out of order
  recs.push_back(lap("2", 1, 100.1, false));    // flagged invalid
  recs.push_back(lap("2", 2, 500.0));           // > 2x session median
  recs.push_back(lap("2", 3, 1.0));             // below min_lap_s

  ProfileFilter f;
  f.min_lap_s = 50.0;
  FilterReport rep;
  const LapProfile p = build_lap_profile(recs, f, &rep);

  REQUIRE(rep.total == 14);
  REQUIRE(rep.dropped_out_of_order == 1);
  REQUIRE(rep.dropped_invalid == 1);
  REQUIRE(rep.dropped_out_of_bounds == 2);
  REQUIRE(rep.clean_laps == 9);
  REQUIRE(rep.total == rep.dropped() + rep.clean_laps + rep.pit_laps);
  REQUIRE(p.degradation_per_lap == Approx(0.1));
}

TEST_CASE("build_lap_profile without pit laps uses the default loss") {
  std::vector<LapRecord> recs;
  for (int n = 1; n <= 6; ++n) recs.push_back(lap("1", n, 90.0));
  ProfileFilter f;
  f.default_pit_loss_mean = 24.0;
  f.default_pit_loss_stddev = 1.5;
  const LapProfile p = build_lap_profile(recs, f);
  REQUIRE(p.baseline_duration == Approx(90.0));
  REQUIRE(p.degradation_per_lap == Approx(0.0).margin(1e-12));
  REQUIRE(p.pit_loss_mean == Approx(24.0));
  REQUIRE(p.pit_loss_stddev == Approx(1.5));
}

TEST_CASE("build_lap_profile throws InsufficientDataError") {
  std::vector<LapRecord> recs;
  for (int n = 1; n <= 4; ++n) recs.push_back(lap("1", n, 90.0));
  recs.push_back(lap("1", 5, 90.0, false));

  try {
    build_lap_profile(recs);
    FAIL("expected InsufficientDataError");
  } catch (const InsufficientDataError& e) {
    REQUIRE(e.remaining() == 4);
    REQUIRE(e.required() == 5);
  }

  SECTION("empty history") {
    REQUIRE_THROWS_AS(build_lap_profile({}), InsufficientDataError);
  }
}

TEST_CASE("build_lap_profile recovers synthetic history parameters") {
  SyntheticHistorySpec hist;
  hist.laps = 40;
  const LapProfile p = build_lap_profile(synthetic_lap_history(hist));
  REQUIRE(p.degradation_per_lap == Approx(hist.degradation_s).margin(0.01));
  REQUIRE(p.duration_stddev == Approx(hist.noise_s).margin(0.1));
  REQUIRE(p.pit_loss_mean == Approx(hist.pit_loss_s).margin(0.5));
  REQUIRE(expected_lap_duration(p, 20) > p.baseline_duration - 1.0);
}

TEST_CASE("build_lap_profile separates entity pace") {
  SyntheticHistorySpec hist;
  hist.laps = 40;
  hist.pace_offsets_s = {-2.0};   // entity "1" is two seconds a lap quicker
  const LapProfile p = build_lap_profile(synthetic_lap_history(hist));

  REQUIRE(p.entities.size() == 5);
  const EntityPace quick = pace_for(p, "1");
  const EntityPace other = pace_for(p, "2");
  REQUIRE(quick.offset - other.offset == Approx(-2.0).margin(0.15));
  REQUIRE(quick.stddev == Approx(hist.noise_s).margin(0.1));
  REQUIRE(quick.sessions == 2);
  REQUIRE(quick.clean_laps == 78);
  REQUIRE(quick.best_lap < other.best_lap);
  REQUIRE(expected_lap_duration(p, "1", 10) < expected_lap_duration(p, "2", 10));

  // pit loss is measured against each entity's own pace
  REQUIRE(p.pit_loss_mean == Approx(hist.pit_loss_s).margin(0.5));
  REQUIRE(p.pit_loss_stddev < 1.0);

  SECTION("unknown entities race at the venue pace") {
    const EntityPace venue = pace_for(p, "99");
    REQUIRE(venue.offset == Approx(0.0));
    REQUIRE(venue.stddev == Approx(p.duration_stddev));
  }

  SECTION("entities below min_entity_laps get no pace") {
    ProfileFilter f;
    f.min_entity_laps = 100;
    REQUIRE(build_lap_profile(synthetic_lap_history(hist), f).entities.empty());
  }
}

TEST_CASE("validate_profile") {
  LapProfile p;
  p.baseline_duration = 95.0;
  p.duration_stddev = 0.5;
  p.pit_loss_mean = 20.0;
  p.pit_loss_stddev = 1.0;
  REQUIRE_NOTHROW(validate_profile(p));

  SECTION("non-finite spread") {
    p.duration_stddev = std::numeric_limits<double>::quiet_NaN();
    REQUIRE_THROWS_AS(validate_profile(p), InvalidConfigurationError);
  }
  SECTION("infinite baseline") {
    p.baseline_duration = std::numeric_limits<double>::infinity();
    REQUIRE_THROWS_AS(validate_profile(p), InvalidConfigurationError);
  }
  SECTION("negative pit loss") {
    p.pit_loss_mean = -1.0;
    REQUIRE_THROWS_AS(validate_profile(p), InvalidConfigurationError);
  }
  SECTION("negative degradation is allowed") {
    p.degradation_per_lap = -0.02;
    REQUIRE_NOTHROW(validate_profile(p));
  }
  SECTION("bad entity pace names the entity") {
    p.entities["44"] = EntityPace{std::numeric_limits<double>::quiet_NaN(), 0.3, 95.0, 10, 1};
    try {
      validate_profile(p);
      FAIL("expected InvalidConfigurationError");
    } catch (const InvalidConfigurationError& e) {
      REQUIRE(e.entity() == "44");
    }
  }
}
