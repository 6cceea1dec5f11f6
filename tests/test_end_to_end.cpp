#include <catch2/catch.hpp>
#include <set>

#include <pitwall/frames.hpp>
#include <pitwall/synthetic.hpp>

using Catch::Detail::Approx;
using namespace pitwall;

TEST_CASE("synthetic telemetry to frames") {
  // 5 entities x 3 laps x 100 points, every 10th sample kept
  const TelemetrySet telemetry = synthetic_telemetry(5, 3, 100);
  REQUIRE(telemetry.size() == 5);
  REQUIRE(min_sample_count(telemetry) == 300);

  PreprocessOptions opts;
  opts.sample_rate = 10;
  opts.viz_bounds = Bounds2D{{0.0, 1000.0}, {0.0, 1000.0}};
  const FrameSequence seq = preprocess_frames(telemetry, opts);

  REQUIRE(seq.size() == 30);
  REQUIRE(seq.roster == std::vector<std::string>{"1", "2", "3", "4", "5"});

  SECTION("every entity is present in every frame") {
    for (const auto& f : seq.frames) REQUIRE(f.present_count() == 5);
  }

  SECTION("laps stay in 1..3 and never go backwards") {
    for (const auto& id : seq.roster) {
      int prev = 1;
      std::set<int> seen;
      for (std::size_t i = 0; i < seq.size(); ++i) {
        const auto* s = seq.state_at(i, id);
        REQUIRE(s != nullptr);
        REQUIRE(s->lap >= prev);
        REQUIRE(s->lap <= 3);
        prev = s->lap;
        seen.insert(s->lap);
      }
      REQUIRE(seen == std::set<int>{1, 2, 3});
    }
  }

  SECTION("coordinates lie inside the target bounds") {
    for (const auto& f : seq.frames) {
      for (const auto& slot : f.slots) {
        REQUIRE(slot->x >= 0.0);
        REQUIRE(slot->x <= 1000.0);
        REQUIRE(slot->y >= 0.0);
        REQUIRE(slot->y <= 1000.0);
      }
    }
  }

  SECTION("display data comes from the demo grid") {
    const auto* ver = seq.state_at(0, "1");
    REQUIRE(ver->code == "VER");
    REQUIRE(ver->team == "Red Bull");
    REQUIRE(ver->color == "#0600EF");
    REQUIRE(ver->speed == Approx(200.0).margin(1e-9));
  }
}

TEST_CASE("synthetic telemetry edge cases") {
  REQUIRE(synthetic_telemetry(0).empty());
  const auto big = synthetic_telemetry(12, 1, 10);
  REQUIRE(big.size() == 12);
  REQUIRE(big.at("12").meta.code == "D12");
}
