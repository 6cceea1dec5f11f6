#include <catch2/catch.hpp>
#include <cmath>
#include <limits>

#include <pitwall/errors.hpp>
#include <pitwall/normalize.hpp>

using Catch::Detail::Approx;
using namespace pitwall;

TEST_CASE("normalize_coordinate") {
  const AxisRange raw{-1200.0, 3400.0};
  const AxisRange viz{0.0, 1000.0};

  SECTION("endpoints map exactly") {
    REQUIRE(normalize_coordinate(raw.min, raw, viz) == viz.min);
    REQUIRE(normalize_coordinate(raw.max, raw, viz) == viz.max);
  }

  SECTION("midpoint maps to midpoint") {
    REQUIRE(normalize_coordinate(raw.midpoint(), raw, viz) == Approx(500.0));
  }

  SECTION("inverted target axis") {
    const AxisRange flipped{1000.0, 0.0};
    REQUIRE(normalize_coordinate(raw.min, raw, flipped) == 1000.0);
    REQUIRE(normalize_coordinate(raw.max, raw, flipped) == 0.0);
  }

  SECTION("degenerate range throws with the axis") {
    try {
      normalize_coordinate(5.0, AxisRange{5.0, 5.0}, viz, 'y');
      FAIL("expected DegenerateRangeError");
    } catch (const DegenerateRangeError& e) {
      REQUIRE(e.axis() == 'y');
      REQUIRE(e.value() == Approx(5.0));
    }
  }
}

TEST_CASE("observe_bounds") {
  SECTION("over a telemetry set, skipping non-finite samples") {
    TelemetrySet set;
    set["1"].samples = {{0.0, 10.0, -5.0, 100.0, 1}, {0.1, 30.0, 15.0, 110.0, 1}};
    set["2"].samples = {{0.0, -20.0, 0.0, 90.0, 1},
                        {0.1, std::numeric_limits<double>::quiet_NaN(), 99.0, 90.0, 1}};
    set["3"];  // no samples
    const auto b = observe_bounds(set);
    REQUIRE(b.has_value());
    REQUIRE(b->x == AxisRange{-20.0, 30.0});
    REQUIRE(b->y == AxisRange{-5.0, 15.0});
  }

  SECTION("nullopt when nothing is usable") {
    REQUIRE_FALSE(observe_bounds(TelemetrySet{}).has_value());
    REQUIRE_FALSE(observe_bounds(std::vector<Vec2>{}).has_value());
  }
}

TEST_CASE("AffineMap") {
  const Bounds2D raw{{0.0, 200.0}, {-50.0, 50.0}};
  const Bounds2D viz{{0.0, 1000.0}, {0.0, 1000.0}};

  SECTION("maps corners and preserves proportions per axis") {
    const AffineMap m(raw, viz);
    REQUIRE(m.apply(Vec2{0.0, -50.0}) == Vec2{0.0, 0.0});
    REQUIRE(m.apply(Vec2{200.0, 50.0}) == Vec2{1000.0, 1000.0});
    REQUIRE(m.map_x(50.0) == Approx(250.0));
    REQUIRE(m.map_y(0.0) == Approx(500.0));
  }

  SECTION("flat axis throws") {
    const Bounds2D flat{{3.0, 3.0}, {0.0, 1.0}};
    REQUIRE_THROWS_AS(AffineMap(flat, viz), DegenerateRangeError);
  }

  SECTION("collapse_degenerate sends a flat axis to the midpoint") {
    const Bounds2D flat{{0.0, 10.0}, {7.0, 7.0}};
    const auto m = AffineMap::collapse_degenerate(flat, viz);
    REQUIRE_FALSE(m.collapsed_x());
    REQUIRE(m.collapsed_y());
    REQUIRE(m.map_y(7.0) == Approx(500.0));
    REQUIRE(m.map_x(10.0) == 1000.0);
  }

  SECTION("applies to point lists") {
    const AffineMap m(raw, viz);
    const auto pts = m.apply(std::vector<Vec2>{{0.0, -50.0}, {100.0, 0.0}});
    REQUIRE(pts.size() == 2);
    REQUIRE(pts[1].x == Approx(500.0));
    REQUIRE(pts[1].y == Approx(500.0));
  }
}

TEST_CASE("AffineMap::uniform keeps the aspect ratio") {
  const Bounds2D raw{{0.0, 200.0}, {0.0, 100.0}};
  const Bounds2D square{{0.0, 1000.0}, {0.0, 1000.0}};
  const auto map = AffineMap::uniform(raw, square);
  REQUIRE(map.preserves_aspect());

  SECTION("the longer axis fills its range") {
    REQUIRE(map.map_x(0.0) == Approx(0.0));
    REQUIRE(map.map_x(200.0) == Approx(1000.0));
  }

  SECTION("the shorter axis is centered") {
    REQUIRE(map.map_y(0.0) == Approx(250.0));
    REQUIRE(map.map_y(100.0) == Approx(750.0));
    REQUIRE(map.map_y(50.0) == Approx(500.0));
  }

  SECTION("distances scale equally on both axes") {
    const Vec2 a = map.apply(Vec2{10.0, 10.0});
    const Vec2 b = map.apply(Vec2{40.0, 50.0});
    REQUIRE(b.x - a.x == Approx(150.0));
    REQUIRE(b.y - a.y == Approx(200.0));
  }

  SECTION("inverted target axis") {
    const auto flipped = AffineMap::uniform(raw, Bounds2D{{0.0, 1000.0}, {1000.0, 0.0}});
    REQUIRE(flipped.map_y(0.0) == Approx(750.0));
    REQUIRE(flipped.map_y(100.0) == Approx(250.0));
    REQUIRE(flipped.map_x(200.0) == Approx(1000.0));
  }

  SECTION("a flat axis goes to the midpoint") {
    const auto flat = AffineMap::uniform(Bounds2D{{0.0, 10.0}, {7.0, 7.0}}, square);
    REQUIRE(flat.map_y(7.0) == Approx(500.0));
    REQUIRE(flat.map_x(0.0) == Approx(0.0));
    REQUIRE(flat.map_x(10.0) == Approx(1000.0));
  }
}

TEST_CASE("fit_coordinate_map") {
  const Bounds2D raw{{0.0, 200.0}, {0.0, 100.0}};
  const Bounds2D square{{0.0, 1000.0}, {0.0, 1000.0}};

  const auto per_axis = fit_coordinate_map(raw, square, false);
  REQUIRE_FALSE(per_axis.preserves_aspect());
  REQUIRE(per_axis.map_y(0.0) == 0.0);
  REQUIRE(per_axis.map_y(100.0) == 1000.0);

  const auto uniform = fit_coordinate_map(raw, square, true);
  REQUIRE(uniform.preserves_aspect());
  REQUIRE(uniform.map_y(0.0) == Approx(250.0));
}
