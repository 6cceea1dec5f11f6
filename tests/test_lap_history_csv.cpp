#include <catch2/catch.hpp>
#include <sstream>

#include <pitwall/laps.hpp>

using Catch::Detail::Approx;
using namespace pitwall;

static std::string csv_history = R"(session,entity_id,lap_number,lap_duration,is_valid,pit_flag
2024, 1, 1, 99.81, true, false
2024, 1, 2, 99.64, 1, 0
# comment
2024, 1, 3, 121.02, yes, yes

2024, 44, 1, 100.12, false, no
2024, 44, x, 100.12, true, no        # bad lap number
2024, 44, 2, 100.40, maybe, no       # bad flag
2024, 44, 3, 100.40                  # missing columns
2024, , 4, 100.40, true, false       # missing entity
)";

TEST_CASE("lap_records_from_csv_stream") {
  std::istringstream ss(csv_history);
  const auto load = lap_records_from_csv_stream(ss);

  REQUIRE(load.records.size() == 4);
  REQUIRE(load.skipped_rows == 4);

  const auto& r = load.records[2];
  REQUIRE(r.session == "2024");
  REQUIRE(r.entity_id == "1");
  REQUIRE(r.lap_number == 3);
  REQUIRE(r.lap_duration == Approx(121.02));
  REQUIRE(r.is_valid);
  REQUIRE(r.pit_flag);

  REQUIRE_FALSE(load.records[3].is_valid);
  REQUIRE(load.records[3].entity_id == "44");
}

TEST_CASE("lap_records_from_csv_stream without header") {
  std::istringstream ss("2023,16,1,95.0,1,0\n2023,16,2,95.5,1,0\n");
  const auto load = lap_records_from_csv_stream(ss);
  REQUIRE(load.records.size() == 2);
  REQUIRE(load.skipped_rows == 0);
}

TEST_CASE("load_lap_history_csv returns nullopt on missing file") {
  REQUIRE_FALSE(load_lap_history_csv("this_file_does_not_exist.csv").has_value());
}
