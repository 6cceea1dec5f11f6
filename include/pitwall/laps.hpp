#pragma once
#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace pitwall {

// One historical lap as supplied by the timing collaborator.
struct LapRecord {
  std::string session;        // historical session, e.g. "2024"
  std::string entity_id;      // driver number / code
  int lap_number = 0;         // 1-based, strictly increasing per entity within a session
  double lap_duration = 0.0;  // seconds
  bool is_valid = true;
  bool pit_flag = false;      // lap includes a pit stop
};

struct LapHistoryLoad {
  std::vector<LapRecord> records;
  std::size_t skipped_rows = 0; // rows that could not be parsed
};

// Stream-based CSV loader.
// Columns: session,entity_id,lap_number,lap_duration,is_valid,pit_flag
// Header optional; '#' comments and blank lines ignored; unparsable rows are
// skipped and counted.
LapHistoryLoad lap_records_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if the file cannot be opened.
std::optional<LapHistoryLoad> load_lap_history_csv(const std::string& path);

} // namespace pitwall
