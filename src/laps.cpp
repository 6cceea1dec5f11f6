#include <pitwall/laps.hpp>
#include <fstream>
#include <pitwall/log.hpp>
#include "csv_util.hpp"

namespace pitwall {

static bool is_header_row(const std::vector<std::string>& cols) {
  return !cols.empty() && csv::lower(cols[0]) == "session";
}

static std::optional<LapRecord> parse_lap_row(const std::vector<std::string>& cols) {
  if (cols.size() < 6) return std::nullopt;
  if (cols[1].empty()) return std::nullopt;
  bool ok1, ok2, ok3, ok4;
  const auto lap = csv::to_int_safe(cols[2], ok1);
  const double dur = csv::to_double_safe(cols[3], ok2);
  const bool valid = csv::to_bool_safe(cols[4], ok3);
  const bool pit = csv::to_bool_safe(cols[5], ok4);
  if (!(ok1 && ok2 && ok3 && ok4)) return std::nullopt;
  if (lap < 1) return std::nullopt;

  LapRecord r;
  r.session = cols[0];
  r.entity_id = cols[1];
  r.lap_number = static_cast<int>(lap);
  r.lap_duration = dur;
  r.is_valid = valid;
  r.pit_flag = pit;
  return r;
}

LapHistoryLoad lap_records_from_csv_stream(std::istream& in) {
  LapHistoryLoad out;
  std::string line;
  bool header_consumed = false;

  while (std::getline(in, line)) {
    const std::string raw = csv::trim(line);
    if (csv::is_skippable(raw)) continue;

    const auto cols = csv::split_line(raw);
    if (!header_consumed && is_header_row(cols)) {
      header_consumed = true;
      continue;
    }

    if (auto row = parse_lap_row(cols); row.has_value()) {
      out.records.push_back(std::move(*row));
    } else {
      ++out.skipped_rows;
    }
  }

  if (out.skipped_rows > 0) {
    logger()->warn("lap history: skipped {} unparsable rows ({} loaded)",
                   out.skipped_rows, out.records.size());
  }
  return out;
}

std::optional<LapHistoryLoad> load_lap_history_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return lap_records_from_csv_stream(f);
}

} // namespace pitwall
