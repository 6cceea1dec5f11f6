#include <pitwall/telemetry.hpp>
#include <algorithm>
#include <cctype>
#include <limits>

namespace pitwall {

std::string normalize_color(const std::string& color) {
  if (color.empty() || color[0] == '#') return color;
  const bool hex = std::all_of(color.begin(), color.end(),
                               [](unsigned char c){ return std::isxdigit(c) != 0; });
  if (hex && (color.size() == 3 || color.size() == 6 || color.size() == 8)) return "#" + color;
  return color;
}

std::size_t min_sample_count(const TelemetrySet& set) {
  std::size_t best = std::numeric_limits<std::size_t>::max();
  for (const auto& [id, t] : set) {
    if (!t.samples.empty()) best = std::min(best, t.samples.size());
  }
  return best == std::numeric_limits<std::size_t>::max() ? 0 : best;
}

} // namespace pitwall
