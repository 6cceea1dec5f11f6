#include <pitwall/profile.hpp>
#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <string>
#include <utility>
#include <pitwall/errors.hpp>
#include <pitwall/log.hpp>

namespace pitwall {

double median_of(std::vector<double> values) {
  if (values.empty()) return 0.0;
  const std::size_t n = values.size();
  const std::size_t mid = n / 2;
  std::nth_element(values.begin(), values.begin() + mid, values.end());
  const double upper = values[mid];
  if (n % 2 == 1) return upper;
  const double lower = *std::max_element(values.begin(), values.begin() + mid);
  return 0.5 * (lower + upper);
}

LinearFit fit_line(const std::vector<double>& xs, const std::vector<double>& ys) {
  LinearFit fit;
  const std::size_t n = std::min(xs.size(), ys.size());
  if (n == 0) return fit;

  double mx = 0.0, my = 0.0;
  for (std::size_t i = 0; i < n; ++i) { mx += xs[i]; my += ys[i]; }
  mx /= double(n);
  my /= double(n);

  double sxx = 0.0, sxy = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    const double dx = xs[i] - mx;
    sxx += dx * dx;
    sxy += dx * (ys[i] - my);
  }
  fit.slope = sxx > 0.0 ? sxy / sxx : 0.0;
  fit.intercept = my - fit.slope * mx;

  if (n > 2) {
    double ss = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
      const double r = ys[i] - (fit.intercept + fit.slope * xs[i]);
      ss += r * r;
    }
    fit.residual_stddev = std::sqrt(ss / double(n - 2));
  }
  return fit;
}

static double sample_stddev(const std::vector<double>& v, double mean) {
  if (v.size() < 2) return 0.0;
  double ss = 0.0;
  for (double x : v) ss += (x - mean) * (x - mean);
  return std::sqrt(ss / double(v.size() - 1));
}

LapProfile build_lap_profile(const std::vector<LapRecord>& records,
                             const ProfileFilter& filter,
                             FilterReport* report) {
  FilterReport rep;
  rep.total = records.size();

  // Pass 1: ordering invariant and validity flag.
  std::map<std::pair<std::string, std::string>, int> last_lap;
  std::vector<const LapRecord*> candidates;
  candidates.reserve(records.size());
  for (const auto& r : records) {
    auto key = std::make_pair(r.session, r.entity_id);
    auto it = last_lap.find(key);
    if (it != last_lap.end() && r.lap_number <= it->second) {
      ++rep.dropped_out_of_order;
      continue;
    }
    last_lap[key] = r.lap_number;
    if (!r.is_valid) { ++rep.dropped_invalid; continue; }
    candidates.push_back(&r);
  }

  // Pass 2: plausibility bounds against the per-session median.
  std::map<std::string, std::vector<double>> by_session;
  for (const auto* r : candidates) {
    if (std::isfinite(r->lap_duration) && r->lap_duration > 0.0) {
      by_session[r->session].push_back(r->lap_duration);
    }
  }
  std::map<std::string, double> session_median;
  for (auto& [session, durations] : by_session) {
    session_median[session] = median_of(durations);
  }

  std::vector<double> clean_laps, clean_durations;
  std::vector<const LapRecord*> clean_records, pit_records;
  for (const auto* r : candidates) {
    const double d = r->lap_duration;
    const bool positive = std::isfinite(d) && d > 0.0;
    const double cap = filter.max_median_ratio * session_median[r->session];
    if (!positive || d < filter.min_lap_s || d > cap) {
      ++rep.dropped_out_of_bounds;
      continue;
    }
    if (r->pit_flag) {
      pit_records.push_back(r);
    } else {
      clean_records.push_back(r);
      clean_laps.push_back(double(r->lap_number));
      clean_durations.push_back(d);
    }
  }
  rep.clean_laps = clean_durations.size();
  rep.pit_laps = pit_records.size();
  if (report) *report = rep;

  logger()->info("lap profile: {} records, {} clean, {} pit, dropped {} (invalid {}, out of order {}, out of bounds {})",
                 rep.total, rep.clean_laps, rep.pit_laps, rep.dropped(),
                 rep.dropped_invalid, rep.dropped_out_of_order, rep.dropped_out_of_bounds);

  if (rep.clean_laps < filter.min_valid_laps) {
    throw InsufficientDataError(rep.clean_laps, filter.min_valid_laps);
  }

  LapProfile p;
  p.baseline_duration = median_of(clean_durations);
  const LinearFit fit = fit_line(clean_laps, clean_durations);
  p.degradation_per_lap = fit.slope;
  p.duration_stddev = fit.residual_stddev;

  // Per-entity residuals around the venue trend.
  std::map<std::string, std::vector<double>> residuals;
  std::map<std::string, std::set<std::string>> sessions;
  std::map<std::string, double> best;
  for (std::size_t i = 0; i < clean_records.size(); ++i) {
    const auto* r = clean_records[i];
    residuals[r->entity_id].push_back(clean_durations[i] - (fit.intercept + fit.slope * clean_laps[i]));
    sessions[r->entity_id].insert(r->session);
    auto it = best.find(r->entity_id);
    if (it == best.end() || clean_durations[i] < it->second) best[r->entity_id] = clean_durations[i];
  }
  for (const auto& [id, res] : residuals) {
    if (res.size() < filter.min_entity_laps) continue;
    EntityPace pace;
    for (double v : res) pace.offset += v;
    pace.offset /= double(res.size());
    pace.stddev = res.size() >= 2 ? sample_stddev(res, pace.offset) : p.duration_stddev;
    pace.best_lap = best[id];
    pace.clean_laps = res.size();
    pace.sessions = sessions[id].size();
    p.entities.emplace(id, pace);
  }
  logger()->debug("lap profile: pace for {} of {} entities", p.entities.size(), residuals.size());

  if (pit_records.empty()) {
    logger()->warn("lap profile: no pit laps survived filtering, using default pit loss {:.2f}s",
                   filter.default_pit_loss_mean);
    p.pit_loss_mean = filter.default_pit_loss_mean;
    p.pit_loss_stddev = filter.default_pit_loss_stddev;
    return p;
  }

  std::vector<double> deltas;
  deltas.reserve(pit_records.size());
  for (const auto* r : pit_records) {
    const double trend = fit.intercept + fit.slope * double(r->lap_number);
    deltas.push_back(r->lap_duration - trend - pace_for(p, r->entity_id).offset);
  }
  double mean = 0.0;
  for (double d : deltas) mean += d;
  mean /= double(deltas.size());

  p.pit_loss_mean = std::max(0.0, mean);
  p.pit_loss_stddev = deltas.size() >= 2 ? sample_stddev(deltas, mean)
                                         : filter.default_pit_loss_stddev;
  return p;
}

EntityPace pace_for(const LapProfile& p, const std::string& entity_id) {
  auto it = p.entities.find(entity_id);
  if (it != p.entities.end()) return it->second;
  EntityPace venue;
  venue.stddev = p.duration_stddev;
  return venue;
}

void validate_profile(const LapProfile& p) {
  auto check = [](double v, bool non_negative, const char* field, const std::string& entity) {
    if (!std::isfinite(v)) {
      throw InvalidConfigurationError(std::string("lap profile ") + field + " is not finite", entity);
    }
    if (non_negative && v < 0.0) {
      throw InvalidConfigurationError(std::string("lap profile ") + field + " is negative", entity);
    }
  };
  check(p.baseline_duration, true, "baseline_duration", {});
  check(p.degradation_per_lap, false, "degradation_per_lap", {});
  check(p.duration_stddev, true, "duration_stddev", {});
  check(p.pit_loss_mean, true, "pit_loss_mean", {});
  check(p.pit_loss_stddev, true, "pit_loss_stddev", {});
  for (const auto& [id, pace] : p.entities) {
    check(pace.offset, false, "pace offset", id);
    check(pace.stddev, true, "pace stddev", id);
  }
}

} // namespace pitwall
