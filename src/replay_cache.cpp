#include <pitwall/replay_cache.hpp>
#include <utility>
#include <pitwall/log.hpp>

namespace pitwall {

ProfileKey ProfileKey::of(const std::string& venue, const ProfileFilter& f) {
  return ProfileKey{venue, f.min_lap_s, f.max_median_ratio, f.min_valid_laps,
                    f.default_pit_loss_mean, f.default_pit_loss_stddev, f.min_entity_laps};
}

ReplayCache::ReplayCache(TelemetryLoader telemetry, LapHistoryLoader history,
                         std::optional<Bounds2D> viz_bounds, bool preserve_aspect)
  : telemetry_(std::move(telemetry)), history_(std::move(history)),
    viz_bounds_(viz_bounds), preserve_aspect_(preserve_aspect) {}

FrameSequence ReplayCache::build_frames_(const std::string& session, int sample_rate) const {
  logger()->debug("cache: building frames for {} at sample_rate {}", session, sample_rate);
  PreprocessOptions opts;
  opts.sample_rate = sample_rate;
  opts.viz_bounds = viz_bounds_;
  opts.preserve_aspect = preserve_aspect_;
  return preprocess_frames(telemetry_(session), opts);
}

TrackOutline ReplayCache::build_outline_(const std::string& session) const {
  logger()->debug("cache: building track outline for {}", session);
  const TelemetrySet telemetry = telemetry_(session);
  TrackOutline outline = extract_track_outline(telemetry);
  if (!viz_bounds_) return outline;
  // Same map as the frames of this session so the two overlay exactly.
  if (auto raw = observe_bounds(telemetry)) {
    return normalize_outline(outline, fit_coordinate_map(*raw, *viz_bounds_, preserve_aspect_));
  }
  // No usable samples: the default outline is scaled by its own bounds.
  if (auto own = observe_bounds(outline.points())) {
    return normalize_outline(outline, fit_coordinate_map(*own, *viz_bounds_, preserve_aspect_));
  }
  return outline;
}

std::shared_ptr<const FrameSequence> ReplayCache::frames(const std::string& session, int sample_rate) {
  return frames_.get_or_build(FrameKey{session, sample_rate},
                              [&] { return build_frames_(session, sample_rate); });
}

std::shared_ptr<const FrameSequence> ReplayCache::rebuild_frames(const std::string& session, int sample_rate) {
  return frames_.rebuild(FrameKey{session, sample_rate},
                         [&] { return build_frames_(session, sample_rate); });
}

std::shared_ptr<const TrackOutline> ReplayCache::outline(const std::string& session) {
  return outlines_.get_or_build(session, [&] { return build_outline_(session); });
}

std::shared_ptr<const LapProfile> ReplayCache::profile(const std::string& venue, const ProfileFilter& filter) {
  return profiles_.get_or_build(ProfileKey::of(venue, filter), [&] {
    logger()->debug("cache: building lap profile for {}", venue);
    return build_lap_profile(history_(venue), filter);
  });
}

void ReplayCache::clear() {
  frames_.clear();
  outlines_.clear();
  profiles_.clear();
  logger()->debug("cache: cleared");
}

} // namespace pitwall
