#pragma once
#include <compare>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <pitwall/frames.hpp>
#include <pitwall/profile.hpp>
#include <pitwall/single_flight.hpp>
#include <pitwall/track_outline.hpp>

namespace pitwall {

// Collaborators that fetch raw data. They may block; the cache never calls
// them while holding a lock.
using TelemetryLoader = std::function<TelemetrySet(const std::string& session_id)>;
using LapHistoryLoader = std::function<std::vector<LapRecord>(const std::string& venue)>;

struct FrameKey {
  std::string session;
  int sample_rate = 0;
  auto operator<=>(const FrameKey&) const = default;
};

struct ProfileKey {
  std::string venue;
  double min_lap_s = 0.0;
  double max_median_ratio = 0.0;
  std::size_t min_valid_laps = 0;
  double default_pit_loss_mean = 0.0;
  double default_pit_loss_stddev = 0.0;
  std::size_t min_entity_laps = 0;
  auto operator<=>(const ProfileKey&) const = default;

  static ProfileKey of(const std::string& venue, const ProfileFilter& f);
};

// Process-lifetime memo of frame sequences, track outlines and lap profiles.
// Owned by the application and passed to whoever needs it; values are
// immutable and shared. Concurrent requests for one key build it once.
class ReplayCache {
public:
  // viz_bounds, when set, is applied to every frame sequence and outline,
  // with a uniform scale when preserve_aspect is set.
  ReplayCache(TelemetryLoader telemetry, LapHistoryLoader history,
              std::optional<Bounds2D> viz_bounds = std::nullopt,
              bool preserve_aspect = false);

  ReplayCache(const ReplayCache&) = delete;
  ReplayCache& operator=(const ReplayCache&) = delete;

  std::shared_ptr<const FrameSequence> frames(const std::string& session, int sample_rate);
  std::shared_ptr<const TrackOutline> outline(const std::string& session);
  // Throws InsufficientDataError (not cached) when the history is too thin.
  std::shared_ptr<const LapProfile> profile(const std::string& venue, const ProfileFilter& filter = {});

  // Replaces a cached frame sequence with a fresh build.
  std::shared_ptr<const FrameSequence> rebuild_frames(const std::string& session, int sample_rate);

  void clear();

  std::size_t frame_entries() const { return frames_.size(); }
  std::size_t outline_entries() const { return outlines_.size(); }
  std::size_t profile_entries() const { return profiles_.size(); }

private:
  FrameSequence build_frames_(const std::string& session, int sample_rate) const;
  TrackOutline build_outline_(const std::string& session) const;

  TelemetryLoader telemetry_;
  LapHistoryLoader history_;
  std::optional<Bounds2D> viz_bounds_;
  bool preserve_aspect_;

  SingleFlightCache<FrameKey, FrameSequence> frames_;
  SingleFlightCache<std::string, TrackOutline> outlines_;
  SingleFlightCache<ProfileKey, LapProfile> profiles_;
};

} // namespace pitwall
