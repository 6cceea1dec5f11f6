#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <pitwall/normalize.hpp>
#include <pitwall/telemetry.hpp>

namespace pitwall {

// Everything a renderer needs to draw one entity in one frame.
struct EntityState {
  double x = 0.0;
  double y = 0.0;
  double speed = 0.0;
  int lap = 0;
  std::string code;
  std::string name;
  std::string team;
  std::string color;

  bool operator==(const EntityState&) const = default;
};

// Synchronized snapshot at one decimated time index. slots[k] belongs to
// roster[k] of the owning sequence and is empty when that entity has no
// sample at this index.
struct Frame {
  std::size_t index = 0;
  std::vector<std::optional<EntityState>> slots;

  std::size_t present_count() const;
};

struct FrameSequence {
  std::vector<std::string> roster;        // entity ids, slot order
  std::vector<Frame> frames;              // frames[i].index == i
  int sample_rate = 1;
  std::size_t min_raw_samples = 0;        // over entities with samples
  std::optional<AffineMap> coordinate_map;

  std::size_t size() const { return frames.size(); }
  bool empty() const { return frames.empty(); }

  // Renderer lookups; nullptr when out of range / absent.
  const Frame* frame_at(std::size_t i) const;
  const EntityState* state_at(std::size_t i, const std::string& entity_id) const;
};

struct PreprocessOptions {
  int sample_rate = 5;                 // keep samples 0, S, 2S, ...
  std::optional<Bounds2D> viz_bounds;  // map coordinates into these bounds when set
  bool preserve_aspect = false;        // one scale for both axes (see AffineMap::uniform)
};

// Frames produced for R raw samples at stride S: ceil(R / S).
std::size_t expected_frame_count(std::size_t raw_samples, int sample_rate);

// Decimates every entity at the same stride (no interpolation). The frame
// count is ceil(R_min / S) where R_min is the smallest non-zero per-entity
// sample count; entities without samples are absent from every frame.
// When viz_bounds is set, one AffineMap fitted to the raw bounds of the
// whole set maps every coordinate, per axis or with a uniform scale; a flat
// axis collapses to the target midpoint. The result is validated before it is returned.
// Throws InvalidConfigurationError (sample_rate < 1) or FrameValidationError.
FrameSequence preprocess_frames(const TelemetrySet& telemetry, const PreprocessOptions& options = {});

// Re-checks frame count, frame indices, non-empty entity sets, finite
// coordinates and speed, lap >= 1 and non-empty display fields.
// Throws FrameValidationError on the first offending frame.
void validate_frames(const FrameSequence& seq);

} // namespace pitwall
