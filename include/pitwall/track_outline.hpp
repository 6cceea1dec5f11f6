#pragma once
#include <cstddef>
#include <vector>
#include <pitwall/normalize.hpp>
#include <pitwall/telemetry.hpp>
#include <pitwall/track_geom.hpp>

namespace pitwall {

// Approximate closed-loop outline of a circuit, as an arc-length path.
using TrackOutline = TrackPath;

// Outline from one entity's raw samples: the first lap that is followed by a
// later lap (so it is complete), or every sample when only one lap exists,
// evenly decimated to at most max_points. Non-finite samples are skipped.
// Falls back to default_track_outline() with fewer than 3 usable points.
TrackOutline extract_track_outline(const std::vector<RawTelemetrySample>& samples,
                                   std::size_t max_points = 200);

// Same, from the entity with the most samples in the set.
TrackOutline extract_track_outline(const TelemetrySet& telemetry, std::size_t max_points = 200);

// Coarse polygon of the Circuit of the Americas layout (25 corners).
TrackOutline default_track_outline();

// Point at lap progress in [0, 1) along the outline.
Vec2 position_on_outline(const TrackOutline& outline, double lap_progress);

// Outline mapped into visualization space with the frames' map.
TrackOutline normalize_outline(const TrackOutline& outline, const AffineMap& map);

} // namespace pitwall
