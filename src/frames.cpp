#include <pitwall/frames.hpp>
#include <algorithm>
#include <cmath>
#include <iterator>
#include <pitwall/errors.hpp>
#include <pitwall/log.hpp>

namespace pitwall {

std::size_t Frame::present_count() const {
  return static_cast<std::size_t>(
    std::count_if(slots.begin(), slots.end(), [](const auto& s){ return s.has_value(); }));
}

const Frame* FrameSequence::frame_at(std::size_t i) const {
  if (i >= frames.size()) return nullptr;
  return &frames[i];
}

const EntityState* FrameSequence::state_at(std::size_t i, const std::string& entity_id) const {
  const Frame* f = frame_at(i);
  if (!f) return nullptr;
  auto it = std::find(roster.begin(), roster.end(), entity_id);
  if (it == roster.end()) return nullptr;
  const auto k = static_cast<std::size_t>(std::distance(roster.begin(), it));
  if (k >= f->slots.size() || !f->slots[k]) return nullptr;
  return &*f->slots[k];
}

std::size_t expected_frame_count(std::size_t raw_samples, int sample_rate) {
  if (sample_rate < 1) return 0;
  const auto s = static_cast<std::size_t>(sample_rate);
  return (raw_samples + s - 1) / s;
}

FrameSequence preprocess_frames(const TelemetrySet& telemetry, const PreprocessOptions& options) {
  if (options.sample_rate < 1) {
    throw InvalidConfigurationError("sample_rate must be >= 1, got " + std::to_string(options.sample_rate));
  }

  FrameSequence seq;
  seq.sample_rate = options.sample_rate;
  seq.min_raw_samples = min_sample_count(telemetry);

  std::vector<const EntityTelemetry*> sources;
  std::vector<std::string> colors;
  for (const auto& [id, t] : telemetry) {
    if (t.samples.empty()) logger()->warn("frames: entity {} has no samples, omitted from every frame", id);
    seq.roster.push_back(id);
    sources.push_back(&t);
    colors.push_back(normalize_color(t.meta.color));
  }

  if (options.viz_bounds) {
    if (auto raw = observe_bounds(telemetry)) {
      seq.coordinate_map = fit_coordinate_map(*raw, *options.viz_bounds, options.preserve_aspect);
      if (seq.coordinate_map->collapsed_x() || seq.coordinate_map->collapsed_y()) {
        logger()->warn("frames: flat coordinate range (x {}, y {}), collapsed to target midpoint",
                       seq.coordinate_map->collapsed_x(), seq.coordinate_map->collapsed_y());
      }
    }
  }

  const std::size_t count = expected_frame_count(seq.min_raw_samples, options.sample_rate);
  const auto stride = static_cast<std::size_t>(options.sample_rate);
  seq.frames.reserve(count);
  for (std::size_t f = 0; f < count; ++f) {
    Frame frame;
    frame.index = f;
    frame.slots.reserve(sources.size());
    const std::size_t idx = f * stride;
    for (std::size_t k = 0; k < sources.size(); ++k) {
      const auto& src = *sources[k];
      if (idx >= src.samples.size()) { frame.slots.emplace_back(); continue; }
      const auto& s = src.samples[idx];
      EntityState st;
      st.x = seq.coordinate_map ? seq.coordinate_map->map_x(s.x) : s.x;
      st.y = seq.coordinate_map ? seq.coordinate_map->map_y(s.y) : s.y;
      st.speed = s.speed;
      st.lap = s.lap;
      st.code = src.meta.code;
      st.name = src.meta.name;
      st.team = src.meta.team;
      st.color = colors[k];
      frame.slots.emplace_back(std::move(st));
    }
    seq.frames.push_back(std::move(frame));
  }

  validate_frames(seq);
  logger()->info("frames: {} entities, {} frames (sample_rate {}, min raw samples {})",
                 seq.roster.size(), seq.frames.size(), seq.sample_rate, seq.min_raw_samples);
  return seq;
}

static void check_state(std::size_t i, const std::string& id, const EntityState& st) {
  auto finite = [&](double v, const char* field) {
    if (!std::isfinite(v)) throw FrameValidationError(i, id, field, "not a finite number");
  };
  auto present = [&](const std::string& v, const char* field) {
    if (v.empty()) throw FrameValidationError(i, id, field, "missing");
  };
  finite(st.x, "x");
  finite(st.y, "y");
  finite(st.speed, "speed");
  if (st.lap < 1) throw FrameValidationError(i, id, "lap", "must be >= 1, got " + std::to_string(st.lap));
  present(st.code, "code");
  present(st.name, "name");
  present(st.team, "team");
  present(st.color, "color");
}

void validate_frames(const FrameSequence& seq) {
  const std::size_t expected = expected_frame_count(seq.min_raw_samples, seq.sample_rate);
  if (seq.frames.size() != expected) {
    throw FrameValidationError(std::min(seq.frames.size(), expected), "", "frame_count",
                               "expected " + std::to_string(expected) + ", got " +
                               std::to_string(seq.frames.size()));
  }
  if (seq.frames.empty()) throw FrameValidationError(0, "", "frames", "no frames generated");

  for (std::size_t i = 0; i < seq.frames.size(); ++i) {
    const Frame& f = seq.frames[i];
    if (f.index != i) {
      throw FrameValidationError(i, "", "index", "frame carries index " + std::to_string(f.index));
    }
    if (f.slots.size() != seq.roster.size()) {
      throw FrameValidationError(i, "", "slots", "slot count does not match roster");
    }
    if (f.present_count() == 0) throw FrameValidationError(i, "", "entities", "no entity present");
    for (std::size_t k = 0; k < f.slots.size(); ++k) {
      if (f.slots[k]) check_state(i, seq.roster[k], *f.slots[k]);
    }
  }
}

} // namespace pitwall
