#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace pitwall {

// Root of every typed failure raised by the core. All of them are local and
// recoverable by the caller; none is transient, so nothing here is retried.
class PitwallError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Too few usable historical laps to build a profile.
class InsufficientDataError : public PitwallError {
public:
  InsufficientDataError(std::size_t remaining, std::size_t required)
    : PitwallError("insufficient lap data: " + std::to_string(remaining) +
                   " valid laps remain, " + std::to_string(required) + " required"),
      remaining_(remaining), required_(required) {}

  std::size_t remaining() const noexcept { return remaining_; }
  std::size_t required() const noexcept { return required_; }

private:
  std::size_t remaining_;
  std::size_t required_;
};

// Malformed simulation / preprocessing parameters. entity and lap are filled
// when the problem is tied to a specific element (lap == 0 means "none").
class InvalidConfigurationError : public PitwallError {
public:
  explicit InvalidConfigurationError(const std::string& what,
                                     std::string entity = {},
                                     int lap = 0)
    : PitwallError(decorate_(what, entity, lap)), entity_(std::move(entity)), lap_(lap) {}

  const std::string& entity() const noexcept { return entity_; }
  int lap() const noexcept { return lap_; }

private:
  static std::string decorate_(const std::string& what, const std::string& entity, int lap) {
    std::string msg = "invalid configuration: " + what;
    if (!entity.empty()) msg += " (entity " + entity + ")";
    if (lap != 0) msg += " (lap " + std::to_string(lap) + ")";
    return msg;
  }

  std::string entity_;
  int lap_;
};

// A preprocessed frame sequence failed structural validation.
class FrameValidationError : public PitwallError {
public:
  FrameValidationError(std::size_t frame_index, std::string entity, std::string field,
                       const std::string& detail)
    : PitwallError("frame " + std::to_string(frame_index) +
                   (entity.empty() ? std::string{} : ", entity " + entity) +
                   ": " + field + ": " + detail),
      frame_index_(frame_index), entity_(std::move(entity)), field_(std::move(field)) {}

  std::size_t frame_index() const noexcept { return frame_index_; }
  const std::string& entity() const noexcept { return entity_; }
  const std::string& field() const noexcept { return field_; }

private:
  std::size_t frame_index_;
  std::string entity_;
  std::string field_;
};

// Raw coordinate range collapsed to a single value on one axis.
class DegenerateRangeError : public PitwallError {
public:
  DegenerateRangeError(char axis, double value)
    : PitwallError(std::string("degenerate range on axis ") + axis +
                   ": min == max == " + std::to_string(value)),
      axis_(axis), value_(value) {}

  char axis() const noexcept { return axis_; }
  double value() const noexcept { return value_; }

private:
  char axis_;
  double value_;
};

} // namespace pitwall
