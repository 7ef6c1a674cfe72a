#pragma once

#include <cstdint>

#include "model/control_status.hpp"
#include "model/ring_buffer.hpp"
#include "model/thermal_state.hpp"

namespace heat_agent::metrics {

// Derives the reportable health signals from the learning history.
class ConfidenceTracker {
 public:
  explicit ConfidenceTracker(model::ParameterBounds bounds) noexcept;

  void record_physics_check(bool within_bounds) noexcept;

  // A parameter pinned at its bound for consecutive cycles divides parameter_stability
  // by (1 + streak).
  [[nodiscard]] model::HealthSignals evaluate(const model::LearningState& state,
                                              std::uint32_t clamp_streak = 0) const;

 private:
  model::ParameterBounds bounds_;
  model::RingBuffer<bool, model::kPredictionHistory> physics_checks_{};
};

}  // namespace heat_agent::metrics
