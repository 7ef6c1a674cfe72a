#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "model/thermal_state.hpp"

namespace heat_agent::learning {

struct LearningStep {
  model::ThermalParameters parameters{};
  std::optional<model::ParameterUpdateRecord> update{};
  double learning_rate{0.0};
  std::vector<std::string> clamped{};
  // time constant, heat loss, effectiveness
  std::array<bool, 3> axis_clamped{};
  // Set when committing this step completes a clamp streak of clamp_warning_cycles.
  bool stability_warning{false};
};

// Online gradient descent on one-cycle indoor-delta predictions.
// Gradients are central finite differences, taken in coordinates normalised to each
// parameter's bound span so that one rate fits all three parameters.
class ParameterLearner {
 public:
  ParameterLearner(core::LearningConfig config, model::ParameterBounds bounds) noexcept;

  // `record` is the newest observation and is not yet part of `state.predictions`.
  // The caller owns committing the returned parameters and audit entry, and calls
  // commit() once the step is accepted. Discarded steps leave the clamp streaks untouched.
  [[nodiscard]] LearningStep update(const model::LearningState& state, const model::PredictionRecord& record) const;

  void commit(const LearningStep& step);

  [[nodiscard]] double adaptive_rate(const model::ThermalParameters& params,
                                     const std::vector<model::PredictionRecord>& window,
                                     const model::ParameterHistory& updates) const noexcept;

  [[nodiscard]] const std::array<std::uint32_t, 3>& clamp_streaks() const noexcept { return clamp_streaks_; }
  [[nodiscard]] std::uint32_t longest_clamp_streak() const noexcept;

 private:
  std::vector<model::PredictionRecord> recent_window(const model::LearningState& state,
                                                     const model::PredictionRecord& record) const;
  double updated_confidence(double confidence, const std::vector<model::PredictionRecord>& window) const noexcept;

  core::LearningConfig config_;
  model::ParameterBounds bounds_;
  std::array<std::uint32_t, 3> clamp_streaks_{};
};

}  // namespace heat_agent::learning
