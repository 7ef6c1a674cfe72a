#include "metrics/confidence_tracker.hpp"

#include <array>
#include <cmath>
#include <cstddef>
#include <vector>

#include "core/math.hpp"

namespace heat_agent::metrics {
namespace {

constexpr std::size_t kStabilityWindow = 20;
// Normalised-delta variance at which stability reads 0.5.
constexpr double kStabilityVarianceScale = 1e-4;
// Error variance (C^2) at which consistency reads 0.5.
constexpr double kConsistencyVarianceScale = 0.25;
constexpr double kProgressSlopeGain = 10.0;

}  // namespace

ConfidenceTracker::ConfidenceTracker(model::ParameterBounds bounds) noexcept : bounds_(bounds) {}

void ConfidenceTracker::record_physics_check(const bool within_bounds) noexcept {
  physics_checks_.push(within_bounds);
}

model::HealthSignals ConfidenceTracker::evaluate(const model::LearningState& state,
                                                const std::uint32_t clamp_streak) const {
  model::HealthSignals signals{};

  const model::ParameterHistory& updates = state.parameter_updates;
  const std::size_t update_count = updates.size() < kStabilityWindow ? updates.size() : kStabilityWindow;
  std::vector<double> time_constant_deltas;
  std::vector<double> heat_loss_deltas;
  std::vector<double> effectiveness_deltas;
  std::vector<double> confidence_trend;
  for (std::size_t i = updates.size() - update_count; i < updates.size(); ++i) {
    time_constant_deltas.push_back(updates[i].time_constant_delta / bounds_.time_constant_h.span());
    heat_loss_deltas.push_back(updates[i].heat_loss_delta / bounds_.heat_loss.span());
    effectiveness_deltas.push_back(updates[i].effectiveness_delta / bounds_.effectiveness.span());
    confidence_trend.push_back(updates[i].confidence);
  }
  const double delta_variance = (core::variance(time_constant_deltas) + core::variance(heat_loss_deltas) +
                                 core::variance(effectiveness_deltas)) /
                                3.0;
  signals.parameter_stability =
      1.0 / ((1.0 + delta_variance / kStabilityVarianceScale) * (1.0 + static_cast<double>(clamp_streak)));

  std::vector<double> errors;
  errors.reserve(state.predictions.size());
  double abs_sum = 0.0;
  double square_sum = 0.0;
  std::array<std::size_t, model::kAccuracyBandsC.size()> within{};
  for (std::size_t i = 0; i < state.predictions.size(); ++i) {
    const double error = state.predictions[i].error();
    if (!std::isfinite(error)) {
      continue;
    }
    errors.push_back(error);
    abs_sum += std::fabs(error);
    square_sum += error * error;
    for (std::size_t band = 0; band < model::kAccuracyBandsC.size(); ++band) {
      if (std::fabs(error) <= model::kAccuracyBandsC[band]) {
        ++within[band];
      }
    }
  }
  signals.prediction_consistency = 1.0 / (1.0 + core::variance(errors) / kConsistencyVarianceScale);
  if (!errors.empty()) {
    const double n = static_cast<double>(errors.size());
    signals.mae_c = abs_sum / n;
    signals.rmse_c = std::sqrt(square_sum / n);
    for (std::size_t band = 0; band < within.size(); ++band) {
      signals.within_band[band] = static_cast<double>(within[band]) / n;
    }
  }

  std::size_t violations = 0;
  for (std::size_t i = 0; i < physics_checks_.size(); ++i) {
    if (!physics_checks_[i]) {
      ++violations;
    }
  }
  signals.physics_alignment =
      physics_checks_.empty()
          ? 1.0
          : 1.0 - static_cast<double>(violations) / static_cast<double>(physics_checks_.size());

  signals.model_health = core::clamp01((0.4 * signals.prediction_consistency) + (0.3 * signals.parameter_stability) +
                                       (0.3 * signals.physics_alignment));

  signals.learning_progress = core::clamp01(0.5 + kProgressSlopeGain * core::index_slope(confidence_trend));

  return signals;
}

}  // namespace heat_agent::metrics
