#include "learning/parameter_learner.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <iostream>

#include "physics/thermal_model.hpp"

namespace heat_agent::learning {
namespace {

struct ParameterAxis {
  const char* name;
  double model::ThermalParameters::*field;
  const model::ParameterRange* range;
  double epsilon;
};

constexpr std::size_t kStabilityWindow = 3;
constexpr double kStableNormalisedDelta = 0.001;

}  // namespace

ParameterLearner::ParameterLearner(core::LearningConfig config, model::ParameterBounds bounds) noexcept
    : config_(config), bounds_(bounds) {}

std::vector<model::PredictionRecord> ParameterLearner::recent_window(const model::LearningState& state,
                                                                     const model::PredictionRecord& record) const {
  const std::size_t window = std::max<std::size_t>(1, config_.error_window);
  const std::size_t from_history = std::min(state.predictions.size(), window - 1);

  std::vector<model::PredictionRecord> recent;
  recent.reserve(from_history + 1);
  for (std::size_t i = state.predictions.size() - from_history; i < state.predictions.size(); ++i) {
    recent.push_back(state.predictions[i]);
  }
  recent.push_back(record);
  return recent;
}

double ParameterLearner::adaptive_rate(const model::ThermalParameters& params,
                                       const std::vector<model::PredictionRecord>& window,
                                       const model::ParameterHistory& updates) const noexcept {
  const double base = std::max(config_.base_rate, config_.min_rate);

  // Converged models take smaller steps.
  const double confidence_scale = 2.0 / (1.0 + std::max(0.0, params.learning_confidence));

  double abs_error_sum = 0.0;
  for (const auto& record : window) {
    abs_error_sum += std::fabs(record.error());
  }
  const double mean_abs_error = window.empty() ? 0.0 : abs_error_sum / static_cast<double>(window.size());

  double error_scale = 1.0;
  if (mean_abs_error > 2.0) {
    error_scale = 3.0;
  } else if (mean_abs_error > 1.0) {
    error_scale = 2.0;
  } else if (mean_abs_error > 0.5) {
    error_scale = 1.5;
  }

  double stability_scale = 1.0;
  if (updates.size() >= kStabilityWindow) {
    bool stable = true;
    for (std::size_t i = updates.size() - kStabilityWindow; i < updates.size(); ++i) {
      const model::ParameterUpdateRecord& update = updates[i];
      const double largest = std::max({std::fabs(update.time_constant_delta) / bounds_.time_constant_h.span(),
                                       std::fabs(update.heat_loss_delta) / bounds_.heat_loss.span(),
                                       std::fabs(update.effectiveness_delta) / bounds_.effectiveness.span()});
      if (largest >= kStableNormalisedDelta) {
        stable = false;
        break;
      }
    }
    if (stable) {
      stability_scale = 0.8;
    }
  }

  const double rate = base * confidence_scale * error_scale * stability_scale;
  return std::clamp(rate, config_.min_rate, config_.max_rate);
}

double ParameterLearner::updated_confidence(const double confidence,
                                            const std::vector<model::PredictionRecord>& window) const noexcept {
  double abs_error_sum = 0.0;
  std::size_t finite = 0;
  for (const auto& record : window) {
    const double error = record.error();
    if (std::isfinite(error)) {
      abs_error_sum += std::fabs(error);
      ++finite;
    }
  }

  const bool accurate = finite > 0 && (abs_error_sum / static_cast<double>(finite)) < config_.confidence_threshold_c;
  const double next = accurate ? confidence * config_.confidence_boost : confidence * config_.confidence_decay;
  return bounds_.confidence.clamp(next);
}

LearningStep ParameterLearner::update(const model::LearningState& state, const model::PredictionRecord& record) const {
  const model::ThermalParameters& current = state.parameters;
  const std::vector<model::PredictionRecord> window = recent_window(state, record);

  const std::array<ParameterAxis, 3> axes{{
      {"thermal_time_constant", &model::ThermalParameters::thermal_time_constant_h, &bounds_.time_constant_h,
       config_.epsilon_time_constant_h},
      {"heat_loss_coefficient", &model::ThermalParameters::heat_loss_coefficient, &bounds_.heat_loss,
       config_.epsilon_heat_loss},
      {"outlet_effectiveness", &model::ThermalParameters::outlet_effectiveness, &bounds_.effectiveness,
       config_.epsilon_effectiveness},
  }};

  LearningStep step{};
  step.parameters = current;
  step.learning_rate = adaptive_rate(current, window, state.parameter_updates);

  for (std::size_t axis_index = 0; axis_index < axes.size(); ++axis_index) {
    const ParameterAxis& axis = axes[axis_index];
    const double span = axis.range->span();

    double gradient_sum = 0.0;
    std::size_t samples = 0;
    for (const auto& sample : window) {
      model::ThermalParameters plus = current;
      model::ThermalParameters minus = current;
      plus.*axis.field += axis.epsilon;
      minus.*axis.field -= axis.epsilon;

      const double sensitivity = (physics::predict_indoor_delta(plus, sample.context) -
                                  physics::predict_indoor_delta(minus, sample.context)) /
                                 (2.0 * axis.epsilon);
      const double residual = physics::predict_indoor_delta(current, sample.context) - sample.actual_indoor_delta;
      const double contribution = residual * sensitivity * span;
      if (!std::isfinite(contribution)) {
        continue;
      }
      gradient_sum += contribution;
      ++samples;
    }

    if (samples == 0) {
      continue;
    }

    const double gradient = gradient_sum / static_cast<double>(samples);
    const double normalised_step =
        std::clamp(-step.learning_rate * gradient, -config_.max_step_fraction, config_.max_step_fraction);
    const double proposed = current.*axis.field + normalised_step * span;
    const double clamped = axis.range->clamp(proposed);
    step.parameters.*axis.field = clamped;

    if (proposed != clamped || !axis.range->contains(current.*axis.field)) {
      step.clamped.emplace_back(axis.name);
      step.axis_clamped[axis_index] = true;
      if (clamp_streaks_[axis_index] + 1 >= config_.clamp_warning_cycles) {
        step.stability_warning = true;
      }
    }
  }

  step.parameters.learning_confidence = updated_confidence(current.learning_confidence, window);

  model::ParameterUpdateRecord audit{};
  audit.timestamp_s = record.timestamp_s;
  audit.time_constant_delta = step.parameters.thermal_time_constant_h - current.thermal_time_constant_h;
  audit.heat_loss_delta = step.parameters.heat_loss_coefficient - current.heat_loss_coefficient;
  audit.effectiveness_delta = step.parameters.outlet_effectiveness - current.outlet_effectiveness;
  audit.learning_rate = step.learning_rate;
  audit.confidence = step.parameters.learning_confidence;
  step.update = audit;

  return step;
}

void ParameterLearner::commit(const LearningStep& step) {
  static constexpr std::array<const char*, 3> kAxisNames{"thermal_time_constant", "heat_loss_coefficient",
                                                         "outlet_effectiveness"};
  for (std::size_t axis_index = 0; axis_index < clamp_streaks_.size(); ++axis_index) {
    if (!step.axis_clamped[axis_index]) {
      clamp_streaks_[axis_index] = 0;
      continue;
    }
    ++clamp_streaks_[axis_index];
    if (clamp_streaks_[axis_index] == config_.clamp_warning_cycles) {
      std::cerr << "[learner] " << kAxisNames[axis_index] << " pinned at bound for " << clamp_streaks_[axis_index]
                << " consecutive cycles\n";
    }
  }
}

std::uint32_t ParameterLearner::longest_clamp_streak() const noexcept {
  return *std::max_element(clamp_streaks_.begin(), clamp_streaks_.end());
}

}  // namespace heat_agent::learning
