#include <cmath>
#include <iostream>
#include <limits>
#include <vector>

#include "core/config.hpp"
#include "learning/parameter_learner.hpp"
#include "metrics/confidence_tracker.hpp"
#include "physics/thermal_model.hpp"

using heat_agent::core::LearningConfig;
using heat_agent::learning::LearningStep;
using heat_agent::learning::ParameterLearner;
using heat_agent::metrics::ConfidenceTracker;
using heat_agent::model::HealthSignals;
using heat_agent::model::LearningState;
using heat_agent::model::ParameterBounds;
using heat_agent::model::ParameterHistory;
using heat_agent::model::PredictionContext;
using heat_agent::model::PredictionRecord;
using heat_agent::model::ThermalParameters;

namespace {

bool almost_equal(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) <= eps;
}

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

PredictionContext context_for(std::size_t i) {
  PredictionContext context{};
  context.start_indoor_c = 19.5 + 0.1 * static_cast<double>(i % 10);
  context.outlet_c = 25.0 + 2.0 * static_cast<double>(i % 11);
  context.outdoor_c = -5.0 + 1.5 * static_cast<double>(i % 7);
  context.heat_input = 0.1 * static_cast<double>(i % 3);
  context.horizon_hours = 0.5;
  return context;
}

PredictionRecord record_for(const ThermalParameters& current, const PredictionContext& context, double actual_delta,
                            std::int64_t timestamp_s) {
  PredictionRecord record{};
  record.timestamp_s = timestamp_s;
  record.context = context;
  record.predicted_indoor_delta = heat_agent::physics::predict_indoor_delta(current, context);
  record.actual_indoor_delta = actual_delta;
  return record;
}

void commit(LearningState& state, const PredictionRecord& record, const LearningStep& step) {
  state.predictions.push(record);
  state.parameters = step.parameters;
  if (step.update.has_value()) {
    state.parameter_updates.push(*step.update);
  }
  ++state.cycle_count;
}

bool inside(const ParameterBounds& bounds, const ThermalParameters& params) {
  return std::isfinite(params.thermal_time_constant_h) && std::isfinite(params.heat_loss_coefficient) &&
         std::isfinite(params.outlet_effectiveness) && std::isfinite(params.learning_confidence) &&
         bounds.time_constant_h.contains(params.thermal_time_constant_h) &&
         bounds.heat_loss.contains(params.heat_loss_coefficient) &&
         bounds.effectiveness.contains(params.outlet_effectiveness) &&
         bounds.confidence.contains(params.learning_confidence);
}

int test_parameters_stay_bounded_under_adversarial_errors() {
  const LearningConfig config{};
  const ParameterBounds bounds{};
  ParameterLearner learner(config, bounds);
  LearningState state{};

  for (std::size_t i = 0; i < 300; ++i) {
    double actual = (i % 2 == 0) ? 1e6 : -1e6;
    if (i % 5 == 0) {
      actual = std::numeric_limits<double>::quiet_NaN();
    }
    const PredictionRecord record = record_for(state.parameters, context_for(i), actual, static_cast<std::int64_t>(i));
    const LearningStep step = learner.update(state, record);
    if (!inside(bounds, step.parameters)) {
      return fail("test_parameters_stay_bounded_under_adversarial_errors", "parameters left their bounds");
    }
    commit(state, record, step);
  }

  if (state.predictions.size() != heat_agent::model::kPredictionHistory ||
      state.parameter_updates.size() != heat_agent::model::kParameterHistory) {
    return fail("test_parameters_stay_bounded_under_adversarial_errors", "histories should be capped");
  }
  return 0;
}

int test_learning_reduces_prediction_error() {
  const LearningConfig config{};
  const ParameterBounds bounds{};
  ParameterLearner learner(config, bounds);
  LearningState state{};

  ThermalParameters truth{};
  truth.outlet_effectiveness = 0.55;

  double early_error = 0.0;
  double late_error = 0.0;
  const std::size_t cycles = 400;
  for (std::size_t i = 0; i < cycles; ++i) {
    const PredictionContext context = context_for(i);
    const double actual = heat_agent::physics::predict_indoor_delta(truth, context);
    const PredictionRecord record = record_for(state.parameters, context, actual, static_cast<std::int64_t>(i));
    if (i < 20) {
      early_error += std::fabs(record.error());
    } else if (i >= cycles - 20) {
      late_error += std::fabs(record.error());
    }
    commit(state, record, learner.update(state, record));
  }

  if (!(late_error < early_error)) {
    return fail("test_learning_reduces_prediction_error", "late error should be below early error");
  }
  if (!(state.parameters.outlet_effectiveness > 0.40)) {
    return fail("test_learning_reduces_prediction_error", "effectiveness should move toward the true value");
  }
  return 0;
}

int test_adaptive_rate_scaling() {
  LearningConfig config{};
  const ParameterBounds bounds{};
  const ParameterLearner learner(config, bounds);
  const ParameterHistory no_updates{};

  ThermalParameters params{};
  params.learning_confidence = 3.0;

  PredictionRecord accurate{};
  PredictionRecord poor{};
  poor.actual_indoor_delta = 3.0;

  const double calm = learner.adaptive_rate(params, {accurate}, no_updates);
  if (!almost_equal(calm, 0.05 * 2.0 / 4.0)) {
    return fail("test_adaptive_rate_scaling", "calm rate should be base scaled by confidence");
  }

  const double large_error = learner.adaptive_rate(params, {poor}, no_updates);
  if (!almost_equal(large_error, 0.05 * 2.0 / 4.0 * 3.0)) {
    return fail("test_adaptive_rate_scaling", "errors above 2C should triple the rate");
  }

  params.learning_confidence = 0.1;
  const double unsure = learner.adaptive_rate(params, {accurate}, no_updates);
  if (!(unsure > calm)) {
    return fail("test_adaptive_rate_scaling", "low confidence should learn faster");
  }

  config.max_rate = 0.06;
  const ParameterLearner capped(config, bounds);
  if (!almost_equal(capped.adaptive_rate(params, {poor}, no_updates), 0.06)) {
    return fail("test_adaptive_rate_scaling", "rate should be clipped to max_rate");
  }

  ParameterHistory still{};
  for (int i = 0; i < 3; ++i) {
    still.push(heat_agent::model::ParameterUpdateRecord{});
  }
  params.learning_confidence = 3.0;
  if (!almost_equal(learner.adaptive_rate(params, {accurate}, still), calm * 0.8)) {
    return fail("test_adaptive_rate_scaling", "stable parameters should damp the rate");
  }
  return 0;
}

int test_confidence_boost_and_decay() {
  const LearningConfig config{};
  const ParameterBounds bounds{};

  {
    ParameterLearner learner(config, bounds);
    const LearningState state{};
    const PredictionContext context = context_for(3);
    const double exact = heat_agent::physics::predict_indoor_delta(state.parameters, context);
    const LearningStep step = learner.update(state, record_for(state.parameters, context, exact, 1));
    if (!almost_equal(step.parameters.learning_confidence, 3.0 * 1.1)) {
      return fail("test_confidence_boost_and_decay", "accurate window should boost confidence");
    }
  }

  {
    ParameterLearner learner(config, bounds);
    const LearningState state{};
    const PredictionContext context = context_for(3);
    const double off = heat_agent::physics::predict_indoor_delta(state.parameters, context) + 1.0;
    const LearningStep step = learner.update(state, record_for(state.parameters, context, off, 1));
    if (!almost_equal(step.parameters.learning_confidence, 3.0 * 0.98)) {
      return fail("test_confidence_boost_and_decay", "inaccurate window should decay confidence");
    }
  }

  {
    ParameterLearner learner(config, bounds);
    LearningState state{};
    state.parameters.learning_confidence = 4.9;
    const PredictionContext context = context_for(3);
    const double exact = heat_agent::physics::predict_indoor_delta(state.parameters, context);
    const LearningStep step = learner.update(state, record_for(state.parameters, context, exact, 1));
    if (!almost_equal(step.parameters.learning_confidence, bounds.confidence.max)) {
      return fail("test_confidence_boost_and_decay", "confidence should saturate at its bound");
    }
  }
  return 0;
}

int test_clamp_streak_raises_stability_warning() {
  LearningConfig config{};
  config.clamp_warning_cycles = 3;
  const ParameterBounds bounds{};
  ParameterLearner learner(config, bounds);

  LearningState state{};
  state.parameters.heat_loss_coefficient = 0.5;

  for (std::size_t i = 0; i < 3; ++i) {
    LearningState attempt = state;
    const PredictionRecord record = record_for(attempt.parameters, context_for(i), 0.2, static_cast<std::int64_t>(i));
    const LearningStep step = learner.update(attempt, record);
    learner.commit(step);
    if (step.clamped.empty() || step.clamped.front() != "heat_loss_coefficient") {
      return fail("test_clamp_streak_raises_stability_warning", "out-of-range parameter should be clamped");
    }
    if (step.stability_warning != (i == 2)) {
      return fail("test_clamp_streak_raises_stability_warning", "warning should fire on the third clamp");
    }
    if (!bounds.heat_loss.contains(step.parameters.heat_loss_coefficient)) {
      return fail("test_clamp_streak_raises_stability_warning", "clamped value must be in bounds");
    }
  }
  return 0;
}

int test_discarded_step_keeps_clamp_streak() {
  LearningConfig config{};
  config.clamp_warning_cycles = 3;
  ParameterLearner learner(config, ParameterBounds{});

  LearningState state{};
  state.parameters.heat_loss_coefficient = 0.5;
  const auto step_at = [&](std::size_t i) {
    return learner.update(state, record_for(state.parameters, context_for(i), 0.2, static_cast<std::int64_t>(i)));
  };

  learner.commit(step_at(0));
  learner.commit(step_at(1));
  // A step rejected by the cycle (e.g. the solve faulted) is never committed.
  const LearningStep rejected = step_at(2);
  if (!rejected.stability_warning || learner.clamp_streaks()[1] != 2) {
    return fail("test_discarded_step_keeps_clamp_streak", "an uncommitted step must not advance the streak");
  }

  LearningState healthy{};
  const PredictionContext context = context_for(3);
  const double exact = heat_agent::physics::predict_indoor_delta(healthy.parameters, context);
  learner.commit(learner.update(healthy, record_for(healthy.parameters, context, exact, 3)));
  if (learner.longest_clamp_streak() != 0) {
    return fail("test_discarded_step_keeps_clamp_streak", "an unclamped commit should reset the streak");
  }
  return 0;
}

int test_clamp_streak_lowers_parameter_stability() {
  ConfidenceTracker tracker(ParameterBounds{});
  const LearningState state{};
  const HealthSignals settled = tracker.evaluate(state);
  const HealthSignals pinned = tracker.evaluate(state, 3);
  if (!almost_equal(pinned.parameter_stability, settled.parameter_stability / 4.0)) {
    return fail("test_clamp_streak_lowers_parameter_stability", "a 3-cycle streak should quarter stability");
  }
  if (!(pinned.model_health < settled.model_health)) {
    return fail("test_clamp_streak_lowers_parameter_stability", "model health should drop with stability");
  }
  return 0;
}

int test_health_signals() {
  const ParameterBounds bounds{};
  ConfidenceTracker tracker(bounds);

  LearningState empty{};
  const HealthSignals fresh = tracker.evaluate(empty);
  if (!almost_equal(fresh.model_health, 1.0) || !almost_equal(fresh.physics_alignment, 1.0)) {
    return fail("test_health_signals", "a fresh model should read fully healthy");
  }

  LearningState state{};
  const double errors[] = {0.05, -0.15, 0.4, -0.8, 1.5};
  for (const double error : errors) {
    PredictionRecord record{};
    record.actual_indoor_delta = error;
    state.predictions.push(record);
  }

  tracker.record_physics_check(true);
  tracker.record_physics_check(true);
  tracker.record_physics_check(true);
  tracker.record_physics_check(false);

  const HealthSignals signals = tracker.evaluate(state);
  if (!almost_equal(signals.mae_c, (0.05 + 0.15 + 0.4 + 0.8 + 1.5) / 5.0)) {
    return fail("test_health_signals", "unexpected MAE");
  }
  if (!almost_equal(signals.within_band[0], 0.2) || !almost_equal(signals.within_band[1], 0.4) ||
      !almost_equal(signals.within_band[2], 0.6) || !almost_equal(signals.within_band[3], 0.8)) {
    return fail("test_health_signals", "unexpected accuracy band fractions");
  }
  if (!almost_equal(signals.physics_alignment, 0.75)) {
    return fail("test_health_signals", "one violation in four checks should read 0.75");
  }
  if (!(signals.rmse_c >= signals.mae_c) || !(signals.prediction_consistency < 1.0)) {
    return fail("test_health_signals", "scattered errors should lower consistency");
  }
  if (signals.model_health < 0.0 || signals.model_health > 1.0) {
    return fail("test_health_signals", "model health must be a fraction");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_parameters_stay_bounded_under_adversarial_errors(); rc != 0) return rc;
  if (int rc = test_learning_reduces_prediction_error(); rc != 0) return rc;
  if (int rc = test_adaptive_rate_scaling(); rc != 0) return rc;
  if (int rc = test_confidence_boost_and_decay(); rc != 0) return rc;
  if (int rc = test_clamp_streak_raises_stability_warning(); rc != 0) return rc;
  if (int rc = test_discarded_step_keeps_clamp_streak(); rc != 0) return rc;
  if (int rc = test_clamp_streak_lowers_parameter_stability(); rc != 0) return rc;
  if (int rc = test_health_signals(); rc != 0) return rc;

  std::cout << "[PASS] learning unit tests\n";
  return 0;
}
