#include "control/outlet_solver.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

#include "physics/thermal_model.hpp"

namespace heat_agent::control {
namespace {

// Scoring conditions: the first forecast step, i.e. the conditions the next cycle will see.
struct ScoringConditions {
  double outdoor_c;
  double heat_input;
};

ScoringConditions scoring_conditions(const physics::ForecastFeatures& features) noexcept {
  return {features.outdoor_c[0], features.heat_input[0]};
}

}  // namespace

SolverOptions make_solver_options(const core::AgentConfig& config) {
  SolverOptions options{};
  options.outlet_min_c = config.control.outlet_min_c;
  options.outlet_max_c = config.control.outlet_max_c;
  options.min_outlet_above_outdoor_c = config.control.min_outlet_above_outdoor_c;
  options.resolution_c = config.control.search_resolution_c;
  options.max_iterations = config.control.max_search_iterations;
  options.features.step_hours = config.physics.trajectory_step_hours;
  options.features.steps = static_cast<std::size_t>(
      std::llround(config.physics.trajectory_horizon_hours / config.physics.trajectory_step_hours));
  options.features.max_forecast_age = config.heat_sources.solar.max_forecast_age;
  return options;
}

OutletSolver::OutletSolver(SolverOptions options) noexcept : options_(options) {}

SolveResult OutletSolver::solve(const model::SensorSnapshot& snapshot, const model::ContributionPlan& contributions,
                                const model::ThermalParameters& params, const double target_c,
                                const std::optional<double> previous_applied_c) const {
  SolveResult result{};
  // Captured once; every candidate is scored against the same features.
  result.features = physics::capture_features(snapshot, contributions, options_.features);
  const ScoringConditions conditions = scoring_conditions(result.features);

  double low = options_.outlet_min_c;
  if (options_.min_outlet_above_outdoor_c > 0.0) {
    low = std::max(low, snapshot.outdoor_c + options_.min_outlet_above_outdoor_c);
  }
  low = std::min(low, options_.outlet_max_c);
  double high = options_.outlet_max_c;
  result.domain_min_c = low;
  result.domain_max_c = high;

  bool have_best = false;
  double best_outlet = low;
  double best_score = 0.0;
  double best_equilibrium = 0.0;

  const auto consider = [&](const double candidate) {
    const double predicted = physics::equilibrium(params, candidate, conditions.outdoor_c, conditions.heat_input);
    const double score = std::fabs(predicted - target_c);
    if (!have_best || score < best_score) {
      have_best = true;
      best_outlet = candidate;
      best_score = score;
      best_equilibrium = predicted;
    }
    return predicted;
  };

  double low_equilibrium = consider(low);
  double high_equilibrium = consider(high);

  std::uint32_t iterations = 0;
  while ((high - low) > options_.resolution_c && iterations < options_.max_iterations) {
    const double mid = 0.5 * (low + high);
    const double predicted = consider(mid);
    if (predicted < target_c) {
      low = mid;
      low_equilibrium = predicted;
    } else {
      high = mid;
      high_equilibrium = predicted;
    }
    ++iterations;
  }

  if ((high - low) > options_.resolution_c) {
    result.converged = false;
    std::cerr << "[solver] iteration cap reached with bracket " << (high - low) << " C; using best candidate\n";
  } else if (previous_applied_c.has_value() && low_equilibrium <= target_c && high_equilibrium >= target_c) {
    // Both ends of a converged bracket around the target are within resolution; keep the
    // one nearer the command already in force.
    const bool keep_low = std::fabs(low - *previous_applied_c) <= std::fabs(high - *previous_applied_c);
    best_outlet = keep_low ? low : high;
    best_equilibrium = keep_low ? low_equilibrium : high_equilibrium;
  }

  result.outlet_c = best_outlet;
  result.predicted_equilibrium_c = best_equilibrium;
  result.iterations = iterations;

  physics::ForecastFeatures assumed = result.features;
  assumed.outdoor_c.fill(conditions.outdoor_c);
  assumed.heat_input.fill(conditions.heat_input);
  result.assumed_horizon_indoor_c = physics::Trajectory(params, assumed, best_outlet).final_point().indoor_c;
  return result;
}

}  // namespace heat_agent::control
