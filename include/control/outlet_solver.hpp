#pragma once

#include <cstdint>
#include <optional>

#include "core/config.hpp"
#include "model/heat_contribution.hpp"
#include "model/sensor_snapshot.hpp"
#include "model/thermal_state.hpp"
#include "physics/features.hpp"
#include "physics/trajectory.hpp"

namespace heat_agent::control {

struct SolveResult {
  double outlet_c{0.0};
  double predicted_equilibrium_c{0.0};
  // End of the horizon if the scoring conditions held for every step.
  double assumed_horizon_indoor_c{0.0};
  std::uint32_t iterations{0};
  // False when the iteration cap ended the search before the resolution was reached.
  bool converged{true};
  double domain_min_c{0.0};
  double domain_max_c{0.0};
  physics::ForecastFeatures features{};
};

struct SolverOptions {
  double outlet_min_c{14.0};
  double outlet_max_c{65.0};
  double min_outlet_above_outdoor_c{0.0};
  double resolution_c{0.1};
  std::uint32_t max_iterations{20};
  physics::FeatureOptions features{};
};

SolverOptions make_solver_options(const core::AgentConfig& config);

// Binary search over the admissible outlet domain for the command whose predicted
// equilibrium lands on the target.
class OutletSolver {
 public:
  explicit OutletSolver(SolverOptions options) noexcept;

  // Throws core::ModelIntegrityFault when the model leaves its physical envelope.
  // Once the bracket converges around the target, the end nearer previous_applied_c wins.
  SolveResult solve(const model::SensorSnapshot& snapshot, const model::ContributionPlan& contributions,
                    const model::ThermalParameters& params, double target_c,
                    std::optional<double> previous_applied_c = std::nullopt) const;

  [[nodiscard]] const SolverOptions& options() const noexcept { return options_; }

 private:
  SolverOptions options_;
};

}  // namespace heat_agent::control
