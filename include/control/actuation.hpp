#pragma once

#include <functional>
#include <optional>

namespace heat_agent::control {

struct ActuationLimits {
  double outlet_min_c{14.0};
  double outlet_max_c{65.0};
  double max_change_per_cycle_c{2.0};
};

// Clamps to the safety range and to at most max_change_per_cycle_c away from the baseline.
double limit_change(double desired_c, std::optional<double> baseline_c, const ActuationLimits& limits) noexcept;

// Picks floor or ceiling of the command, whichever the model predicts closer to target.
// Candidates outside the safety range or the per-cycle window are not used; if neither fits
// the command is returned unchanged.
double smart_round(double outlet_c, std::optional<double> baseline_c, const ActuationLimits& limits,
                   const std::function<double(double)>& predict_indoor_c, double target_c);

}  // namespace heat_agent::control
