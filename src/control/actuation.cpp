#include "control/actuation.hpp"

#include <algorithm>
#include <cmath>

namespace heat_agent::control {
namespace {
constexpr double kWindowToleranceC = 1e-9;
}

double limit_change(const double desired_c, const std::optional<double> baseline_c,
                    const ActuationLimits& limits) noexcept {
  double command = desired_c;
  if (baseline_c.has_value()) {
    command = std::clamp(command, *baseline_c - limits.max_change_per_cycle_c,
                         *baseline_c + limits.max_change_per_cycle_c);
  }
  return std::clamp(command, limits.outlet_min_c, limits.outlet_max_c);
}

double smart_round(const double outlet_c, const std::optional<double> baseline_c, const ActuationLimits& limits,
                   const std::function<double(double)>& predict_indoor_c, const double target_c) {
  const auto admissible = [&](const double candidate) {
    if (candidate < limits.outlet_min_c || candidate > limits.outlet_max_c) {
      return false;
    }
    if (baseline_c.has_value() &&
        std::fabs(candidate - *baseline_c) > limits.max_change_per_cycle_c + kWindowToleranceC) {
      return false;
    }
    return true;
  };

  const double floor_c = std::floor(outlet_c);
  const double ceil_c = std::ceil(outlet_c);
  const bool floor_ok = admissible(floor_c);
  const bool ceil_ok = admissible(ceil_c);

  if (floor_ok && ceil_ok) {
    if (floor_c == ceil_c) {
      return floor_c;
    }
    const double floor_error = std::fabs(predict_indoor_c(floor_c) - target_c);
    const double ceil_error = std::fabs(predict_indoor_c(ceil_c) - target_c);
    return floor_error <= ceil_error ? floor_c : ceil_c;
  }
  if (floor_ok) {
    return floor_c;
  }
  if (ceil_ok) {
    return ceil_c;
  }
  return outlet_c;
}

}  // namespace heat_agent::control
