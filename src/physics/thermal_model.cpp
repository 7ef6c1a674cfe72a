#include "physics/thermal_model.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "core/errors.hpp"

namespace heat_agent::physics {
namespace {
constexpr double kEnvelopeToleranceC = 1e-6;
}

double equilibrium_unchecked(const model::ThermalParameters& params, const double outlet_c, const double outdoor_c,
                             const double heat_input) noexcept {
  const double gain = params.outlet_effectiveness + params.heat_loss_coefficient;
  if (gain <= 0.0) {
    return outdoor_c;
  }
  return (params.outlet_effectiveness * outlet_c + params.heat_loss_coefficient * outdoor_c + heat_input) / gain;
}

bool within_physical_bounds(const model::ThermalParameters& params, const double equilibrium_c, const double outlet_c,
                            const double outdoor_c, const double heat_input) noexcept {
  const double gain = params.outlet_effectiveness + params.heat_loss_coefficient;
  if (!std::isfinite(equilibrium_c) || gain <= 0.0) {
    return false;
  }
  const double auxiliary_rise = std::max(0.0, heat_input) / gain;
  const double lower = std::min(outdoor_c, outlet_c) - kEnvelopeToleranceC;
  const double upper = std::max(outdoor_c, outlet_c) + auxiliary_rise + kEnvelopeToleranceC;
  return equilibrium_c >= lower && equilibrium_c <= upper;
}

double equilibrium(const model::ThermalParameters& params, const double outlet_c, const double outdoor_c,
                   const double heat_input) {
  if (!std::isfinite(outlet_c) || !std::isfinite(outdoor_c) || !std::isfinite(heat_input)) {
    throw core::ModelIntegrityFault("non-finite equilibrium input");
  }
  if (params.outlet_effectiveness <= 0.0 || params.heat_loss_coefficient <= 0.0) {
    throw core::ModelIntegrityFault("thermal gains must be positive");
  }
  if (heat_input < 0.0) {
    throw core::ModelIntegrityFault("auxiliary heat input must not be negative");
  }

  const double result = equilibrium_unchecked(params, outlet_c, outdoor_c, heat_input);
  if (!within_physical_bounds(params, result, outlet_c, outdoor_c, heat_input)) {
    std::ostringstream message;
    message << "equilibrium " << result << " outside envelope for outlet " << outlet_c << " outdoor " << outdoor_c;
    throw core::ModelIntegrityFault(message.str());
  }
  return result;
}

double approach(const double indoor_c, const double equilibrium_c, const double hours,
                const double time_constant_h) noexcept {
  if (hours <= 0.0 || time_constant_h <= 0.0) {
    return indoor_c;
  }
  return equilibrium_c + (indoor_c - equilibrium_c) * std::exp(-hours / time_constant_h);
}

double predict_indoor_delta(const model::ThermalParameters& params, const model::PredictionContext& context) noexcept {
  const double target = equilibrium_unchecked(params, context.outlet_c, context.outdoor_c, context.heat_input);
  return approach(context.start_indoor_c, target, context.horizon_hours, params.thermal_time_constant_h) -
         context.start_indoor_c;
}

}  // namespace heat_agent::physics
