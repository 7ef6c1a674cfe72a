#pragma once

#include "model/thermal_state.hpp"

namespace heat_agent::physics {

// Steady-state indoor temperature of the heat balance
//   (effectiveness * outlet + heat_loss * outdoor + heat_input) / (effectiveness + heat_loss).
// Throws core::ModelIntegrityFault for non-finite inputs, non-positive gains, or a result outside
// [min(outdoor, outlet), max(outdoor, outlet) + heat_input / (effectiveness + heat_loss)].
double equilibrium(const model::ThermalParameters& params, double outlet_c, double outdoor_c, double heat_input);

// Same equation without the integrity check. Used where parameters are deliberately perturbed.
double equilibrium_unchecked(const model::ThermalParameters& params, double outlet_c, double outdoor_c,
                             double heat_input) noexcept;

// First-order approach toward equilibrium after `hours`.
double approach(double indoor_c, double equilibrium_c, double hours, double time_constant_h) noexcept;

// Indoor change over the context horizon with the context's outlet held constant.
double predict_indoor_delta(const model::ThermalParameters& params, const model::PredictionContext& context) noexcept;

// Energy-conservation envelope check; returns false when the equilibrium is implausible.
bool within_physical_bounds(const model::ThermalParameters& params, double equilibrium_c, double outlet_c,
                            double outdoor_c, double heat_input) noexcept;

}  // namespace heat_agent::physics
