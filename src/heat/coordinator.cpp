#include "heat/coordinator.hpp"

#include <algorithm>
#include <cmath>

#include "heat/occupancy_gain.hpp"
#include "heat/solar_gain.hpp"

namespace heat_agent::heat {
namespace {

double sanitize_kw(const double kw) noexcept {
  return std::isfinite(kw) ? std::max(0.0, kw) : 0.0;
}

}  // namespace

HeatSourceCoordinator::HeatSourceCoordinator(const core::AgentConfig& config,
                                             const model::SecondaryHeaterState& heater_state)
    : heat_units_per_kw_(config.physics.heat_units_per_kw), step_hours_(config.physics.trajectory_step_hours) {
  sources_.push_back(std::make_unique<SolarGain>(config.heat_sources.solar));

  auto heater = std::make_unique<SecondaryHeater>(config.heat_sources.secondary_heater, heater_state);
  secondary_heater_ = heater.get();
  sources_.push_back(std::move(heater));

  sources_.push_back(std::make_unique<OccupancyGain>(config.heat_sources.electronics));
}

model::ContributionPlan HeatSourceCoordinator::contributions(const model::SensorSnapshot& snapshot) {
  model::ContributionPlan plan{};
  plan.current.reserve(sources_.size());

  for (const auto& source : sources_) {
    const double kw = sanitize_kw(source->current_kw(snapshot));
    plan.current.push_back({source->id(), kw, kw * heat_units_per_kw_, source->confidence()});

    for (std::size_t step = 0; step < model::kForecastSteps; ++step) {
      const auto offset_s = static_cast<std::int64_t>(std::llround(static_cast<double>(step + 1) * step_hours_ * 3600.0));
      const double projected = sanitize_kw(source->projected_kw(snapshot, step, snapshot.timestamp_s + offset_s));
      plan.projected_heat_input[step] += projected * heat_units_per_kw_;
    }
  }

  plan.secondary_heater_active = secondary_heater_->active();
  return plan;
}

const model::SecondaryHeaterState& HeatSourceCoordinator::secondary_heater_state() const noexcept {
  return secondary_heater_->state();
}

}  // namespace heat_agent::heat
