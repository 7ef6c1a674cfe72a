#pragma once

#include <memory>
#include <vector>

#include "core/config.hpp"
#include "heat/heat_source.hpp"
#include "heat/secondary_heater.hpp"
#include "model/heat_contribution.hpp"
#include "model/sensor_snapshot.hpp"

namespace heat_agent::heat {

// Sums independent source contributions; the heat balance consumes the total additively.
class HeatSourceCoordinator {
 public:
  HeatSourceCoordinator(const core::AgentConfig& config, const model::SecondaryHeaterState& heater_state);

  model::ContributionPlan contributions(const model::SensorSnapshot& snapshot);

  [[nodiscard]] const model::SecondaryHeaterState& secondary_heater_state() const noexcept;

 private:
  double heat_units_per_kw_{0.5};
  double step_hours_{1.0};
  std::vector<std::unique_ptr<HeatSource>> sources_{};
  SecondaryHeater* secondary_heater_{nullptr};
};

}  // namespace heat_agent::heat
