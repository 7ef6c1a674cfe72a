#pragma once

#include <array>
#include <cstdint>
#include <vector>

#include "model/sensor_snapshot.hpp"

namespace heat_agent::model {

enum class heat_source_id : std::uint8_t {
  SOLAR = 0,
  SECONDARY_HEATER = 1,
  ELECTRONICS = 2,
};

const char* to_string(heat_source_id id) noexcept;

struct HeatContribution {
  heat_source_id source{heat_source_id::SOLAR};
  double kilowatts{0.0};
  // Same units as the numerator of the heat-balance equation.
  double heat_input{0.0};
  double confidence{0.0};
};

struct ContributionPlan {
  std::vector<HeatContribution> current{};
  std::array<double, kForecastSteps> projected_heat_input{};
  bool secondary_heater_active{false};

  [[nodiscard]] double total_heat_input() const noexcept {
    double total = 0.0;
    for (const HeatContribution& contribution : current) {
      total += contribution.heat_input;
    }
    return total;
  }
};

}  // namespace heat_agent::model
