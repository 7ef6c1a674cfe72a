#pragma once

#include <cstddef>
#include <cstdint>

#include "model/heat_contribution.hpp"
#include "model/sensor_snapshot.hpp"

namespace heat_agent::heat {

class HeatSource {
 public:
  virtual model::heat_source_id id() const noexcept = 0;
  // Present contribution in kW. Sources with detectors update them here, once per cycle.
  virtual double current_kw(const model::SensorSnapshot& snapshot) = 0;
  // Contribution `step` forecast steps ahead, evaluated at unix time `at_s`.
  virtual double projected_kw(const model::SensorSnapshot& snapshot, std::size_t step, std::int64_t at_s) const = 0;
  virtual double confidence() const noexcept = 0;
  virtual ~HeatSource() = default;
};

}  // namespace heat_agent::heat
