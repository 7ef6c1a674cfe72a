#pragma once

#include "core/config.hpp"
#include "heat/heat_source.hpp"

namespace heat_agent::heat {

// Passive solar gain estimated from photovoltaic production.
class SolarGain final : public HeatSource {
 public:
  explicit SolarGain(core::SolarConfig config) noexcept;

  model::heat_source_id id() const noexcept override { return model::heat_source_id::SOLAR; }
  double current_kw(const model::SensorSnapshot& snapshot) override;
  double projected_kw(const model::SensorSnapshot& snapshot, std::size_t step, std::int64_t at_s) const override;
  double confidence() const noexcept override;

  // hour_of_day < 0 means unknown.
  [[nodiscard]] double gain_kw(double pv_power_w, double hour_of_day, double outdoor_c) const noexcept;

 private:
  core::SolarConfig config_;
  bool had_reading_{false};
};

}  // namespace heat_agent::heat
