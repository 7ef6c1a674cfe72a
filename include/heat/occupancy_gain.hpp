#pragma once

#include "core/config.hpp"
#include "heat/heat_source.hpp"

namespace heat_agent::heat {

// Electronics and occupants, keyed off the TV state.
class OccupancyGain final : public HeatSource {
 public:
  explicit OccupancyGain(core::ElectronicsConfig config) noexcept;

  model::heat_source_id id() const noexcept override { return model::heat_source_id::ELECTRONICS; }
  double current_kw(const model::SensorSnapshot& snapshot) override;
  double projected_kw(const model::SensorSnapshot& snapshot, std::size_t step, std::int64_t at_s) const override;
  double confidence() const noexcept override { return 0.6; }

 private:
  [[nodiscard]] double active_kw() const noexcept;

  core::ElectronicsConfig config_;
};

}  // namespace heat_agent::heat
