#pragma once

#include <cstdint>
#include <optional>

#include "core/config.hpp"
#include "heat/heat_source.hpp"
#include "model/thermal_state.hpp"

namespace heat_agent::heat {

// Combustion heater in one zone, detected from the zone-to-house temperature differential.
// The heat-equivalent coefficient (kW per degree of differential) is adapted per session.
class SecondaryHeater final : public HeatSource {
 public:
  SecondaryHeater(core::SecondaryHeaterConfig config, const model::SecondaryHeaterState& state) noexcept;

  model::heat_source_id id() const noexcept override { return model::heat_source_id::SECONDARY_HEATER; }
  double current_kw(const model::SensorSnapshot& snapshot) override;
  double projected_kw(const model::SensorSnapshot& snapshot, std::size_t step, std::int64_t at_s) const override;
  double confidence() const noexcept override { return state_.confidence; }

  [[nodiscard]] bool active() const noexcept { return session_.has_value(); }
  [[nodiscard]] const model::SecondaryHeaterState& state() const noexcept { return state_; }

 private:
  struct Session {
    std::int64_t start_s{0};
    double start_reference_c{0.0};
    double peak_differential_c{0.0};
  };

  void finish_session(std::int64_t end_s, double end_reference_c);
  [[nodiscard]] double heat_kw(double differential_c) const noexcept;

  core::SecondaryHeaterConfig config_;
  model::SecondaryHeaterState state_;
  std::optional<Session> session_{};
  double last_differential_c_{0.0};
};

}  // namespace heat_agent::heat
