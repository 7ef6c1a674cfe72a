#include "heat/occupancy_gain.hpp"

namespace heat_agent::heat {

OccupancyGain::OccupancyGain(core::ElectronicsConfig config) noexcept : config_(config) {}

double OccupancyGain::active_kw() const noexcept {
  return config_.tv_kw + static_cast<double>(config_.occupants) * config_.kw_per_occupant;
}

double OccupancyGain::current_kw(const model::SensorSnapshot& snapshot) {
  return snapshot.tv_on ? active_kw() : 0.0;
}

// Persistence forecast: the present state is assumed to hold over the horizon.
double OccupancyGain::projected_kw(const model::SensorSnapshot& snapshot, std::size_t /*step*/,
                                   std::int64_t /*at_s*/) const {
  return snapshot.tv_on ? active_kw() : 0.0;
}

}  // namespace heat_agent::heat
