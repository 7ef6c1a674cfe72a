#include "heat/solar_gain.hpp"

#include <algorithm>
#include <cmath>

#include "core/timestamp.hpp"
#include "physics/features.hpp"

namespace heat_agent::heat {
namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kUnknownHourEffectiveness = 0.8;

double hour_effectiveness(const double hour_of_day) noexcept {
  if (hour_of_day < 0.0) {
    return kUnknownHourEffectiveness;
  }
  return 0.3 + 0.7 * std::max(0.0, std::cos(2.0 * kPi * (hour_of_day - 12.0) / 24.0));
}

// Colder weather makes more of the gain useful to the heating load.
double weather_factor(const double outdoor_c) noexcept {
  if (outdoor_c <= -10.0) {
    return 1.3;
  }
  if (outdoor_c <= 0.0) {
    return 1.1;
  }
  if (outdoor_c <= 10.0) {
    return 1.0;
  }
  return 0.8;
}

}  // namespace

SolarGain::SolarGain(core::SolarConfig config) noexcept : config_(config) {}

double SolarGain::gain_kw(const double pv_power_w, const double hour_of_day, const double outdoor_c) const noexcept {
  if (!std::isfinite(pv_power_w) || pv_power_w <= config_.pv_threshold_w) {
    return 0.0;
  }
  const double base_kw = pv_power_w * config_.pv_heating_factor / 1000.0;
  return base_kw * hour_effectiveness(hour_of_day) * weather_factor(outdoor_c);
}

double SolarGain::current_kw(const model::SensorSnapshot& snapshot) {
  had_reading_ = snapshot.pv_power_w.has_value();
  if (!had_reading_) {
    return 0.0;
  }
  return gain_kw(*snapshot.pv_power_w, core::local_hour_of_day(snapshot.timestamp_s), snapshot.outdoor_c);
}

double SolarGain::projected_kw(const model::SensorSnapshot& snapshot, const std::size_t step,
                               const std::int64_t at_s) const {
  if (step >= model::kForecastSteps || !physics::forecast_is_fresh(snapshot, config_.max_forecast_age)) {
    return 0.0;
  }
  const auto& pv_forecast = snapshot.forecast.pv_power_w[step];
  if (!pv_forecast.has_value()) {
    return 0.0;
  }
  const auto& outdoor_forecast = snapshot.forecast.outdoor_c[step];
  const double outdoor_c = outdoor_forecast.has_value() ? *outdoor_forecast : snapshot.outdoor_c;
  return gain_kw(*pv_forecast, core::local_hour_of_day(at_s), outdoor_c);
}

double SolarGain::confidence() const noexcept { return had_reading_ ? 0.8 : 0.0; }

}  // namespace heat_agent::heat
