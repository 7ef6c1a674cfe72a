#include "physics/features.hpp"

#include <algorithm>

namespace heat_agent::physics {

double prediction_indoor_c(const model::SensorSnapshot& snapshot, const model::ContributionPlan& plan) noexcept {
  if (plan.secondary_heater_active && snapshot.other_rooms_c.has_value()) {
    return *snapshot.other_rooms_c;
  }
  return snapshot.indoor_c;
}

bool forecast_is_fresh(const model::SensorSnapshot& snapshot, const std::chrono::seconds max_age) noexcept {
  if (snapshot.forecast.issued_at_s <= 0) {
    return false;
  }
  const std::int64_t age_s = snapshot.timestamp_s - snapshot.forecast.issued_at_s;
  return age_s >= 0 && age_s <= static_cast<std::int64_t>(max_age.count());
}

ForecastFeatures capture_features(const model::SensorSnapshot& snapshot, const model::ContributionPlan& plan,
                                  const FeatureOptions& options) noexcept {
  ForecastFeatures features{};
  features.indoor_c = prediction_indoor_c(snapshot, plan);
  features.outdoor_now_c = snapshot.outdoor_c;
  features.heat_input_now = plan.total_heat_input();
  features.steps = std::clamp<std::size_t>(options.steps, 1, model::kForecastSteps);
  features.step_hours = options.step_hours;

  const bool fresh = forecast_is_fresh(snapshot, options.max_forecast_age);
  for (std::size_t i = 0; i < model::kForecastSteps; ++i) {
    const auto& forecast_outdoor = snapshot.forecast.outdoor_c[i];
    features.outdoor_c[i] = (fresh && forecast_outdoor.has_value()) ? *forecast_outdoor : snapshot.outdoor_c;
    features.heat_input[i] = std::max(0.0, plan.projected_heat_input[i]);
  }
  return features;
}

}  // namespace heat_agent::physics
