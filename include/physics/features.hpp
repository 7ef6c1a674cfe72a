#pragma once

#include <chrono>
#include <cstddef>

#include "model/heat_contribution.hpp"
#include "model/sensor_snapshot.hpp"
#include "physics/trajectory.hpp"

namespace heat_agent::physics {

struct FeatureOptions {
  double step_hours{1.0};
  std::size_t steps{model::kForecastSteps};
  std::chrono::seconds max_forecast_age{7200};
};

// Reference indoor temperature for predictions: the other-rooms average while the
// secondary heater biases the living-zone sensor, otherwise the indoor sensor.
double prediction_indoor_c(const model::SensorSnapshot& snapshot, const model::ContributionPlan& plan) noexcept;

bool forecast_is_fresh(const model::SensorSnapshot& snapshot, std::chrono::seconds max_age) noexcept;

// Missing or stale outdoor forecasts fall back to the current outdoor reading.
ForecastFeatures capture_features(const model::SensorSnapshot& snapshot, const model::ContributionPlan& plan,
                                  const FeatureOptions& options) noexcept;

}  // namespace heat_agent::physics
