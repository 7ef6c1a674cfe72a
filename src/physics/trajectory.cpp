#include "physics/trajectory.hpp"

#include <algorithm>

#include "physics/thermal_model.hpp"

namespace heat_agent::physics {

Trajectory::Trajectory(const model::ThermalParameters& params, const ForecastFeatures& features,
                       const double outlet_c) noexcept
    : params_(params), features_(features), outlet_c_(outlet_c) {
  features_.steps = std::min(features_.steps, model::kForecastSteps);
}

Trajectory::const_iterator::const_iterator(const Trajectory* owner, const std::size_t step) noexcept
    : owner_(owner), step_(step) {
  if (owner_ == nullptr) {
    return;
  }
  indoor_c_ = owner_->features_.indoor_c;
  if (step_ < owner_->size()) {
    compute();
  }
}

void Trajectory::const_iterator::compute() noexcept {
  const ForecastFeatures& features = owner_->features_;
  const double step_equilibrium = equilibrium_unchecked(owner_->params_, owner_->outlet_c_,
                                                        features.outdoor_c[step_], features.heat_input[step_]);
  indoor_c_ = approach(indoor_c_, step_equilibrium, features.step_hours, owner_->params_.thermal_time_constant_h);
  point_.offset_hours = static_cast<double>(step_ + 1) * features.step_hours;
  point_.indoor_c = indoor_c_;
  point_.equilibrium_c = step_equilibrium;
}

Trajectory::const_iterator& Trajectory::const_iterator::operator++() noexcept {
  ++step_;
  if (step_ < owner_->size()) {
    compute();
  }
  return *this;
}

Trajectory::const_iterator Trajectory::const_iterator::operator++(int) noexcept {
  const_iterator previous = *this;
  ++(*this);
  return previous;
}

Trajectory::const_iterator Trajectory::begin() const noexcept { return const_iterator(this, 0); }

Trajectory::const_iterator Trajectory::end() const noexcept { return const_iterator(this, size()); }

std::size_t Trajectory::size() const noexcept { return features_.steps; }

TrajectoryPoint Trajectory::final_point() const noexcept {
  TrajectoryPoint last{0.0, features_.indoor_c, features_.indoor_c};
  for (const TrajectoryPoint& point : *this) {
    last = point;
  }
  return last;
}

}  // namespace heat_agent::physics
