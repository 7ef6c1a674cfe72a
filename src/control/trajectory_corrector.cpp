#include "control/trajectory_corrector.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace heat_agent::control {
namespace {
constexpr double kDisturbanceFloorC = 0.05;
}

double gentle_correction(const double trajectory_error_c) noexcept {
  const double magnitude = std::fabs(trajectory_error_c);
  double multiplier = 12.0;
  if (magnitude <= 0.5) {
    multiplier = 5.0;
  } else if (magnitude <= 1.0) {
    multiplier = 8.0;
  }
  return trajectory_error_c * multiplier;
}

TrajectoryCorrector::TrajectoryCorrector(core::CorrectionConfig config, const double outlet_min_c,
                                         const double outlet_max_c) noexcept
    : config_(config), outlet_min_c_(outlet_min_c), outlet_max_c_(outlet_max_c) {}

bool TrajectoryCorrector::open_window_active() const noexcept {
  return phase_ == window_phase::ACTIVE || phase_ == window_phase::DECAYING;
}

void TrajectoryCorrector::track_disturbance(const double cumulative_error_c) {
  const double demand = std::max(0.0, gentle_correction(cumulative_error_c));
  const bool elevated = demand >= baseline_demand_c_ + config_.open_window_jump_c;

  switch (phase_) {
    case window_phase::CLEAR:
      if (demand - last_demand_c_ >= config_.open_window_jump_c) {
        baseline_demand_c_ = last_demand_c_;
        sustain_count_ = 1;
        phase_ = window_phase::SUSPECTED;
        if (sustain_count_ >= config_.open_window_sustain_cycles) {
          phase_ = window_phase::ACTIVE;
          disturbance_c_ = demand - baseline_demand_c_;
          std::cerr << "[corrector] open window suspected; compensating " << disturbance_c_ << " C\n";
        }
      }
      break;

    case window_phase::SUSPECTED:
      if (demand >= baseline_demand_c_ + config_.open_window_jump_c) {
        ++sustain_count_;
        if (sustain_count_ >= config_.open_window_sustain_cycles) {
          phase_ = window_phase::ACTIVE;
          clear_count_ = 0;
          disturbance_c_ = demand - baseline_demand_c_;
          std::cerr << "[corrector] open window suspected; compensating " << disturbance_c_ << " C\n";
        }
      } else {
        phase_ = window_phase::CLEAR;
        sustain_count_ = 0;
      }
      break;

    case window_phase::ACTIVE:
      if (elevated) {
        clear_count_ = 0;
        disturbance_c_ = demand - baseline_demand_c_;
      } else if (++clear_count_ >= config_.open_window_clear_cycles) {
        phase_ = window_phase::DECAYING;
        std::cerr << "[corrector] open window signature gone; decaying compensation\n";
      }
      break;

    case window_phase::DECAYING:
      if (elevated) {
        phase_ = window_phase::ACTIVE;
        clear_count_ = 0;
        disturbance_c_ = demand - baseline_demand_c_;
        break;
      }
      disturbance_c_ *= config_.open_window_decay;
      if (disturbance_c_ < kDisturbanceFloorC) {
        disturbance_c_ = 0.0;
        phase_ = window_phase::CLEAR;
        sustain_count_ = 0;
        clear_count_ = 0;
      }
      break;
  }

  last_demand_c_ = demand;
}

CorrectionResult TrajectoryCorrector::correct(const SolveResult& solver_output,
                                              const physics::Trajectory& predicted_trajectory, const double target_c,
                                              const double cumulative_error_c) {
  CorrectionResult result{};
  track_disturbance(cumulative_error_c);

  const double forecast_end_c = predicted_trajectory.final_point().indoor_c;
  // Positive when the forecast path ends colder than the solver assumed.
  const double error = solver_output.assumed_horizon_indoor_c - forecast_end_c;
  result.trajectory_error_c = error;

  const bool within_deadband = std::fabs(error) <= config_.deadband_c;
  const bool still_reaches_target = (error > 0.0 && forecast_end_c >= target_c) || (error < 0.0 && forecast_end_c <= target_c);
  if (!within_deadband && !still_reaches_target) {
    result.trajectory_correction_c = gentle_correction(error);
  }

  result.disturbance_correction_c = open_window_active() ? disturbance_c_ : 0.0;
  result.open_window = open_window_active();

  const double total = std::clamp(result.trajectory_correction_c + result.disturbance_correction_c,
                                  -config_.max_correction_c, config_.max_correction_c);
  result.outlet_c = std::clamp(solver_output.outlet_c + total, outlet_min_c_, outlet_max_c_);
  return result;
}

}  // namespace heat_agent::control
