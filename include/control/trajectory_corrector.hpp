#pragma once

#include <cstdint>

#include "control/outlet_solver.hpp"
#include "core/config.hpp"
#include "physics/trajectory.hpp"

namespace heat_agent::control {

// Additive outlet adjustment for a trajectory error, in degrees of outlet per degree of error:
// |error| <= 0.5 -> x5, <= 1.0 -> x8, otherwise x12. Sign follows the error.
double gentle_correction(double trajectory_error_c) noexcept;

struct CorrectionResult {
  double outlet_c{0.0};
  double trajectory_error_c{0.0};
  double trajectory_correction_c{0.0};
  double disturbance_correction_c{0.0};
  bool open_window{false};
};

class TrajectoryCorrector {
 public:
  TrajectoryCorrector(core::CorrectionConfig config, double outlet_min_c, double outlet_max_c) noexcept;

  // cumulative_error_c is the recent sum of (predicted - realized indoor change); a sudden sustained
  // rise in the compensation it demands is treated as an open window.
  CorrectionResult correct(const SolveResult& solver_output, const physics::Trajectory& predicted_trajectory,
                           double target_c, double cumulative_error_c);

  [[nodiscard]] bool open_window_active() const noexcept;
  [[nodiscard]] double disturbance_correction_c() const noexcept { return disturbance_c_; }

 private:
  enum class window_phase : std::uint8_t {
    CLEAR = 0,
    SUSPECTED = 1,
    ACTIVE = 2,
    DECAYING = 3,
  };

  void track_disturbance(double cumulative_error_c);

  core::CorrectionConfig config_;
  double outlet_min_c_{0.0};
  double outlet_max_c_{0.0};

  window_phase phase_{window_phase::CLEAR};
  double baseline_demand_c_{0.0};
  double last_demand_c_{0.0};
  double disturbance_c_{0.0};
  std::uint32_t sustain_count_{0};
  std::uint32_t clear_count_{0};
};

}  // namespace heat_agent::control
