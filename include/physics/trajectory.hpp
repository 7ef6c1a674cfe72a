#pragma once

#include <array>
#include <cstddef>
#include <iterator>

#include "model/sensor_snapshot.hpp"
#include "model/thermal_state.hpp"

namespace heat_agent::physics {

// Conditions for each trajectory step, captured once per cycle.
struct ForecastFeatures {
  double indoor_c{0.0};
  double outdoor_now_c{0.0};
  double heat_input_now{0.0};
  std::array<double, model::kForecastSteps> outdoor_c{};
  std::array<double, model::kForecastSteps> heat_input{};
  std::size_t steps{model::kForecastSteps};
  double step_hours{1.0};
};

struct TrajectoryPoint {
  double offset_hours{0.0};
  double indoor_c{0.0};
  double equilibrium_c{0.0};
};

// Lazy, finite indoor-temperature path under a fixed outlet command.
// Each step approaches that step's equilibrium exponentially; nothing is computed until iterated.
class Trajectory {
 public:
  class const_iterator {
   public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = TrajectoryPoint;
    using difference_type = std::ptrdiff_t;
    using pointer = const TrajectoryPoint*;
    using reference = const TrajectoryPoint&;

    const_iterator() = default;

    reference operator*() const noexcept { return point_; }
    pointer operator->() const noexcept { return &point_; }
    const_iterator& operator++() noexcept;
    const_iterator operator++(int) noexcept;

    bool operator==(const const_iterator& other) const noexcept {
      return owner_ == other.owner_ && step_ == other.step_;
    }
    bool operator!=(const const_iterator& other) const noexcept { return !(*this == other); }

   private:
    friend class Trajectory;
    const_iterator(const Trajectory* owner, std::size_t step) noexcept;
    void compute() noexcept;

    const Trajectory* owner_{nullptr};
    std::size_t step_{0};
    double indoor_c_{0.0};
    TrajectoryPoint point_{};
  };

  Trajectory(const model::ThermalParameters& params, const ForecastFeatures& features, double outlet_c) noexcept;

  [[nodiscard]] const_iterator begin() const noexcept;
  [[nodiscard]] const_iterator end() const noexcept;
  [[nodiscard]] std::size_t size() const noexcept;

  // Last point of the horizon.
  [[nodiscard]] TrajectoryPoint final_point() const noexcept;
  [[nodiscard]] double outlet_c() const noexcept { return outlet_c_; }

 private:
  model::ThermalParameters params_;
  ForecastFeatures features_;
  double outlet_c_{0.0};
};

}  // namespace heat_agent::physics
