#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace heat_agent::model {

inline constexpr std::size_t kForecastSteps = 4;

struct BlockingFlags {
  bool dhw{false};
  bool defrost{false};
  bool disinfect{false};
  bool boost{false};

  [[nodiscard]] bool any() const noexcept { return dhw || defrost || disinfect || boost; }
};

// Forecast vectors at fixed hourly offsets; step 0 is one step ahead of the snapshot.
struct ForecastSeries {
  std::int64_t issued_at_s{0};
  std::array<std::optional<double>, kForecastSteps> outdoor_c{};
  std::array<std::optional<double>, kForecastSteps> pv_power_w{};
};

// Immutable per-cycle input produced at the collaborator boundary.
struct SensorSnapshot {
  std::int64_t timestamp_s{0};
  double indoor_c{0.0};
  double target_indoor_c{0.0};
  double outdoor_c{0.0};
  double outlet_actual_c{0.0};
  bool heating_on{true};

  std::optional<double> other_rooms_c{};
  std::optional<double> secondary_zone_c{};
  std::optional<double> pv_power_w{};
  bool tv_on{false};

  BlockingFlags blocking{};
  ForecastSeries forecast{};
};

}  // namespace heat_agent::model
