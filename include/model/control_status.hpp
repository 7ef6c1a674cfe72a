#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace heat_agent::model {

enum class control_status : std::uint8_t {
  OK = 0,
  LOW_CONFIDENCE = 1,
  BLOCKED = 2,
  NETWORK_ERROR = 3,
  NO_DATA = 4,
  TRAINING = 5,
  HEATING_OFF = 6,
  MODEL_ERROR = 7,
};

const char* to_string(control_status status) noexcept;

inline constexpr std::array<double, 4> kAccuracyBandsC{0.1, 0.2, 0.5, 1.0};

struct HealthSignals {
  double parameter_stability{1.0};
  double prediction_consistency{1.0};
  double physics_alignment{1.0};
  double model_health{1.0};
  double learning_progress{0.5};

  double mae_c{0.0};
  double rmse_c{0.0};
  // Fraction of predictions within each of kAccuracyBandsC.
  std::array<double, 4> within_band{};
};

struct OutletCommand {
  std::int64_t timestamp_s{0};
  double outlet_c{0.0};
  control_status status{control_status::OK};
  bool held{false};
};

// Status/diagnostics surface consumed by external reporting.
struct CycleReport {
  std::int64_t timestamp_s{0};
  control_status status{control_status::NO_DATA};
  double confidence{0.0};
  std::uint64_t cycle_count{0};

  std::optional<double> suggested_outlet_c{};
  std::optional<double> final_outlet_c{};
  std::optional<double> predicted_indoor_c{};
  std::optional<double> actual_indoor_c{};
  double trajectory_correction_c{0.0};
  bool search_degraded{false};
  bool open_window{false};
  bool stability_warning{false};

  std::vector<std::string> blocking_reasons{};
  std::vector<std::string> missing_inputs{};
  std::string last_error{};

  HealthSignals health{};
};

}  // namespace heat_agent::model
