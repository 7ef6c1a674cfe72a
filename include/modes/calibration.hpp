#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "model/sensor_snapshot.hpp"
#include "model/thermal_state.hpp"

namespace heat_agent::modes {

struct HistorySample {
  model::SensorSnapshot snapshot{};
  // Command that was in force; falls back to the measured outlet when absent.
  std::optional<double> outlet_applied_c{};
};

struct HistoryLoad {
  std::vector<HistorySample> samples{};
  std::size_t lines_read{0};
  std::size_t lines_rejected{0};
};

// Reads a JSONL export, one snapshot object per line. Keeps the newest `max_samples`.
// Throws std::runtime_error when the file cannot be opened.
HistoryLoad load_history(const std::string& path, std::size_t max_samples);

struct CalibrationSummary {
  std::size_t lines_read{0};
  std::size_t pairs_used{0};
  std::size_t pairs_skipped{0};
  model::LearningState state{};
};

// Replays consecutive sample pairs through the parameter learner, starting from the
// default learning state. Issues no commands and writes nothing.
// Throws std::runtime_error when fewer than calibration.min_pairs pairs are usable.
CalibrationSummary calibrate(const std::vector<HistorySample>& samples, const core::AgentConfig& config);

CalibrationSummary calibrate_from_history(const std::string& history_path, const core::AgentConfig& config);

}  // namespace heat_agent::modes
