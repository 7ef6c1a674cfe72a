#include "modes/calibration.hpp"

#include <algorithm>
#include <chrono>
#include <deque>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "core/errors.hpp"
#include "heat/coordinator.hpp"
#include "io/snapshot_source.hpp"
#include "learning/parameter_learner.hpp"
#include "physics/features.hpp"
#include "physics/thermal_model.hpp"

namespace heat_agent::modes {
namespace {

constexpr std::int64_t kMaxPairGapSeconds = 2 * 3600;

struct ReplayPoint {
  double indoor_c{0.0};
  double heat_input{0.0};
  bool other_rooms_reference{false};
};

}  // namespace

HistoryLoad load_history(const std::string& path, const std::size_t max_samples) {
  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open history file: " + path);
  }

  HistoryLoad result{};
  std::deque<HistorySample> kept;
  std::string line;
  while (std::getline(input, line)) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
      continue;
    }
    ++result.lines_read;

    try {
      const nlohmann::json document = nlohmann::json::parse(line);
      HistorySample sample{};
      sample.snapshot = io::parse_snapshot(document);
      const auto applied = document.find("outlet_temp_applied");
      if (applied != document.end() && applied->is_number()) {
        sample.outlet_applied_c = applied->get<double>();
      }
      kept.push_back(std::move(sample));
      if (max_samples > 0 && kept.size() > max_samples) {
        kept.pop_front();
      }
    } catch (const nlohmann::json::exception& ex) {
      if (result.lines_rejected == 0) {
        std::cerr << "[calibrate] skipping malformed line " << result.lines_read << ": " << ex.what() << '\n';
      }
      ++result.lines_rejected;
    } catch (const core::NoDataError& ex) {
      if (result.lines_rejected == 0) {
        std::cerr << "[calibrate] skipping line " << result.lines_read << ": " << ex.what() << '\n';
      }
      ++result.lines_rejected;
    }
  }

  result.samples.assign(kept.begin(), kept.end());
  return result;
}

CalibrationSummary calibrate(const std::vector<HistorySample>& samples, const core::AgentConfig& config) {
  CalibrationSummary summary{};
  summary.state = core::default_learning_state(config);

  heat::HeatSourceCoordinator coordinator(config, summary.state.secondary_heater);
  std::vector<ReplayPoint> points;
  points.reserve(samples.size());
  for (const HistorySample& sample : samples) {
    const model::ContributionPlan plan = coordinator.contributions(sample.snapshot);
    ReplayPoint point{};
    point.indoor_c = physics::prediction_indoor_c(sample.snapshot, plan);
    point.heat_input = plan.total_heat_input();
    point.other_rooms_reference = plan.secondary_heater_active && sample.snapshot.other_rooms_c.has_value();
    points.push_back(point);
  }
  summary.state.secondary_heater = coordinator.secondary_heater_state();

  learning::ParameterLearner learner(config.learning, config.bounds);
  const std::int64_t grace_skip_s = std::chrono::duration_cast<std::chrono::seconds>(config.calibration.grace_skip).count();
  std::optional<std::int64_t> last_blocked_s{};

  for (std::size_t i = 0; i + 1 < samples.size(); ++i) {
    const model::SensorSnapshot& from = samples[i].snapshot;
    const model::SensorSnapshot& to = samples[i + 1].snapshot;
    if (from.blocking.any()) {
      last_blocked_s = from.timestamp_s;
    }

    const std::int64_t gap_s = to.timestamp_s - from.timestamp_s;
    const bool after_block = last_blocked_s.has_value() && from.timestamp_s - *last_blocked_s < grace_skip_s;
    if (from.blocking.any() || to.blocking.any() || !from.heating_on || !to.heating_on || after_block ||
        gap_s <= 0 || gap_s > kMaxPairGapSeconds ||
        points[i].other_rooms_reference != points[i + 1].other_rooms_reference) {
      ++summary.pairs_skipped;
      continue;
    }

    model::PredictionRecord record{};
    record.timestamp_s = to.timestamp_s;
    record.context.start_indoor_c = points[i].indoor_c;
    record.context.outlet_c = samples[i].outlet_applied_c.value_or(from.outlet_actual_c);
    record.context.outdoor_c = from.outdoor_c;
    record.context.heat_input = points[i].heat_input;
    record.context.horizon_hours = static_cast<double>(gap_s) / 3600.0;
    record.context.other_rooms_reference = points[i].other_rooms_reference;
    record.predicted_indoor_delta = physics::predict_indoor_delta(summary.state.parameters, record.context);
    record.actual_indoor_delta = points[i + 1].indoor_c - points[i].indoor_c;

    const learning::LearningStep step = learner.update(summary.state, record);
    learner.commit(step);
    summary.state.predictions.push(record);
    summary.state.parameters = step.parameters;
    if (step.update.has_value()) {
      summary.state.parameter_updates.push(*step.update);
    }
    ++summary.state.cycle_count;
    ++summary.pairs_used;
  }

  if (summary.pairs_used < config.calibration.min_pairs) {
    throw std::runtime_error("calibration needs at least " + std::to_string(config.calibration.min_pairs) +
                             " usable sample pairs, found " + std::to_string(summary.pairs_used));
  }

  summary.state.baseline_source = "calibrated";
  if (!samples.empty()) {
    summary.state.last_updated_s = samples.back().snapshot.timestamp_s;
  }
  return summary;
}

CalibrationSummary calibrate_from_history(const std::string& history_path, const core::AgentConfig& config) {
  const HistoryLoad history = load_history(history_path, config.calibration.max_samples);
  if (history.lines_rejected > 0) {
    std::cerr << "[calibrate] rejected " << history.lines_rejected << " of " << history.lines_read << " lines\n";
  }
  CalibrationSummary summary = calibrate(history.samples, config);
  summary.lines_read = history.lines_read;
  return summary;
}

}  // namespace heat_agent::modes
