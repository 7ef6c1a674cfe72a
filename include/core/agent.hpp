#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "control/actuation.hpp"
#include "control/blocking_state_machine.hpp"
#include "control/outlet_solver.hpp"
#include "control/trajectory_corrector.hpp"
#include "core/config.hpp"
#include "core/scheduler.hpp"
#include "heat/coordinator.hpp"
#include "io/command_sink.hpp"
#include "io/snapshot_source.hpp"
#include "learning/parameter_learner.hpp"
#include "metrics/confidence_tracker.hpp"
#include "model/control_status.hpp"
#include "model/ring_buffer.hpp"
#include "model/thermal_state.hpp"
#include "sinks/redis_ts.hpp"
#include "sinks/stdout_debug.hpp"
#include "store/learning_state_store.hpp"

namespace heat_agent::core {

struct AgentStats {
  std::size_t ticks_executed{0};
  std::size_t control_cycles{0};
  std::size_t blocking_polls{0};
};

// Owns the learning state and runs one control cycle per cycle interval, with the
// blocking poll multiplexed onto the ticks in between.
class Agent {
 public:
  explicit Agent(AgentConfig config);
  Agent(AgentConfig config, std::unique_ptr<io::SnapshotSource> source, std::unique_ptr<io::CommandSink> sink);

  AgentStats run_for_ticks(std::size_t total_ticks);

  // One full control cycle; persists state before returning.
  const model::CycleReport& run_cycle();

  // Blocking onset/offset detection only. Never touches the learned parameters.
  void poll_blocking();

  [[nodiscard]] const model::LearningState& learning_state() const noexcept { return state_; }
  [[nodiscard]] const model::CycleReport& last_report() const noexcept { return report_; }
  [[nodiscard]] control::blocking_phase blocking_phase() const noexcept { return blocking_.phase(); }

 private:
  static constexpr std::size_t kResidualWindow = 4;

  std::optional<model::SensorSnapshot> fetch_snapshot(model::CycleReport& report);
  control::BlockingDecision observe_blocking(const model::SensorSnapshot& snapshot);
  void control_cycle(const model::SensorSnapshot& snapshot, model::CycleReport& report);
  std::optional<model::PredictionRecord> realized_prediction(const model::SensorSnapshot& snapshot, double indoor_c,
                                                             bool other_rooms_reference) const;
  [[nodiscard]] std::optional<double> actuation_baseline(const model::SensorSnapshot& snapshot) const;
  [[nodiscard]] model::control_status learning_status() const noexcept;
  bool emit_command(const model::OutletCommand& command, std::string& error);
  void persist_state(std::int64_t timestamp_s);
  void finish_report(model::CycleReport& report, bool persist);
  void publish_sinks(const model::CycleReport& report);

  AgentConfig config_;
  std::chrono::seconds tick_interval_{};
  std::chrono::steady_clock::time_point next_wakeup_{};
  bool first_tick_{true};
  CycleScheduler scheduler_;

  std::unique_ptr<io::SnapshotSource> source_;
  std::unique_ptr<io::CommandSink> sink_;
  bool source_was_ok_{true};

  store::LearningStateStore store_;
  model::LearningState state_;
  bool store_was_ok_{true};

  heat::HeatSourceCoordinator coordinator_;
  learning::ParameterLearner learner_;
  control::OutletSolver solver_;
  control::TrajectoryCorrector corrector_;
  control::BlockingStateMachine blocking_;
  control::ActuationLimits limits_{};
  metrics::ConfidenceTracker tracker_;
  // Recent predicted-minus-realized indoor changes; feeds open-window detection.
  model::RingBuffer<double, kResidualWindow> residuals_{};

  model::CycleReport report_{};

  bool publish_stdout_{true};
  sinks::StdoutDebugSink stdout_sink_{};
  std::unique_ptr<sinks::RedisTsSink> redis_sink_{};
  bool redis_was_ok_{true};
};

}  // namespace heat_agent::core
