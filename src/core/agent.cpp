#include "core/agent.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <thread>
#include <utility>

#include "core/errors.hpp"
#include "core/timestamp.hpp"
#include "physics/features.hpp"
#include "physics/thermal_model.hpp"
#include "physics/trajectory.hpp"

namespace heat_agent::core {
namespace {

// A pending prediction older than this many cycles no longer describes the outcome.
constexpr std::int64_t kMaxPendingCycles = 3;

std::uint64_t ticks_per_cycle(const AgentConfig& config) {
  const auto poll_s = std::max<std::int64_t>(1, config.blocking_poll_interval.count());
  const auto cycle_s = std::chrono::duration_cast<std::chrono::seconds>(config.cycle_interval).count();
  return static_cast<std::uint64_t>(std::max<std::int64_t>(1, cycle_s / poll_s));
}

model::LearningState sanitize_loaded(model::LearningState state, const AgentConfig& config) {
  const model::ParameterBounds& bounds = config.bounds;
  model::ThermalParameters& params = state.parameters;
  const model::ThermalParameters before = params;
  params.thermal_time_constant_h = bounds.time_constant_h.clamp(params.thermal_time_constant_h);
  params.heat_loss_coefficient = bounds.heat_loss.clamp(params.heat_loss_coefficient);
  params.outlet_effectiveness = bounds.effectiveness.clamp(params.outlet_effectiveness);
  params.learning_confidence = bounds.confidence.clamp(params.learning_confidence);
  if (!(before == params)) {
    std::cerr << "[store] persisted parameters outside configured bounds; clamped\n";
  }

  const SecondaryHeaterConfig& heater = config.heat_sources.secondary_heater;
  state.secondary_heater.coefficient_kw =
      std::clamp(state.secondary_heater.coefficient_kw, heater.coefficient_min_kw, heater.coefficient_max_kw);
  return state;
}

control::ActuationLimits make_limits(const ControlConfig& control) {
  control::ActuationLimits limits{};
  limits.outlet_min_c = control.outlet_min_c;
  limits.outlet_max_c = control.outlet_max_c;
  limits.max_change_per_cycle_c = control.max_change_per_cycle_c;
  return limits;
}

}  // namespace

Agent::Agent(AgentConfig config)
    : Agent(config, std::make_unique<io::JsonFileSnapshotSource>(config.io.snapshot_path, config.io.max_snapshot_age),
            std::make_unique<io::JsonFileCommandSink>(config.io.command_path)) {}

Agent::Agent(AgentConfig config, std::unique_ptr<io::SnapshotSource> source, std::unique_ptr<io::CommandSink> sink)
    : config_(std::move(config)),
      tick_interval_(config_.blocking_poll_interval),
      scheduler_(ticks_per_cycle(config_)),
      source_(std::move(source)),
      sink_(std::move(sink)),
      store_(config_.io.state_path, default_learning_state(config_)),
      state_(sanitize_loaded(store_.load(), config_)),
      coordinator_(config_, state_.secondary_heater),
      learner_(config_.learning, config_.bounds),
      solver_(control::make_solver_options(config_)),
      corrector_(config_.correction, config_.control.outlet_min_c, config_.control.outlet_max_c),
      blocking_(config_.blocking, config_.control.max_change_per_cycle_c, config_.control.shadow_mode),
      limits_(make_limits(config_.control)),
      tracker_(config_.bounds),
      publish_stdout_(config_.stdout_debug) {
  if (config_.redis.enabled) {
    sinks::RedisTsOptions options{};
    options.host = config_.redis.host;
    options.port = config_.redis.port;
    options.unix_socket = config_.redis.unix_socket;
    options.password = config_.redis.password;
    options.db = config_.redis.db;
    options.retention_ms =
        static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(config_.redis.retention).count());
    options.key_prefix = config_.redis.key_prefix;
    options.publish_health = config_.publish_health;
    redis_sink_ = std::make_unique<sinks::RedisTsSink>(options);

    const std::string address = !options.unix_socket.empty() ? "unix://" + options.unix_socket
                                                             : options.host + ':' + std::to_string(options.port);
    if (redis_sink_->check_connectivity()) {
      std::cerr << "[agent] redis connectivity confirmed at " << address << '\n';
    } else {
      std::cerr << "[agent] redis connectivity check failed at " << address << '\n';
    }
  }

  if (config_.control.shadow_mode) {
    std::cerr << "[agent] shadow mode: learning from the applied outlet, no commands written\n";
  }
  std::cerr << "[agent] parameters tau=" << state_.parameters.thermal_time_constant_h
            << "h heat_loss=" << state_.parameters.heat_loss_coefficient
            << " effectiveness=" << state_.parameters.outlet_effectiveness
            << " confidence=" << state_.parameters.learning_confidence << " (" << state_.baseline_source << ")\n";
}

AgentStats Agent::run_for_ticks(const std::size_t total_ticks) {
  AgentStats stats{};

  if (first_tick_) {
    next_wakeup_ = std::chrono::steady_clock::now();
    first_tick_ = false;
  }

  for (std::size_t i = 0; total_ticks == 0 || i < total_ticks; ++i) {
    if (scheduler_.cycle_due()) {
      run_cycle();
      ++stats.control_cycles;
    } else {
      poll_blocking();
      ++stats.blocking_polls;
    }

    ++stats.ticks_executed;
    scheduler_.advance();

    next_wakeup_ += tick_interval_;
    std::this_thread::sleep_until(next_wakeup_);
  }

  return stats;
}

std::optional<model::SensorSnapshot> Agent::fetch_snapshot(model::CycleReport& report) {
  try {
    model::SensorSnapshot snapshot = source_->fetch();
    if (!source_was_ok_) {
      std::cerr << "[agent] snapshot source recovered\n";
      source_was_ok_ = true;
    }
    return snapshot;
  } catch (const NetworkError& ex) {
    report.status = model::control_status::NETWORK_ERROR;
    report.last_error = ex.what();
  } catch (const NoDataError& ex) {
    report.status = model::control_status::NO_DATA;
    report.missing_inputs = ex.missing();
    report.last_error = ex.what();
  }

  if (source_was_ok_) {
    std::cerr << "[agent] snapshot unavailable: " << report.last_error << '\n';
    source_was_ok_ = false;
  }
  return std::nullopt;
}

control::BlockingDecision Agent::observe_blocking(const model::SensorSnapshot& snapshot) {
  const control::BlockingDecision decision = blocking_.observe(
      snapshot.blocking, snapshot.outlet_actual_c, snapshot.timestamp_s, state_.operational.last_applied_outlet_c);

  if (decision.transitioned && decision.phase == control::blocking_phase::NORMAL &&
      blocking_.last_completed().has_value()) {
    const model::BlockingEvent& completed = *blocking_.last_completed();
    state_.operational.last_block_kind = model::to_string(completed.kind);
    state_.operational.last_block_end_s = completed.end_s.value_or(snapshot.timestamp_s);
  }
  if (decision.phase != control::blocking_phase::NORMAL) {
    // Outcomes spanning a block say nothing about the model.
    state_.operational.pending.reset();
    residuals_.clear();
  }
  return decision;
}

void Agent::poll_blocking() {
  model::CycleReport scratch{};
  const std::optional<model::SensorSnapshot> snapshot = fetch_snapshot(scratch);
  if (!snapshot.has_value()) {
    return;
  }

  const control::BlockingDecision decision = observe_blocking(*snapshot);
  if (!decision.transitioned || !decision.held_outlet_c.has_value()) {
    return;
  }

  std::string error;
  const model::OutletCommand command{snapshot->timestamp_s, *decision.held_outlet_c, model::control_status::BLOCKED,
                                     true};
  if (!emit_command(command, error)) {
    std::cerr << "[agent] held command not delivered: " << error << '\n';
  }
}

const model::CycleReport& Agent::run_cycle() {
  model::CycleReport report{};
  report.timestamp_s = unix_seconds_now();

  const std::optional<model::SensorSnapshot> snapshot = fetch_snapshot(report);
  if (!snapshot.has_value()) {
    finish_report(report, false);
    return report_;
  }

  report.timestamp_s = snapshot->timestamp_s;
  report.actual_indoor_c = snapshot->indoor_c;

  const control::BlockingDecision decision = observe_blocking(*snapshot);
  if (decision.phase != control::blocking_phase::NORMAL) {
    report.status = model::control_status::BLOCKED;
    report.blocking_reasons = decision.reasons;
    if (decision.held_outlet_c.has_value()) {
      report.final_outlet_c = decision.held_outlet_c;
      const model::OutletCommand command{snapshot->timestamp_s, *decision.held_outlet_c,
                                         model::control_status::BLOCKED, true};
      emit_command(command, report.last_error);
    }
    finish_report(report, true);
    return report_;
  }

  if (!snapshot->heating_on) {
    report.status = model::control_status::HEATING_OFF;
    state_.operational.pending.reset();
    residuals_.clear();
    finish_report(report, true);
    return report_;
  }

  control_cycle(*snapshot, report);
  finish_report(report, true);
  return report_;
}

std::optional<model::PredictionRecord> Agent::realized_prediction(const model::SensorSnapshot& snapshot,
                                                                  const double indoor_c,
                                                                  const bool other_rooms_reference) const {
  const std::optional<model::PendingPrediction>& pending = state_.operational.pending;
  if (!pending.has_value() || pending->context.other_rooms_reference != other_rooms_reference) {
    return std::nullopt;
  }

  const std::int64_t elapsed_s = snapshot.timestamp_s - pending->issued_at_s;
  const std::int64_t cycle_s = std::chrono::duration_cast<std::chrono::seconds>(config_.cycle_interval).count();
  if (elapsed_s <= 0 || elapsed_s > kMaxPendingCycles * cycle_s) {
    return std::nullopt;
  }

  model::PredictionRecord record{};
  record.timestamp_s = snapshot.timestamp_s;
  record.context = pending->context;
  record.context.horizon_hours = static_cast<double>(elapsed_s) / 3600.0;
  record.predicted_indoor_delta = physics::predict_indoor_delta(state_.parameters, record.context);
  record.actual_indoor_delta = indoor_c - record.context.start_indoor_c;
  return record;
}

std::optional<double> Agent::actuation_baseline(const model::SensorSnapshot& snapshot) const {
  const model::OperationalState& operational = state_.operational;
  const model::blocking_kind last_kind = model::blocking_kind_from_string(operational.last_block_kind);
  if (model::heats_outlet(last_kind) && operational.last_block_end_s > 0 &&
      operational.last_block_end_s >= operational.last_applied_at_s) {
    return snapshot.outlet_actual_c;
  }
  return operational.last_applied_outlet_c;
}

model::control_status Agent::learning_status() const noexcept {
  if (state_.cycle_count < config_.learning.training_cycles) {
    return model::control_status::TRAINING;
  }
  if (state_.parameters.learning_confidence < config_.learning.low_confidence) {
    return model::control_status::LOW_CONFIDENCE;
  }
  return model::control_status::OK;
}

void Agent::control_cycle(const model::SensorSnapshot& snapshot, model::CycleReport& report) {
  const model::ContributionPlan plan = coordinator_.contributions(snapshot);
  state_.secondary_heater = coordinator_.secondary_heater_state();

  const double indoor_c = physics::prediction_indoor_c(snapshot, plan);
  const bool other_rooms_reference = plan.secondary_heater_active && snapshot.other_rooms_c.has_value();
  const double target_c = snapshot.target_indoor_c;
  report.actual_indoor_c = indoor_c;

  // Learning is proposed first and committed only once this cycle's model passes its checks.
  const std::optional<model::PredictionRecord> record = realized_prediction(snapshot, indoor_c, other_rooms_reference);
  std::optional<learning::LearningStep> step{};
  if (record.has_value()) {
    step = learner_.update(state_, *record);
  }
  const model::ThermalParameters params = step.has_value() ? step->parameters : state_.parameters;

  control::SolveResult solved{};
  try {
    solved = solver_.solve(snapshot, plan, params, target_c, state_.operational.last_applied_outlet_c);
  } catch (const ModelIntegrityFault& ex) {
    tracker_.record_physics_check(false);
    std::cerr << "[agent] model integrity fault: " << ex.what() << '\n';
    report.status = model::control_status::MODEL_ERROR;
    report.last_error = ex.what();
    state_.operational.pending.reset();
    if (state_.operational.last_applied_outlet_c.has_value()) {
      report.final_outlet_c = state_.operational.last_applied_outlet_c;
      const model::OutletCommand command{snapshot.timestamp_s, *state_.operational.last_applied_outlet_c,
                                         model::control_status::MODEL_ERROR, true};
      emit_command(command, report.last_error);
    }
    return;
  }
  tracker_.record_physics_check(true);

  if (step.has_value()) {
    learner_.commit(*step);
    state_.predictions.push(*record);
    state_.parameters = step->parameters;
    if (step->update.has_value()) {
      state_.parameter_updates.push(*step->update);
    }
    report.stability_warning = step->stability_warning;
  }
  ++state_.cycle_count;

  if (record.has_value() && std::isfinite(record->actual_indoor_delta)) {
    residuals_.push(record->predicted_indoor_delta - record->actual_indoor_delta);
  }
  double cumulative_error_c = 0.0;
  for (std::size_t i = 0; i < residuals_.size(); ++i) {
    cumulative_error_c += residuals_[i];
  }

  const physics::Trajectory trajectory(state_.parameters, solved.features, solved.outlet_c);
  const control::CorrectionResult corrected = corrector_.correct(solved, trajectory, target_c, cumulative_error_c);

  const std::optional<double> baseline = actuation_baseline(snapshot);
  double final_c = control::limit_change(corrected.outlet_c, baseline, limits_);
  if (config_.control.smart_rounding) {
    const model::ThermalParameters& fitted = state_.parameters;
    const physics::ForecastFeatures& features = solved.features;
    final_c = control::smart_round(
        final_c, baseline, limits_,
        [&fitted, &features](const double outlet_c) {
          return physics::equilibrium_unchecked(fitted, outlet_c, features.outdoor_c[0], features.heat_input[0]);
        },
        target_c);
  }

  const bool shadow = config_.control.shadow_mode;
  model::PredictionContext context{};
  context.start_indoor_c = indoor_c;
  // In shadow mode the outlet in force is the other controller's, not the suggestion.
  context.outlet_c = shadow ? snapshot.outlet_actual_c : final_c;
  context.outdoor_c = snapshot.outdoor_c;
  context.heat_input = plan.total_heat_input();
  context.horizon_hours = std::chrono::duration<double, std::ratio<3600>>(config_.cycle_interval).count();
  context.other_rooms_reference = other_rooms_reference;
  const double predicted_delta = physics::predict_indoor_delta(state_.parameters, context);

  report.status = learning_status();
  report.suggested_outlet_c = solved.outlet_c;
  report.final_outlet_c = final_c;
  report.predicted_indoor_c = indoor_c + predicted_delta;
  report.trajectory_correction_c = corrected.trajectory_correction_c + corrected.disturbance_correction_c;
  report.search_degraded = !solved.converged;
  report.open_window = corrected.open_window;

  if (shadow) {
    state_.operational.last_applied_outlet_c = snapshot.outlet_actual_c;
    state_.operational.last_applied_at_s = snapshot.timestamp_s;
    state_.operational.pending = model::PendingPrediction{snapshot.timestamp_s, predicted_delta, context};
    return;
  }

  const model::OutletCommand command{snapshot.timestamp_s, final_c, report.status, false};
  if (!emit_command(command, report.last_error)) {
    report.status = model::control_status::NETWORK_ERROR;
    state_.operational.pending.reset();
    return;
  }

  state_.operational.last_applied_outlet_c = final_c;
  state_.operational.last_applied_at_s = snapshot.timestamp_s;
  state_.operational.pending = model::PendingPrediction{snapshot.timestamp_s, predicted_delta, context};
}

bool Agent::emit_command(const model::OutletCommand& command, std::string& error) {
  if (config_.control.shadow_mode) {
    return true;
  }
  try {
    sink_->emit(command);
    return true;
  } catch (const NetworkError& ex) {
    error = ex.what();
    std::cerr << "[agent] command delivery failed: " << ex.what() << '\n';
    return false;
  }
}

void Agent::persist_state(const std::int64_t timestamp_s) {
  state_.last_updated_s = timestamp_s;
  try {
    store_.save(state_);
    if (!store_was_ok_) {
      std::cerr << "[store] save recovered\n";
      store_was_ok_ = true;
    }
  } catch (const PersistenceFault& ex) {
    if (store_was_ok_) {
      std::cerr << "[store] save failed; keeping in-memory state: " << ex.what() << '\n';
      store_was_ok_ = false;
    }
  }
}

void Agent::finish_report(model::CycleReport& report, const bool persist) {
  report.confidence = state_.parameters.learning_confidence;
  report.cycle_count = state_.cycle_count;
  report.health = tracker_.evaluate(state_, learner_.longest_clamp_streak());
  if (persist) {
    persist_state(report.timestamp_s);
  }
  publish_sinks(report);
  report_ = std::move(report);
}

void Agent::publish_sinks(const model::CycleReport& report) {
  if (publish_stdout_) {
    stdout_sink_.publish(report);
  }

  if (redis_sink_ != nullptr) {
    const bool ok = redis_sink_->publish(report);
    if (!ok) {
      if (redis_was_ok_) {
        std::cerr << "[redis] publish failed\n";
        redis_was_ok_ = false;
      }
    } else if (!redis_was_ok_) {
      std::cerr << "[redis] publish recovered\n";
      redis_was_ok_ = true;
    }
  }
}

}  // namespace heat_agent::core
