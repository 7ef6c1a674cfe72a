#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "model/thermal_state.hpp"

namespace heat_agent::core {

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"heat:agent"};
  std::chrono::hours retention{24 * 30};
  bool enabled{false};
};

struct IoConfig {
  std::string snapshot_path{"/run/heat-agent/snapshot.json"};
  std::string command_path{"/run/heat-agent/command.json"};
  std::string state_path{"/var/lib/heat-agent/learning_state.json"};
  std::chrono::seconds max_snapshot_age{900};
};

struct ControlConfig {
  double outlet_min_c{14.0};
  double outlet_max_c{65.0};
  double max_change_per_cycle_c{2.0};
  bool smart_rounding{true};
  double search_resolution_c{0.1};
  std::uint32_t max_search_iterations{20};
  double min_outlet_above_outdoor_c{0.0};
  // Observe another controller: learn from the measured outlet and write no commands.
  bool shadow_mode{false};
};

struct PhysicsConfig {
  double trajectory_horizon_hours{4.0};
  double trajectory_step_hours{1.0};
  double heat_units_per_kw{0.5};
};

struct LearningConfig {
  double base_rate{0.05};
  double min_rate{0.01};
  double max_rate{0.3};
  std::size_t error_window{10};
  double confidence_threshold_c{0.25};
  double confidence_boost{1.1};
  double confidence_decay{0.98};
  double max_step_fraction{0.02};
  std::uint32_t clamp_warning_cycles{3};
  std::uint64_t training_cycles{12};
  double low_confidence{1.0};
  double epsilon_time_constant_h{2.0};
  double epsilon_heat_loss{0.005};
  double epsilon_effectiveness{0.05};
};

struct CorrectionConfig {
  double deadband_c{0.1};
  double max_correction_c{10.0};
  double open_window_jump_c{1.5};
  std::uint32_t open_window_sustain_cycles{2};
  std::uint32_t open_window_clear_cycles{3};
  double open_window_decay{0.5};
};

struct BlockingConfig {
  std::chrono::minutes grace_max{30};
  double stabilization_margin_c{0.0};
};

struct SolarConfig {
  double pv_threshold_w{50.0};
  double pv_heating_factor{0.25};
  std::chrono::seconds max_forecast_age{7200};
};

struct SecondaryHeaterConfig {
  double on_differential_c{2.0};
  double off_differential_c{0.8};
  double coefficient_min_kw{1.0};
  double coefficient_max_kw{5.0};
  double coefficient_default_kw{2.5};
  double learning_rate{0.1};
  double building_capacity_kwh_per_c{8.0};
  std::chrono::minutes min_session{10};
  double distribution_factor{0.5};
};

struct ElectronicsConfig {
  double tv_kw{0.25};
  std::uint32_t occupants{2};
  double kw_per_occupant{0.1};
};

struct HeatSourcesConfig {
  SolarConfig solar{};
  SecondaryHeaterConfig secondary_heater{};
  ElectronicsConfig electronics{};
};

struct CalibrationConfig {
  std::size_t max_samples{2016};
  std::size_t min_pairs{50};
  std::chrono::minutes grace_skip{30};
};

struct AgentConfig {
  std::chrono::minutes cycle_interval{30};
  std::chrono::seconds blocking_poll_interval{60};
  bool stdout_debug{true};
  bool publish_health{true};
  IoConfig io{};
  ControlConfig control{};
  PhysicsConfig physics{};
  model::ParameterBounds bounds{};
  LearningConfig learning{};
  CorrectionConfig correction{};
  BlockingConfig blocking{};
  HeatSourcesConfig heat_sources{};
  CalibrationConfig calibration{};
  RedisConfig redis{};
};

AgentConfig load_agent_config(const std::string& path);

// Cross-field checks; throws std::runtime_error.
void validate_agent_config(const AgentConfig& config);

// Learning state used for a cold start under this configuration.
model::LearningState default_learning_state(const AgentConfig& config);

}  // namespace heat_agent::core
