#include "core/config.hpp"
#include "model/sensor_snapshot.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace heat_agent::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool parse_bool(const std::string& value) {
  const std::string lower = [&value]() {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
  }();

  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

double parse_double(const std::string& key, const std::string& value) {
  std::size_t used = 0;
  double parsed = 0.0;
  try {
    parsed = std::stod(value, &used);
  } catch (const std::exception&) {
    throw std::runtime_error(key + " must be a number");
  }
  if (used != value.size() || !std::isfinite(parsed)) {
    throw std::runtime_error(key + " must be a finite number");
  }
  return parsed;
}

double parse_positive(const std::string& key, const std::string& value) {
  const double parsed = parse_double(key, value);
  if (parsed <= 0.0) {
    throw std::runtime_error(key + " must be greater than 0");
  }
  return parsed;
}

double parse_non_negative(const std::string& key, const std::string& value) {
  const double parsed = parse_double(key, value);
  if (parsed < 0.0) {
    throw std::runtime_error(key + " must be greater than or equal to 0");
  }
  return parsed;
}

double parse_fraction(const std::string& key, const std::string& value) {
  const double parsed = parse_double(key, value);
  if (parsed <= 0.0 || parsed > 1.0) {
    throw std::runtime_error(key + " must be in range (0, 1]");
  }
  return parsed;
}

std::uint64_t parse_count(const std::string& key, const std::string& value, const std::uint64_t minimum) {
  long long parsed = 0;
  std::size_t used = 0;
  try {
    parsed = std::stoll(value, &used);
  } catch (const std::exception&) {
    throw std::runtime_error(key + " must be an integer");
  }
  if (used != value.size()) {
    throw std::runtime_error(key + " must be an integer");
  }
  if (parsed < 0 || static_cast<std::uint64_t>(parsed) < minimum) {
    throw std::runtime_error(key + " must be greater than or equal to " + std::to_string(minimum));
  }
  return static_cast<std::uint64_t>(parsed);
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  redis.enabled = !value.empty();
  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    return;
  }

  redis.host = value.substr(0, split);
  const auto parsed_port = parse_count("redis.address", value.substr(split + 1), 1);
  if (parsed_port > 65535) {
    throw std::runtime_error("redis.address port must be in range 1..65535");
  }

  redis.port = static_cast<std::uint16_t>(parsed_port);
}

bool apply_bounds_key(model::ParameterBounds& bounds, const std::string& key, const std::string& value) {
  const auto apply = [&](const std::string& name, model::ParameterRange& range) {
    if (key == "bounds." + name + ".min") {
      range.min = parse_double(key, value);
      return true;
    }
    if (key == "bounds." + name + ".max") {
      range.max = parse_double(key, value);
      return true;
    }
    return false;
  };

  return apply("time_constant_h", bounds.time_constant_h) || apply("heat_loss", bounds.heat_loss) ||
         apply("effectiveness", bounds.effectiveness) || apply("confidence", bounds.confidence);
}

bool apply_control_key(ControlConfig& control, const std::string& key, const std::string& value) {
  if (key == "control.outlet_min_c") {
    control.outlet_min_c = parse_double(key, value);
  } else if (key == "control.outlet_max_c") {
    control.outlet_max_c = parse_double(key, value);
  } else if (key == "control.max_change_per_cycle_c") {
    control.max_change_per_cycle_c = parse_positive(key, value);
  } else if (key == "control.smart_rounding") {
    control.smart_rounding = parse_bool(value);
  } else if (key == "control.search_resolution_c") {
    control.search_resolution_c = parse_positive(key, value);
  } else if (key == "control.max_search_iterations") {
    control.max_search_iterations = static_cast<std::uint32_t>(parse_count(key, value, 1));
  } else if (key == "control.min_outlet_above_outdoor_c") {
    control.min_outlet_above_outdoor_c = parse_non_negative(key, value);
  } else if (key == "control.shadow_mode") {
    control.shadow_mode = parse_bool(value);
  } else {
    return false;
  }
  return true;
}

bool apply_learning_key(LearningConfig& learning, const std::string& key, const std::string& value) {
  if (key == "learning.base_rate") {
    learning.base_rate = parse_positive(key, value);
  } else if (key == "learning.min_rate") {
    learning.min_rate = parse_positive(key, value);
  } else if (key == "learning.max_rate") {
    learning.max_rate = parse_positive(key, value);
  } else if (key == "learning.error_window") {
    learning.error_window = static_cast<std::size_t>(parse_count(key, value, 1));
    if (learning.error_window > model::kPredictionHistory) {
      throw std::runtime_error("learning.error_window must not exceed the prediction history capacity");
    }
  } else if (key == "learning.confidence_threshold_c") {
    learning.confidence_threshold_c = parse_positive(key, value);
  } else if (key == "learning.confidence_boost") {
    learning.confidence_boost = parse_double(key, value);
    if (learning.confidence_boost < 1.0) {
      throw std::runtime_error("learning.confidence_boost must be greater than or equal to 1");
    }
  } else if (key == "learning.confidence_decay") {
    learning.confidence_decay = parse_fraction(key, value);
  } else if (key == "learning.max_step_fraction") {
    learning.max_step_fraction = parse_fraction(key, value);
  } else if (key == "learning.clamp_warning_cycles") {
    learning.clamp_warning_cycles = static_cast<std::uint32_t>(parse_count(key, value, 1));
  } else if (key == "learning.training_cycles") {
    learning.training_cycles = parse_count(key, value, 0);
  } else if (key == "learning.low_confidence") {
    learning.low_confidence = parse_non_negative(key, value);
  } else if (key == "learning.epsilon_time_constant_h") {
    learning.epsilon_time_constant_h = parse_positive(key, value);
  } else if (key == "learning.epsilon_heat_loss") {
    learning.epsilon_heat_loss = parse_positive(key, value);
  } else if (key == "learning.epsilon_effectiveness") {
    learning.epsilon_effectiveness = parse_positive(key, value);
  } else {
    return false;
  }
  return true;
}

bool apply_correction_key(CorrectionConfig& correction, const std::string& key, const std::string& value) {
  if (key == "correction.deadband_c") {
    correction.deadband_c = parse_non_negative(key, value);
  } else if (key == "correction.max_correction_c") {
    correction.max_correction_c = parse_positive(key, value);
  } else if (key == "correction.open_window_jump_c") {
    correction.open_window_jump_c = parse_positive(key, value);
  } else if (key == "correction.open_window_sustain_cycles") {
    correction.open_window_sustain_cycles = static_cast<std::uint32_t>(parse_count(key, value, 1));
  } else if (key == "correction.open_window_clear_cycles") {
    correction.open_window_clear_cycles = static_cast<std::uint32_t>(parse_count(key, value, 1));
  } else if (key == "correction.open_window_decay") {
    correction.open_window_decay = parse_fraction(key, value);
    if (correction.open_window_decay >= 1.0) {
      throw std::runtime_error("correction.open_window_decay must be less than 1");
    }
  } else {
    return false;
  }
  return true;
}

bool apply_heat_source_key(HeatSourcesConfig& sources, const std::string& key, const std::string& value) {
  SolarConfig& solar = sources.solar;
  SecondaryHeaterConfig& heater = sources.secondary_heater;
  ElectronicsConfig& electronics = sources.electronics;

  if (key == "heat_sources.solar.pv_threshold_w") {
    solar.pv_threshold_w = parse_non_negative(key, value);
  } else if (key == "heat_sources.solar.pv_heating_factor") {
    solar.pv_heating_factor = parse_non_negative(key, value);
  } else if (key == "heat_sources.solar.max_forecast_age_s") {
    solar.max_forecast_age = std::chrono::seconds(parse_count(key, value, 1));
  } else if (key == "heat_sources.secondary_heater.on_differential_c") {
    heater.on_differential_c = parse_positive(key, value);
  } else if (key == "heat_sources.secondary_heater.off_differential_c") {
    heater.off_differential_c = parse_non_negative(key, value);
  } else if (key == "heat_sources.secondary_heater.coefficient_min_kw") {
    heater.coefficient_min_kw = parse_positive(key, value);
  } else if (key == "heat_sources.secondary_heater.coefficient_max_kw") {
    heater.coefficient_max_kw = parse_positive(key, value);
  } else if (key == "heat_sources.secondary_heater.coefficient_default_kw") {
    heater.coefficient_default_kw = parse_positive(key, value);
  } else if (key == "heat_sources.secondary_heater.learning_rate") {
    heater.learning_rate = parse_fraction(key, value);
  } else if (key == "heat_sources.secondary_heater.building_capacity_kwh_per_c") {
    heater.building_capacity_kwh_per_c = parse_positive(key, value);
  } else if (key == "heat_sources.secondary_heater.min_session_minutes") {
    heater.min_session = std::chrono::minutes(parse_count(key, value, 0));
  } else if (key == "heat_sources.secondary_heater.distribution_factor") {
    heater.distribution_factor = parse_fraction(key, value);
  } else if (key == "heat_sources.electronics.tv_kw") {
    electronics.tv_kw = parse_non_negative(key, value);
  } else if (key == "heat_sources.electronics.occupants") {
    electronics.occupants = static_cast<std::uint32_t>(parse_count(key, value, 0));
  } else if (key == "heat_sources.electronics.kw_per_occupant") {
    electronics.kw_per_occupant = parse_non_negative(key, value);
  } else {
    return false;
  }
  return true;
}

void apply_key_value(AgentConfig& config, const std::string& key, const std::string& value) {
  if (key == "cycle_minutes") {
    const auto minutes = parse_count(key, value, 1);
    if (minutes > 240) {
      throw std::runtime_error("cycle_minutes must be less than or equal to 240");
    }
    config.cycle_interval = std::chrono::minutes(minutes);
    return;
  }

  if (key == "blocking_poll_seconds") {
    config.blocking_poll_interval = std::chrono::seconds(parse_count(key, value, 1));
    return;
  }

  if (key == "agent.stdout_debug") {
    config.stdout_debug = parse_bool(value);
    return;
  }

  if (key == "agent.publish_health") {
    config.publish_health = parse_bool(value);
    return;
  }

  if (key == "io.snapshot_path") {
    config.io.snapshot_path = unquote(value);
    return;
  }

  if (key == "io.command_path") {
    config.io.command_path = unquote(value);
    return;
  }

  if (key == "io.state_path") {
    config.io.state_path = unquote(value);
    return;
  }

  if (key == "io.max_snapshot_age_s") {
    config.io.max_snapshot_age = std::chrono::seconds(parse_count(key, value, 1));
    return;
  }

  if (key == "physics.trajectory_horizon_hours") {
    config.physics.trajectory_horizon_hours = parse_positive(key, value);
    return;
  }

  if (key == "physics.trajectory_step_hours") {
    config.physics.trajectory_step_hours = parse_positive(key, value);
    return;
  }

  if (key == "physics.heat_units_per_kw") {
    config.physics.heat_units_per_kw = parse_non_negative(key, value);
    return;
  }

  if (key == "blocking.grace_max_minutes") {
    config.blocking.grace_max = std::chrono::minutes(parse_count(key, value, 1));
    return;
  }

  if (key == "blocking.stabilization_margin_c") {
    config.blocking.stabilization_margin_c = parse_non_negative(key, value);
    return;
  }

  if (key == "calibration.max_samples") {
    config.calibration.max_samples = static_cast<std::size_t>(parse_count(key, value, 2));
    return;
  }

  if (key == "calibration.min_pairs") {
    config.calibration.min_pairs = static_cast<std::size_t>(parse_count(key, value, 1));
    return;
  }

  if (key == "calibration.grace_skip_minutes") {
    config.calibration.grace_skip = std::chrono::minutes(parse_count(key, value, 0));
    return;
  }

  if (key == "redis.address") {
    apply_redis_address(config.redis, unquote(value));
    return;
  }

  if (key == "redis.key_prefix") {
    config.redis.key_prefix = unquote(value);
    return;
  }

  if (key == "redis.password") {
    config.redis.password = unquote(value);
    return;
  }

  if (key == "redis.db") {
    const auto db = parse_count(key, value, 0);
    if (db > 15) {
      throw std::runtime_error("redis.db must be in range 0..15");
    }
    config.redis.db = static_cast<int>(db);
    return;
  }

  if (key == "redis.retention_hours") {
    config.redis.retention = std::chrono::hours(parse_count(key, value, 0));
    return;
  }

  if (key.rfind("bounds.", 0) == 0) {
    apply_bounds_key(config.bounds, key, value);
    return;
  }

  if (apply_control_key(config.control, key, value)) {
    return;
  }
  if (apply_learning_key(config.learning, key, value)) {
    return;
  }
  if (apply_correction_key(config.correction, key, value)) {
    return;
  }
  apply_heat_source_key(config.heat_sources, key, value);
}

void require_range(const model::ParameterRange& range, const char* name) {
  if (!(range.min < range.max)) {
    throw std::runtime_error(std::string("bounds.") + name + " min must be less than max");
  }
  if (range.min < 0.0) {
    throw std::runtime_error(std::string("bounds.") + name + " must not be negative");
  }
}

}  // namespace

void validate_agent_config(const AgentConfig& config) {
  if (!(config.control.outlet_min_c < config.control.outlet_max_c)) {
    throw std::runtime_error("control.outlet_min_c must be less than control.outlet_max_c");
  }

  require_range(config.bounds.time_constant_h, "time_constant_h");
  require_range(config.bounds.heat_loss, "heat_loss");
  require_range(config.bounds.effectiveness, "effectiveness");
  require_range(config.bounds.confidence, "confidence");
  if (config.bounds.time_constant_h.min <= 0.0) {
    throw std::runtime_error("bounds.time_constant_h.min must be greater than 0");
  }

  if (config.learning.min_rate > config.learning.max_rate) {
    throw std::runtime_error("learning.min_rate must not exceed learning.max_rate");
  }

  if (config.heat_sources.secondary_heater.off_differential_c >= config.heat_sources.secondary_heater.on_differential_c) {
    throw std::runtime_error("heat_sources.secondary_heater.off_differential_c must be below on_differential_c");
  }
  if (config.heat_sources.secondary_heater.coefficient_min_kw >= config.heat_sources.secondary_heater.coefficient_max_kw) {
    throw std::runtime_error("heat_sources.secondary_heater.coefficient_min_kw must be below coefficient_max_kw");
  }

  const double steps = config.physics.trajectory_horizon_hours / config.physics.trajectory_step_hours;
  if (steps < 1.0 || steps > static_cast<double>(model::kForecastSteps) + 1e-9) {
    throw std::runtime_error("physics.trajectory_horizon_hours must cover 1.." +
                             std::to_string(model::kForecastSteps) + " trajectory steps");
  }

  if (config.blocking_poll_interval > config.cycle_interval) {
    throw std::runtime_error("blocking_poll_seconds must not exceed cycle_minutes");
  }
}

model::LearningState default_learning_state(const AgentConfig& config) {
  model::LearningState state{};
  const model::ParameterBounds& bounds = config.bounds;
  state.parameters.thermal_time_constant_h = bounds.time_constant_h.clamp(state.parameters.thermal_time_constant_h);
  state.parameters.heat_loss_coefficient = bounds.heat_loss.clamp(state.parameters.heat_loss_coefficient);
  state.parameters.outlet_effectiveness = bounds.effectiveness.clamp(state.parameters.outlet_effectiveness);
  state.parameters.learning_confidence = bounds.confidence.clamp(state.parameters.learning_confidence);

  const SecondaryHeaterConfig& heater = config.heat_sources.secondary_heater;
  state.secondary_heater.coefficient_kw =
      std::clamp(heater.coefficient_default_kw, heater.coefficient_min_kw, heater.coefficient_max_kw);
  return state;
}

AgentConfig load_agent_config(const std::string& path) {
  AgentConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections.resize(depth);
        sections.push_back(key);
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  validate_agent_config(config);
  return config;
}

}  // namespace heat_agent::core
