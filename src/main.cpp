#include <csignal>
#include <cstring>
#include <iostream>
#include <sstream>
#include <string>

#include "core/agent.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "modes/calibration.hpp"
#include "modes/validation.hpp"
#include "store/learning_state_store.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

int run_calibration(const heat_agent::core::AgentConfig& config, const std::string& history_path) {
  try {
    const heat_agent::modes::CalibrationSummary summary =
        heat_agent::modes::calibrate_from_history(history_path, config);
    const heat_agent::store::LearningStateStore store(config.io.state_path,
                                                      heat_agent::core::default_learning_state(config));
    store.save(summary.state);

    const heat_agent::model::ThermalParameters& params = summary.state.parameters;
    std::cerr << "[calibrate] lines=" << summary.lines_read << " pairs_used=" << summary.pairs_used
              << " pairs_skipped=" << summary.pairs_skipped << " tau=" << params.thermal_time_constant_h
              << "h heat_loss=" << params.heat_loss_coefficient << " effectiveness=" << params.outlet_effectiveness
              << " confidence=" << params.learning_confidence << " -> " << config.io.state_path << '\n';
  } catch (const heat_agent::core::PersistenceFault& ex) {
    std::cerr << "[calibrate] save failed: " << ex.what() << '\n';
    return 1;
  } catch (const std::runtime_error& ex) {
    std::cerr << "[calibrate] " << ex.what() << '\n';
    return 1;
  }
  return 0;
}

int run_validation(const heat_agent::core::AgentConfig& config) {
  const heat_agent::modes::ValidationReport report = heat_agent::modes::run_validation(config);
  std::cout << heat_agent::modes::format_validation_report(report) << '\n';
  return report.passed() ? 0 : 2;
}

}  // namespace

std::string format_config_settings(const heat_agent::core::AgentConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[agent] loaded config from " << config_path
         << " | cycle_minutes=" << config.cycle_interval.count()
         << " | blocking_poll_seconds=" << config.blocking_poll_interval.count()
         << " | outlet_range_c=" << config.control.outlet_min_c << ".." << config.control.outlet_max_c
         << " | max_change_per_cycle_c=" << config.control.max_change_per_cycle_c
         << " | state_path=" << config.io.state_path
         << " | publish_health=" << (config.publish_health ? "true" : "false")
         << " | stdout_debug=" << (config.stdout_debug ? "true" : "false")
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false")
         << " | redis_address=";

  if (!config.redis.unix_socket.empty()) {
    output << "unix://" << config.redis.unix_socket;
  } else {
    output << config.redis.host << ':' << config.redis.port;
  }
  return output.str();
}

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  const std::string config_path = argc > 1 ? argv[1] : "configs/heat_agent.yaml";

  heat_agent::core::AgentConfig config{};
  try {
    config = heat_agent::core::load_agent_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  if (argc > 2) {
    if (std::strcmp(argv[2], "--validate") == 0) {
      return run_validation(config);
    }
    if (std::strcmp(argv[2], "--calibrate") == 0 && argc > 3) {
      return run_calibration(config, argv[3]);
    }
    std::cerr << "usage: " << argv[0] << " [config.yaml] [--validate | --calibrate <history.jsonl>]\n";
    return 1;
  }

  heat_agent::core::Agent agent{config};
  while (g_shutdown_requested == 0) {
    agent.run_for_ticks(1);
  }

  std::cerr << "[agent] shutdown signal received; exiting cleanly\n";

  return 0;
}
