#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>
#include <nlohmann/json.hpp>

#include "control/blocking_state_machine.hpp"
#include "core/agent.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/scheduler.hpp"
#include "core/timestamp.hpp"
#include "io/command_sink.hpp"
#include "io/snapshot_source.hpp"
#include "modes/calibration.hpp"
#include "modes/validation.hpp"
#include "physics/thermal_model.hpp"
#include "sinks/redis_ts.hpp"

using heat_agent::control::blocking_phase;
using heat_agent::core::Agent;
using heat_agent::core::AgentConfig;
using heat_agent::core::AgentStats;
using heat_agent::core::CycleScheduler;
using heat_agent::core::NetworkError;
using heat_agent::core::NoDataError;
using heat_agent::core::load_agent_config;
using heat_agent::io::CommandSink;
using heat_agent::io::SnapshotSource;
using heat_agent::model::CycleReport;
using heat_agent::model::OutletCommand;
using heat_agent::model::SensorSnapshot;
using heat_agent::model::control_status;
using heat_agent::sinks::RedisTsOptions;
using heat_agent::sinks::RedisTsSink;

namespace {

struct RedisMockState {
  std::vector<std::string> last_argv{};
  int command_argv_calls{0};
};

RedisMockState g_redis_mock{};

extern "C" {

redisContext* redisConnectWithTimeout(const char*, int, const struct timeval) {
  auto* context = static_cast<redisContext*>(std::calloc(1, sizeof(redisContext)));
  context->err = REDIS_OK;
  return context;
}

redisContext* redisConnectUnixWithTimeout(const char*, const struct timeval) {
  auto* context = static_cast<redisContext*>(std::calloc(1, sizeof(redisContext)));
  context->err = REDIS_OK;
  return context;
}

void redisFree(redisContext* c) { std::free(c); }

void* redisCommand(redisContext*, const char*, ...) {
  auto* reply = static_cast<redisReply*>(std::calloc(1, sizeof(redisReply)));
  reply->type = REDIS_REPLY_STATUS;
  return reply;
}

void* redisCommandArgv(redisContext*, int argc, const char** argv, const size_t*) {
  g_redis_mock.command_argv_calls += 1;
  g_redis_mock.last_argv.clear();
  for (int i = 0; i < argc; ++i) {
    g_redis_mock.last_argv.emplace_back(argv[i]);
  }
  auto* reply = static_cast<redisReply*>(std::calloc(1, sizeof(redisReply)));
  reply->type = REDIS_REPLY_ARRAY;
  return reply;
}

void freeReplyObject(void* reply) { std::free(reply); }

}  // extern "C"

constexpr std::int64_t kNow = 1'700'000'000;

std::optional<double> published_value(const std::string& key) {
  const std::vector<std::string>& argv = g_redis_mock.last_argv;
  for (std::size_t i = 1; i + 2 < argv.size(); i += 3) {
    if (argv[i] == key) {
      return std::stod(argv[i + 2]);
    }
  }
  return std::nullopt;
}

bool almost_equal(double a, double b, double eps = 1e-6) {
  return std::fabs(a - b) <= eps;
}

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

enum class feed_failure { NONE, NETWORK, NO_DATA };

struct Feed {
  SensorSnapshot snapshot{};
  feed_failure failure{feed_failure::NONE};
};

class FakeSource final : public SnapshotSource {
 public:
  explicit FakeSource(std::shared_ptr<Feed> feed) : feed_(std::move(feed)) {}

  SensorSnapshot fetch() override {
    if (feed_->failure == feed_failure::NETWORK) {
      throw NetworkError("bridge offline");
    }
    if (feed_->failure == feed_failure::NO_DATA) {
      throw NoDataError({"indoor_temp", "outdoor_temp"});
    }
    return feed_->snapshot;
  }

 private:
  std::shared_ptr<Feed> feed_;
};

struct Outbox {
  std::vector<OutletCommand> commands{};
  bool fail{false};
};

class FakeSink final : public CommandSink {
 public:
  explicit FakeSink(std::shared_ptr<Outbox> outbox) : outbox_(std::move(outbox)) {}

  void emit(const OutletCommand& command) override {
    if (outbox_->fail) {
      throw NetworkError("actuator unreachable");
    }
    outbox_->commands.push_back(command);
  }

 private:
  std::shared_ptr<Outbox> outbox_;
};

std::filesystem::path temp_path(const char* name) {
  const auto path = std::filesystem::temp_directory_path() / name;
  std::filesystem::remove(path);
  std::filesystem::remove(path.string() + ".tmp");
  return path;
}

AgentConfig test_config(const std::filesystem::path& state_path) {
  AgentConfig config{};
  config.io.state_path = state_path.string();
  config.stdout_debug = false;
  return config;
}

SensorSnapshot scenario_snapshot(std::int64_t timestamp_s) {
  SensorSnapshot snapshot{};
  snapshot.timestamp_s = timestamp_s;
  snapshot.indoor_c = 20.4;
  snapshot.target_indoor_c = 21.0;
  snapshot.outdoor_c = 5.0;
  snapshot.outlet_actual_c = 30.0;
  snapshot.heating_on = true;
  return snapshot;
}

struct Harness {
  std::shared_ptr<Feed> feed{std::make_shared<Feed>()};
  std::shared_ptr<Outbox> outbox{std::make_shared<Outbox>()};
  std::unique_ptr<Agent> agent{};

  explicit Harness(const AgentConfig& config) {
    agent = std::make_unique<Agent>(config, std::make_unique<FakeSource>(feed), std::make_unique<FakeSink>(outbox));
  }
};

bool expect_config_error(const char* file_name, const std::string& content) {
  const auto path = std::filesystem::temp_directory_path() / file_name;
  {
    std::ofstream out(path);
    out << content;
  }
  bool threw = false;
  try {
    (void)load_agent_config(path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  std::filesystem::remove(path);
  return threw;
}

int test_config_parsing_edge_cases() {
  if (!expect_config_error("heat_agent_bad_port.yaml", "redis:\n  address: localhost:99999\n")) {
    return fail("test_config_parsing_edge_cases", "bad redis port should throw");
  }
  if (!expect_config_error("heat_agent_bad_db.yaml", "redis:\n  db: 16\n")) {
    return fail("test_config_parsing_edge_cases", "redis db above 15 should throw");
  }
  if (!expect_config_error("heat_agent_bad_float.yaml", "control:\n  outlet_max_c: warm\n")) {
    return fail("test_config_parsing_edge_cases", "invalid float should throw");
  }
  if (!expect_config_error("heat_agent_bad_cycle.yaml", "cycle_minutes: 0\n")) {
    return fail("test_config_parsing_edge_cases", "zero cycle length should throw");
  }
  if (!expect_config_error("heat_agent_long_cycle.yaml", "cycle_minutes: 241\n")) {
    return fail("test_config_parsing_edge_cases", "cycle above 240 minutes should throw");
  }
  if (!expect_config_error("heat_agent_bad_bounds.yaml",
                           "bounds:\n  heat_loss:\n    min: 0.2\n    max: 0.1\n")) {
    return fail("test_config_parsing_edge_cases", "inverted bounds should throw");
  }
  if (!expect_config_error("heat_agent_bad_outlet.yaml", "control:\n  outlet_min_c: 70\n")) {
    return fail("test_config_parsing_edge_cases", "outlet_min above outlet_max should throw");
  }
  if (!expect_config_error("heat_agent_bad_hysteresis.yaml",
                           "heat_sources:\n  secondary_heater:\n    off_differential_c: 2.5\n")) {
    return fail("test_config_parsing_edge_cases", "off threshold above on threshold should throw");
  }
  if (!expect_config_error("heat_agent_bad_poll.yaml", "cycle_minutes: 1\nblocking_poll_seconds: 120\n")) {
    return fail("test_config_parsing_edge_cases", "poll slower than the cycle should throw");
  }
  return 0;
}

int test_config_nested_sections() {
  const auto path = std::filesystem::temp_directory_path() / "heat_agent_nested.yaml";
  {
    std::ofstream out(path);
    out << "# site config\n"
           "cycle_minutes: 15\n"
           "blocking_poll_seconds: 30\n"
           "agent:\n"
           "  stdout_debug: false\n"
           "bounds:\n"
           "  effectiveness:\n"
           "    min: 0.35  # tighter\n"
           "    max: 1.2\n"
           "control:\n"
           "  max_change_per_cycle_c: 3.5\n"
           "  smart_rounding: off\n"
           "  shadow_mode: yes\n"
           "heat_sources:\n"
           "  electronics:\n"
           "    occupants: 4\n"
           "redis:\n"
           "  address: unix:///run/redis/redis.sock\n"
           "  key_prefix: \"home:heat\"\n"
           "  db: 2\n"
           "  retention_hours: 48\n"
           "unknown_section:\n"
           "  ignored: 1\n";
  }

  AgentConfig config{};
  try {
    config = load_agent_config(path.string());
  } catch (const std::exception& ex) {
    std::filesystem::remove(path);
    std::cerr << ex.what() << '\n';
    return fail("test_config_nested_sections", "valid config should load");
  }
  std::filesystem::remove(path);

  if (config.cycle_interval != std::chrono::minutes(15) || config.blocking_poll_interval != std::chrono::seconds(30)) {
    return fail("test_config_nested_sections", "timing keys not applied");
  }
  if (config.stdout_debug || config.control.smart_rounding || !config.control.shadow_mode || !almost_equal(config.control.max_change_per_cycle_c, 3.5)) {
    return fail("test_config_nested_sections", "agent/control keys not applied");
  }
  if (!almost_equal(config.bounds.effectiveness.min, 0.35) || !almost_equal(config.bounds.effectiveness.max, 1.2)) {
    return fail("test_config_nested_sections", "nested bounds not applied");
  }
  if (config.heat_sources.electronics.occupants != 4) {
    return fail("test_config_nested_sections", "heat source keys not applied");
  }
  if (!config.redis.enabled || config.redis.unix_socket != "/run/redis/redis.sock" ||
      config.redis.key_prefix != "home:heat" || config.redis.db != 2 ||
      config.redis.retention != std::chrono::hours(48)) {
    return fail("test_config_nested_sections", "redis keys not applied");
  }
  return 0;
}

int test_scheduler_multiplexes_cycles() {
  CycleScheduler scheduler(3);
  std::vector<bool> due;
  for (int i = 0; i < 7; ++i) {
    due.push_back(scheduler.cycle_due());
    scheduler.advance();
  }
  const std::vector<bool> expected{true, false, false, true, false, false, true};
  if (due != expected) {
    return fail("test_scheduler_multiplexes_cycles", "control cycle should run every third tick");
  }
  return 0;
}

int test_snapshot_parsing_reports_missing_fields() {
  bool threw = false;
  try {
    (void)heat_agent::io::parse_snapshot(nlohmann::json::parse(R"({"indoor_temp": 20.5, "outdoor_temp": "n/a"})"));
  } catch (const NoDataError& ex) {
    threw = true;
    const std::vector<std::string> expected{"target_indoor_temp", "outdoor_temp", "outlet_temp_actual", "heating_mode",
                                            "timestamp"};
    if (ex.missing() != expected) {
      return fail("test_snapshot_parsing_reports_missing_fields", "every missing field should be listed");
    }
  }
  if (!threw) {
    return fail("test_snapshot_parsing_reports_missing_fields", "missing fields should raise NoDataError");
  }

  const SensorSnapshot parsed = heat_agent::io::parse_snapshot(nlohmann::json::parse(R"({
    "timestamp": 1700000000, "indoor_temp": 20.5, "target_indoor_temp": 21, "outdoor_temp": -3.5,
    "outlet_temp_actual": 33, "heating_mode": "off", "pv_power_w": 420, "tv_on": "on",
    "blocking": {"dhw": true},
    "forecast": {"issued_at": 1699999000, "outdoor_temp": [-4, -5, null, -7], "pv_power_w": [100, 50]}
  })"));
  if (parsed.heating_on || !parsed.blocking.dhw || parsed.blocking.defrost || !parsed.tv_on) {
    return fail("test_snapshot_parsing_reports_missing_fields", "flags not parsed");
  }
  if (parsed.pv_power_w != 420.0 || parsed.other_rooms_c.has_value()) {
    return fail("test_snapshot_parsing_reports_missing_fields", "optional readings not parsed");
  }
  if (parsed.forecast.outdoor_c[1] != -5.0 || parsed.forecast.outdoor_c[2].has_value() ||
      parsed.forecast.pv_power_w[2].has_value() || parsed.forecast.issued_at_s != 1699999000) {
    return fail("test_snapshot_parsing_reports_missing_fields", "forecast vectors not parsed");
  }
  return 0;
}

int test_file_boundary_errors() {
  const auto snapshot_path = temp_path("heat_agent_snapshot.json");
  heat_agent::io::JsonFileSnapshotSource source(snapshot_path.string(), std::chrono::seconds(900));

  bool missing_threw = false;
  try {
    (void)source.fetch();
  } catch (const NetworkError&) {
    missing_threw = true;
  }

  {
    std::ofstream out(snapshot_path);
    out << R"({"timestamp": 1000, "indoor_temp": 20, "target_indoor_temp": 21, "outdoor_temp": 0,
              "outlet_temp_actual": 30, "heating_mode": "heat"})";
  }
  bool stale_threw = false;
  try {
    (void)source.fetch();
  } catch (const NetworkError&) {
    stale_threw = true;
  }
  std::filesystem::remove(snapshot_path);

  if (!missing_threw || !stale_threw) {
    return fail("test_file_boundary_errors", "unreachable or stale snapshots should raise NetworkError");
  }

  const auto command_path = temp_path("heat_agent_command.json");
  heat_agent::io::JsonFileCommandSink sink(command_path.string());
  sink.emit(OutletCommand{kNow, 34.0, control_status::LOW_CONFIDENCE, false});

  std::ifstream in(command_path);
  const nlohmann::json written = nlohmann::json::parse(in);
  std::filesystem::remove(command_path);
  if (written.at("outlet_temp").get<double>() != 34.0 || written.at("status").get<std::string>() != "low_confidence" ||
      written.at("status_code").get<int>() != 1 || written.at("held").get<bool>()) {
    return fail("test_file_boundary_errors", "command document fields mismatch");
  }
  return 0;
}

int test_redis_sink_publish_logic() {
  g_redis_mock = {};

  RedisTsOptions options;
  options.publish_health = false;
  options.key_prefix = "edge:test";

  RedisTsSink sink(options);
  CycleReport report{};
  report.status = control_status::OK;
  report.final_outlet_c = 34.0;

  if (!sink.publish(report)) {
    return fail("test_redis_sink_publish_logic", "publish should succeed with mock redis");
  }
  if (g_redis_mock.command_argv_calls != 1) {
    return fail("test_redis_sink_publish_logic", "expected one TS.MADD call");
  }
  if (g_redis_mock.last_argv.empty() || g_redis_mock.last_argv.front() != "TS.MADD") {
    return fail("test_redis_sink_publish_logic", "TS.MADD command not emitted");
  }

  bool found_outlet = false;
  for (std::size_t i = 0; i < g_redis_mock.last_argv.size(); ++i) {
    const std::string& arg = g_redis_mock.last_argv[i];
    if (arg.find("health:") != std::string::npos) {
      return fail("test_redis_sink_publish_logic", "health metrics should be omitted when disabled");
    }
    if (arg == "edge:test:outlet:suggested") {
      return fail("test_redis_sink_publish_logic", "absent values should not be published");
    }
    if (arg == "edge:test:outlet:final" && i + 2 < g_redis_mock.last_argv.size()) {
      found_outlet = g_redis_mock.last_argv[i + 2].find("34") == 0;
    }
  }
  if (!found_outlet) {
    return fail("test_redis_sink_publish_logic", "expected outlet:final in TS.MADD payload");
  }
  return 0;
}

int test_redis_health_metrics_published() {
  g_redis_mock = {};

  RedisTsOptions options;
  options.publish_health = true;
  options.key_prefix = "edge:test";

  RedisTsSink sink(options);
  CycleReport report{};
  report.status = control_status::BLOCKED;
  report.blocking_reasons = {"dhw"};
  report.health.model_health = 0.75;

  if (!sink.publish(report)) {
    return fail("test_redis_health_metrics_published", "publish should succeed with mock redis");
  }

  bool found_health = false;
  bool found_blocking = false;
  for (std::size_t i = 0; i + 2 < g_redis_mock.last_argv.size(); ++i) {
    if (g_redis_mock.last_argv[i] == "edge:test:health:model") {
      found_health = g_redis_mock.last_argv[i + 2].find("0.75") == 0;
    }
    if (g_redis_mock.last_argv[i] == "edge:test:blocking:active") {
      found_blocking = g_redis_mock.last_argv[i + 2].find("1") == 0;
    }
  }
  if (!found_health || !found_blocking) {
    return fail("test_redis_health_metrics_published", "expected health and blocking metrics");
  }
  return 0;
}

int test_agent_control_cycle_and_learning() {
  const auto state_path = temp_path("heat_agent_cycle_state.json");
  Harness harness(test_config(state_path));
  harness.feed->snapshot = scenario_snapshot(kNow);

  const CycleReport first = harness.agent->run_cycle();
  if (first.status != control_status::TRAINING || harness.outbox->commands.size() != 1) {
    return fail("test_agent_control_cycle_and_learning", "first cycle should emit a training command");
  }
  const double first_outlet = harness.outbox->commands.back().outlet_c;
  if (first_outlet != std::round(first_outlet) || first_outlet < 14.0 || first_outlet > 65.0) {
    return fail("test_agent_control_cycle_and_learning", "command should be a rounded safe setpoint");
  }
  if (!first.predicted_indoor_c.has_value() || !harness.agent->learning_state().operational.pending.has_value()) {
    return fail("test_agent_control_cycle_and_learning", "a pending prediction should be recorded");
  }
  if (!std::filesystem::exists(state_path)) {
    return fail("test_agent_control_cycle_and_learning", "state should be persisted every cycle");
  }

  harness.feed->snapshot = scenario_snapshot(kNow + 1800);
  harness.feed->snapshot.indoor_c = *first.predicted_indoor_c;
  const CycleReport second = harness.agent->run_cycle();

  const auto& state = harness.agent->learning_state();
  if (state.predictions.size() != 1 || state.parameter_updates.size() != 1 || state.cycle_count != 2) {
    return fail("test_agent_control_cycle_and_learning", "second cycle should learn from the first outcome");
  }
  if (std::fabs(state.predictions.back().error()) > 1e-9) {
    return fail("test_agent_control_cycle_and_learning", "a perfect prediction should have no error");
  }
  if (!(state.parameters.learning_confidence > 3.0)) {
    return fail("test_agent_control_cycle_and_learning", "accurate prediction should raise confidence");
  }
  if (std::fabs(harness.outbox->commands.back().outlet_c - first_outlet) > 2.0 || second.open_window) {
    return fail("test_agent_control_cycle_and_learning", "command change should respect the per-cycle cap");
  }

  std::filesystem::remove(state_path);
  return 0;
}

int test_agent_blocking_hold_and_grace() {
  const auto state_path = temp_path("heat_agent_blocking_state.json");
  Harness harness(test_config(state_path));
  harness.feed->snapshot = scenario_snapshot(kNow);
  (void)harness.agent->run_cycle();
  harness.feed->snapshot.timestamp_s = kNow + 1800;
  (void)harness.agent->run_cycle();

  const double applied = harness.outbox->commands.back().outlet_c;
  const auto predictions_before = harness.agent->learning_state().predictions.size();
  const auto parameters_before = harness.agent->learning_state().parameters;

  // DHW starts between cycles; the poll holds the last command.
  harness.feed->snapshot.timestamp_s = kNow + 2400;
  harness.feed->snapshot.blocking.dhw = true;
  harness.feed->snapshot.outlet_actual_c = 50.0;
  harness.agent->poll_blocking();
  if (harness.agent->blocking_phase() != blocking_phase::BLOCKED || !harness.outbox->commands.back().held ||
      harness.outbox->commands.back().outlet_c != applied) {
    return fail("test_agent_blocking_hold_and_grace", "blocking onset should hold the pre-block command");
  }

  harness.feed->snapshot.timestamp_s = kNow + 3600;
  const CycleReport blocked = harness.agent->run_cycle();
  if (blocked.status != control_status::BLOCKED || blocked.blocking_reasons != std::vector<std::string>{"dhw"}) {
    return fail("test_agent_blocking_hold_and_grace", "cycle during DHW should report BLOCKED");
  }
  if (!(harness.agent->learning_state().parameters == parameters_before) ||
      harness.agent->learning_state().operational.pending.has_value()) {
    return fail("test_agent_blocking_hold_and_grace", "blocked cycles must not learn or predict");
  }

  harness.feed->snapshot.timestamp_s = kNow + 3660;
  harness.feed->snapshot.blocking.dhw = false;
  harness.agent->poll_blocking();
  if (harness.agent->blocking_phase() != blocking_phase::GRACE ||
      !almost_equal(harness.outbox->commands.back().outlet_c, applied + 2.0)) {
    return fail("test_agent_blocking_hold_and_grace", "grace should hold the cooldown interim target");
  }

  harness.feed->snapshot.timestamp_s = kNow + 3720;
  harness.feed->snapshot.outlet_actual_c = applied + 1.0;
  const CycleReport resumed = harness.agent->run_cycle();
  if (harness.agent->blocking_phase() != blocking_phase::NORMAL || resumed.status == control_status::BLOCKED) {
    return fail("test_agent_blocking_hold_and_grace", "cooled outlet should resume control");
  }
  if (harness.agent->learning_state().predictions.size() != predictions_before) {
    return fail("test_agent_blocking_hold_and_grace", "the first cycle after a block must skip learning");
  }
  if (harness.agent->learning_state().operational.last_block_kind != "dhw") {
    return fail("test_agent_blocking_hold_and_grace", "completed block kind should be recorded");
  }
  // After DHW the change is measured from the measured outlet.
  if (std::fabs(harness.outbox->commands.back().outlet_c - (applied + 1.0)) > 2.0) {
    return fail("test_agent_blocking_hold_and_grace", "post-DHW command should step from the actual outlet");
  }

  std::filesystem::remove(state_path);
  return 0;
}

int test_agent_fault_statuses() {
  const auto state_path = temp_path("heat_agent_fault_state.json");
  Harness harness(test_config(state_path));

  harness.feed->failure = feed_failure::NETWORK;
  CycleReport report = harness.agent->run_cycle();
  if (report.status != control_status::NETWORK_ERROR || !harness.outbox->commands.empty()) {
    return fail("test_agent_fault_statuses", "unreachable collaborator should report NETWORK_ERROR");
  }

  harness.feed->failure = feed_failure::NO_DATA;
  report = harness.agent->run_cycle();
  if (report.status != control_status::NO_DATA || report.missing_inputs.size() != 2) {
    return fail("test_agent_fault_statuses", "missing inputs should report NO_DATA with field names");
  }

  harness.feed->failure = feed_failure::NONE;
  harness.feed->snapshot = scenario_snapshot(kNow);
  harness.feed->snapshot.heating_on = false;
  report = harness.agent->run_cycle();
  if (report.status != control_status::HEATING_OFF || !harness.outbox->commands.empty()) {
    return fail("test_agent_fault_statuses", "heating off should issue no command");
  }

  harness.feed->snapshot.heating_on = true;
  harness.outbox->fail = true;
  report = harness.agent->run_cycle();
  if (report.status != control_status::NETWORK_ERROR || report.last_error.empty() ||
      harness.agent->learning_state().operational.pending.has_value()) {
    return fail("test_agent_fault_statuses", "undelivered command should report NETWORK_ERROR");
  }

  harness.outbox->fail = false;
  harness.feed->snapshot.timestamp_s = kNow + 1800;
  (void)harness.agent->run_cycle();
  const auto cycles_before = harness.agent->learning_state().cycle_count;
  const double applied = harness.outbox->commands.back().outlet_c;

  harness.feed->snapshot.timestamp_s = kNow + 3600;
  harness.feed->snapshot.outdoor_c = std::numeric_limits<double>::quiet_NaN();
  report = harness.agent->run_cycle();
  if (report.status != control_status::MODEL_ERROR || !harness.outbox->commands.back().held ||
      harness.outbox->commands.back().outlet_c != applied) {
    return fail("test_agent_fault_statuses", "integrity fault should hold the last safe command");
  }
  if (harness.agent->learning_state().cycle_count != cycles_before || !(report.health.physics_alignment < 1.0)) {
    return fail("test_agent_fault_statuses", "integrity fault should not count as a cycle");
  }

  std::filesystem::remove(state_path);
  return 0;
}

int test_agent_publishes_degraded_and_stability_flags() {
  g_redis_mock = {};
  const auto state_path = temp_path("heat_agent_flags_state.json");
  AgentConfig config = test_config(state_path);
  config.redis.enabled = true;
  config.redis.key_prefix = "flags";
  config.control.max_search_iterations = 2;
  // Effectiveness starts on its lower bound; over-predicted warming keeps pushing it below.
  config.bounds.effectiveness = {0.40, 0.45};

  Harness harness(config);
  harness.feed->snapshot = scenario_snapshot(kNow);
  CycleReport report = harness.agent->run_cycle();
  if (!report.search_degraded || published_value("flags:solver:degraded") != 1.0) {
    return fail("test_agent_publishes_degraded_and_stability_flags", "capped search should publish degraded");
  }
  if (published_value("flags:learner:stability_warning") != 0.0 ||
      published_value("flags:corrector:open_window") != 0.0) {
    return fail("test_agent_publishes_degraded_and_stability_flags", "quiet flags should publish zero");
  }

  for (std::int64_t cycle = 1; cycle <= 3; ++cycle) {
    harness.feed->snapshot.timestamp_s = kNow + cycle * 1800;
    report = harness.agent->run_cycle();
  }
  if (!report.stability_warning || published_value("flags:learner:stability_warning") != 1.0) {
    return fail("test_agent_publishes_degraded_and_stability_flags", "third pinned cycle should publish a warning");
  }
  const std::optional<double> stability = published_value("flags:health:parameter_stability");
  if (!stability.has_value() || *stability > 0.25 || report.health.parameter_stability > 0.25) {
    return fail("test_agent_publishes_degraded_and_stability_flags", "pinned parameter should lower stability");
  }

  std::filesystem::remove(state_path);
  return 0;
}

int test_agent_shadow_mode_observes_only() {
  const auto state_path = temp_path("heat_agent_shadow_state.json");
  AgentConfig config = test_config(state_path);
  config.control.shadow_mode = true;

  Harness harness(config);
  harness.feed->snapshot = scenario_snapshot(kNow);
  const CycleReport first = harness.agent->run_cycle();
  const auto& operational = harness.agent->learning_state().operational;
  if (!first.suggested_outlet_c.has_value() || !first.final_outlet_c.has_value() ||
      !harness.outbox->commands.empty()) {
    return fail("test_agent_shadow_mode_observes_only", "suggestion should be reported but never written");
  }
  if (!operational.pending.has_value() || operational.pending->context.outlet_c != 30.0) {
    return fail("test_agent_shadow_mode_observes_only", "prediction should use the outlet actually applied");
  }

  harness.feed->snapshot.timestamp_s = kNow + 1800;
  harness.feed->snapshot.indoor_c = 20.5;
  (void)harness.agent->run_cycle();
  const auto& state = harness.agent->learning_state();
  if (state.predictions.size() != 1 || state.predictions.back().context.outlet_c != 30.0) {
    return fail("test_agent_shadow_mode_observes_only", "learning should pair the applied outlet with the outcome");
  }

  harness.feed->snapshot.timestamp_s = kNow + 3600;
  harness.feed->snapshot.blocking.dhw = true;
  harness.feed->snapshot.outlet_actual_c = 50.0;
  const CycleReport blocked = harness.agent->run_cycle();
  if (blocked.status != control_status::BLOCKED || !harness.outbox->commands.empty()) {
    return fail("test_agent_shadow_mode_observes_only", "blocking should be reported without a held command");
  }

  harness.feed->snapshot.timestamp_s = kNow + 3660;
  harness.feed->snapshot.blocking.dhw = false;
  harness.agent->poll_blocking();
  if (harness.agent->blocking_phase() != blocking_phase::NORMAL || !harness.outbox->commands.empty()) {
    return fail("test_agent_shadow_mode_observes_only", "shadow mode should skip the grace wait");
  }

  std::filesystem::remove(state_path);
  return 0;
}

int test_agent_warm_restart() {
  const auto state_path = temp_path("heat_agent_restart_state.json");
  const AgentConfig config = test_config(state_path);
  double applied = 0.0;
  {
    Harness harness(config);
    harness.feed->snapshot = scenario_snapshot(kNow);
    (void)harness.agent->run_cycle();
    harness.feed->snapshot.timestamp_s = kNow + 1800;
    (void)harness.agent->run_cycle();
    applied = harness.outbox->commands.back().outlet_c;
  }

  Harness restarted(config);
  const auto& state = restarted.agent->learning_state();
  if (state.cycle_count != 2 || state.predictions.size() != 1 || state.operational.last_applied_outlet_c != applied ||
      !state.operational.pending.has_value()) {
    return fail("test_agent_warm_restart", "restart should resume learned and operational state");
  }

  std::filesystem::remove(state_path);
  return 0;
}

int test_agent_run_for_ticks_multiplexes_polls() {
  const auto state_path = temp_path("heat_agent_ticks_state.json");
  AgentConfig config = test_config(state_path);
  config.cycle_interval = std::chrono::minutes(1);
  config.blocking_poll_interval = std::chrono::seconds(1);

  Harness harness(config);
  harness.feed->snapshot = scenario_snapshot(heat_agent::core::unix_seconds_now());
  const AgentStats stats = harness.agent->run_for_ticks(2);
  std::filesystem::remove(state_path);

  if (stats.ticks_executed != 2 || stats.control_cycles != 1 || stats.blocking_polls != 1) {
    return fail("test_agent_run_for_ticks_multiplexes_polls", "one cycle then one poll expected");
  }
  if (harness.outbox->commands.size() != 1) {
    return fail("test_agent_run_for_ticks_multiplexes_polls", "polls without transitions emit nothing");
  }
  return 0;
}

std::string history_line(std::int64_t timestamp_s, double indoor_c, double outdoor_c, double outlet_c, bool dhw) {
  nlohmann::json line{{"timestamp", timestamp_s},       {"indoor_temp", indoor_c},
                      {"target_indoor_temp", 21.0},      {"outdoor_temp", outdoor_c},
                      {"outlet_temp_actual", outlet_c},  {"heating_mode", "heat"},
                      {"outlet_temp_applied", outlet_c}};
  if (dhw) {
    line["blocking"] = {{"dhw", true}};
  }
  return line.dump();
}

std::filesystem::path write_history(const char* name, std::size_t samples) {
  const auto path = temp_path(name);
  std::ofstream out(path);

  heat_agent::model::ThermalParameters truth{};
  truth.thermal_time_constant_h = 20.0;
  truth.outlet_effectiveness = 0.5;

  double indoor_c = 20.0;
  for (std::size_t i = 0; i < samples; ++i) {
    const double outdoor_c = -2.0 + static_cast<double>(i % 12);
    const double outlet_c = 28.0 + static_cast<double>(i % 9);
    const bool dhw = i >= 50 && i <= 52;
    out << history_line(kNow + static_cast<std::int64_t>(i) * 1800, indoor_c, outdoor_c, outlet_c, dhw) << '\n';

    heat_agent::model::PredictionContext context{};
    context.start_indoor_c = indoor_c;
    context.outlet_c = outlet_c;
    context.outdoor_c = outdoor_c;
    context.horizon_hours = 0.5;
    indoor_c += heat_agent::physics::predict_indoor_delta(truth, context);
  }
  out << "this line is not json\n";
  return path;
}

int test_calibration_from_history() {
  const auto history = write_history("heat_agent_history.jsonl", 120);
  AgentConfig config{};

  heat_agent::modes::CalibrationSummary summary{};
  try {
    summary = heat_agent::modes::calibrate_from_history(history.string(), config);
  } catch (const std::exception& ex) {
    std::filesystem::remove(history);
    std::cerr << ex.what() << '\n';
    return fail("test_calibration_from_history", "calibration should succeed");
  }

  if (summary.lines_read != 121 || summary.pairs_skipped != 4 || summary.pairs_used != 115) {
    std::filesystem::remove(history);
    return fail("test_calibration_from_history", "blocked pairs should be skipped");
  }
  const auto& params = summary.state.parameters;
  if (summary.state.baseline_source != "calibrated" || summary.state.cycle_count != 115 ||
      !config.bounds.time_constant_h.contains(params.thermal_time_constant_h) ||
      !config.bounds.effectiveness.contains(params.outlet_effectiveness)) {
    std::filesystem::remove(history);
    return fail("test_calibration_from_history", "calibrated state should be marked and bounded");
  }

  config.calibration.max_samples = 40;
  bool threw = false;
  try {
    (void)heat_agent::modes::calibrate_from_history(history.string(), config);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  std::filesystem::remove(history);
  if (!threw) {
    return fail("test_calibration_from_history", "too few usable pairs should be rejected");
  }
  return 0;
}

int test_validation_grid_passes() {
  const AgentConfig config{};
  const heat_agent::modes::ValidationReport report = heat_agent::modes::run_validation(config);
  if (!report.passed() || report.checks == 0) {
    return fail("test_validation_grid_passes", "default model should pass the validation grid");
  }
  const nlohmann::json document = nlohmann::json::parse(heat_agent::modes::format_validation_report(report));
  if (document.at("violations").get<std::size_t>() != 0 || document.at("checks").get<std::size_t>() != report.checks) {
    return fail("test_validation_grid_passes", "report should carry the counts");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_config_parsing_edge_cases(); rc != 0) return rc;
  if (int rc = test_config_nested_sections(); rc != 0) return rc;
  if (int rc = test_scheduler_multiplexes_cycles(); rc != 0) return rc;
  if (int rc = test_snapshot_parsing_reports_missing_fields(); rc != 0) return rc;
  if (int rc = test_file_boundary_errors(); rc != 0) return rc;
  if (int rc = test_redis_sink_publish_logic(); rc != 0) return rc;
  if (int rc = test_redis_health_metrics_published(); rc != 0) return rc;
  if (int rc = test_agent_control_cycle_and_learning(); rc != 0) return rc;
  if (int rc = test_agent_blocking_hold_and_grace(); rc != 0) return rc;
  if (int rc = test_agent_fault_statuses(); rc != 0) return rc;
  if (int rc = test_agent_publishes_degraded_and_stability_flags(); rc != 0) return rc;
  if (int rc = test_agent_shadow_mode_observes_only(); rc != 0) return rc;
  if (int rc = test_agent_warm_restart(); rc != 0) return rc;
  if (int rc = test_agent_run_for_ticks_multiplexes_polls(); rc != 0) return rc;
  if (int rc = test_calibration_from_history(); rc != 0) return rc;
  if (int rc = test_validation_grid_passes(); rc != 0) return rc;

  std::cout << "[PASS] agent unit tests\n";
  return 0;
}
