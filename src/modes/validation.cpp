#include "modes/validation.hpp"

#include <cstdint>
#include <optional>
#include <sstream>

#include <nlohmann/json.hpp>

#include "control/outlet_solver.hpp"
#include "core/errors.hpp"
#include "model/heat_contribution.hpp"
#include "model/sensor_snapshot.hpp"
#include "physics/thermal_model.hpp"

namespace heat_agent::modes {
namespace {

constexpr std::size_t kMaxExamples = 20;
constexpr double kOutdoorMinC = -20.0;
constexpr double kOutdoorMaxC = 15.0;
constexpr double kGridStepC = 5.0;
constexpr double kTargetMinC = 19.0;
constexpr double kTargetMaxC = 23.0;
constexpr std::int64_t kValidationTimestamp = 1'700'000'000;

void record_violation(ValidationReport& report, const std::string& message) {
  ++report.violations;
  if (report.examples.size() < kMaxExamples) {
    report.examples.push_back(message);
  }
}

std::string describe(const model::ThermalParameters& params) {
  std::ostringstream out;
  out << "eff=" << params.outlet_effectiveness << " hl=" << params.heat_loss_coefficient;
  return out.str();
}

std::vector<model::ThermalParameters> parameter_corners(const core::AgentConfig& config) {
  const model::ThermalParameters defaults = core::default_learning_state(config).parameters;
  std::vector<model::ThermalParameters> sets{defaults};
  for (const double effectiveness : {config.bounds.effectiveness.min, config.bounds.effectiveness.max}) {
    for (const double heat_loss : {config.bounds.heat_loss.min, config.bounds.heat_loss.max}) {
      model::ThermalParameters corner = defaults;
      corner.outlet_effectiveness = effectiveness;
      corner.heat_loss_coefficient = heat_loss;
      sets.push_back(corner);
    }
  }
  return sets;
}

void check_equilibrium_grid(const core::AgentConfig& config, const model::ThermalParameters& params,
                            ValidationReport& report) {
  for (double outdoor_c = kOutdoorMinC; outdoor_c <= kOutdoorMaxC; outdoor_c += kGridStepC) {
    for (double outlet_c = config.control.outlet_min_c; outlet_c <= config.control.outlet_max_c;
         outlet_c += kGridStepC) {
      ++report.checks;
      try {
        const double equilibrium_c = physics::equilibrium(params, outlet_c, outdoor_c, 0.0);
        if (!physics::within_physical_bounds(params, equilibrium_c, outlet_c, outdoor_c, 0.0)) {
          record_violation(report, "equilibrium out of bounds: " + describe(params));
        }
      } catch (const core::ModelIntegrityFault& ex) {
        record_violation(report, std::string("equilibrium fault: ") + ex.what());
      }
    }
  }
}

void check_solver_grid(const core::AgentConfig& config, const model::ThermalParameters& params,
                       ValidationReport& report) {
  const control::OutletSolver solver(control::make_solver_options(config));
  const model::ContributionPlan plan{};

  for (double outdoor_c = kOutdoorMinC; outdoor_c <= kOutdoorMaxC; outdoor_c += kGridStepC) {
    std::optional<double> previous_outlet_c{};
    for (double target_c = kTargetMinC; target_c <= kTargetMaxC; target_c += 1.0) {
      model::SensorSnapshot snapshot{};
      snapshot.timestamp_s = kValidationTimestamp;
      snapshot.indoor_c = target_c - 0.5;
      snapshot.target_indoor_c = target_c;
      snapshot.outdoor_c = outdoor_c;
      snapshot.outlet_actual_c = config.control.outlet_min_c;

      std::ostringstream where;
      where << describe(params) << " outdoor=" << outdoor_c << " target=" << target_c;

      try {
        const control::SolveResult first = solver.solve(snapshot, plan, params, target_c);
        const control::SolveResult second = solver.solve(snapshot, plan, params, target_c);

        ++report.checks;
        if (first.outlet_c < config.control.outlet_min_c || first.outlet_c > config.control.outlet_max_c) {
          record_violation(report, "solver output outside safety range: " + where.str());
        }

        ++report.checks;
        if (first.outlet_c != second.outlet_c) {
          record_violation(report, "solver not idempotent: " + where.str());
        }

        ++report.checks;
        if (previous_outlet_c.has_value() &&
            first.outlet_c + config.control.search_resolution_c < *previous_outlet_c) {
          record_violation(report, "solver not monotone in target: " + where.str());
        }
        previous_outlet_c = first.outlet_c;
      } catch (const core::ModelIntegrityFault& ex) {
        ++report.checks;
        record_violation(report, "solver fault at " + where.str() + ": " + ex.what());
      }
    }
  }
}

}  // namespace

ValidationReport run_validation(const core::AgentConfig& config) {
  ValidationReport report{};
  for (const model::ThermalParameters& params : parameter_corners(config)) {
    check_equilibrium_grid(config, params, report);
    check_solver_grid(config, params, report);
  }
  return report;
}

std::string format_validation_report(const ValidationReport& report) {
  nlohmann::json document{
      {"checks", report.checks},
      {"violations", report.violations},
      {"passed", report.passed()},
      {"first_violations", report.examples},
  };
  return document.dump(2);
}

}  // namespace heat_agent::modes
