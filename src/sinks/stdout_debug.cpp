#include "sinks/stdout_debug.hpp"

#include <cstdio>
#include <limits>
#include <optional>

namespace heat_agent::sinks {
namespace {
double or_nan(const std::optional<double>& value) {
  return value.has_value() ? *value : std::numeric_limits<double>::quiet_NaN();
}
}  // namespace

void StdoutDebugSink::publish(const model::CycleReport& report) const {
  std::printf("[cycle] status=%s outlet.final_c=%.1f outlet.suggested_c=%.2f indoor.actual_c=%.2f "
              "indoor.predicted_c=%.2f confidence=%.2f health=%.2f stability=%.2f correction_c=%.2f "
              "degraded=%d stability_warning=%d open_window=%d\n",
              model::to_string(report.status), or_nan(report.final_outlet_c), or_nan(report.suggested_outlet_c),
              or_nan(report.actual_indoor_c), or_nan(report.predicted_indoor_c), report.confidence,
              report.health.model_health, report.health.parameter_stability, report.trajectory_correction_c,
              report.search_degraded ? 1 : 0, report.stability_warning ? 1 : 0, report.open_window ? 1 : 0);
}

}  // namespace heat_agent::sinks
