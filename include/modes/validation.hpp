#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "core/config.hpp"

namespace heat_agent::modes {

struct ValidationReport {
  std::size_t checks{0};
  std::size_t violations{0};
  // First violations only, in grid order.
  std::vector<std::string> examples{};

  [[nodiscard]] bool passed() const noexcept { return violations == 0; }
};

// Sweeps outdoor temperature, outlet, parameter corners and targets through the
// equilibrium model and the outlet solver. Never touches persisted state.
ValidationReport run_validation(const core::AgentConfig& config);

std::string format_validation_report(const ValidationReport& report);

}  // namespace heat_agent::modes
