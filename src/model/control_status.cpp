#include "model/control_status.hpp"

#include "model/heat_contribution.hpp"

namespace heat_agent::model {

const char* to_string(const control_status status) noexcept {
  switch (status) {
    case control_status::OK:
      return "ok";
    case control_status::LOW_CONFIDENCE:
      return "low_confidence";
    case control_status::BLOCKED:
      return "blocked";
    case control_status::NETWORK_ERROR:
      return "network_error";
    case control_status::NO_DATA:
      return "no_data";
    case control_status::TRAINING:
      return "training";
    case control_status::HEATING_OFF:
      return "heating_off";
    case control_status::MODEL_ERROR:
      return "model_error";
  }
  return "unknown";
}

const char* to_string(const heat_source_id id) noexcept {
  switch (id) {
    case heat_source_id::SOLAR:
      return "solar";
    case heat_source_id::SECONDARY_HEATER:
      return "secondary_heater";
    case heat_source_id::ELECTRONICS:
      return "electronics";
  }
  return "unknown";
}

}  // namespace heat_agent::model
