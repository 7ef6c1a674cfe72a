#include "model/blocking.hpp"

namespace heat_agent::model {

const char* to_string(const blocking_kind kind) noexcept {
  switch (kind) {
    case blocking_kind::NONE:
      return "none";
    case blocking_kind::DHW:
      return "dhw";
    case blocking_kind::DEFROST:
      return "defrost";
    case blocking_kind::DISINFECT:
      return "disinfect";
    case blocking_kind::BOOST:
      return "boost";
  }
  return "none";
}

blocking_kind blocking_kind_from_string(const std::string& name) noexcept {
  if (name == "dhw") {
    return blocking_kind::DHW;
  }
  if (name == "defrost") {
    return blocking_kind::DEFROST;
  }
  if (name == "disinfect") {
    return blocking_kind::DISINFECT;
  }
  if (name == "boost") {
    return blocking_kind::BOOST;
  }
  return blocking_kind::NONE;
}

blocking_kind primary_blocking_kind(const BlockingFlags& flags) noexcept {
  if (flags.dhw) {
    return blocking_kind::DHW;
  }
  if (flags.defrost) {
    return blocking_kind::DEFROST;
  }
  if (flags.disinfect) {
    return blocking_kind::DISINFECT;
  }
  if (flags.boost) {
    return blocking_kind::BOOST;
  }
  return blocking_kind::NONE;
}

std::vector<std::string> blocking_reasons(const BlockingFlags& flags) {
  std::vector<std::string> reasons;
  if (flags.dhw) {
    reasons.emplace_back("dhw");
  }
  if (flags.defrost) {
    reasons.emplace_back("defrost");
  }
  if (flags.disinfect) {
    reasons.emplace_back("disinfect");
  }
  if (flags.boost) {
    reasons.emplace_back("boost");
  }
  return reasons;
}

}  // namespace heat_agent::model
