#pragma once

#include "model/control_status.hpp"

namespace heat_agent::sinks {

class StdoutDebugSink {
 public:
  void publish(const model::CycleReport& report) const;
};

}  // namespace heat_agent::sinks
