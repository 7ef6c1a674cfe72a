#pragma once

#include <chrono>
#include <string>

#include <nlohmann/json.hpp>

#include "model/sensor_snapshot.hpp"

namespace heat_agent::io {

class SnapshotSource {
 public:
  // Throws core::NetworkError when the collaborator cannot be reached and
  // core::NoDataError when required fields are absent.
  virtual model::SensorSnapshot fetch() = 0;
  virtual ~SnapshotSource() = default;
};

// Required: indoor_temp, target_indoor_temp, outdoor_temp, outlet_temp_actual, heating_mode, timestamp.
// Every absent required field is listed in the thrown core::NoDataError.
model::SensorSnapshot parse_snapshot(const nlohmann::json& document);

// Reads the JSON document published by the building-automation bridge.
class JsonFileSnapshotSource final : public SnapshotSource {
 public:
  JsonFileSnapshotSource(std::string path, std::chrono::seconds max_age);

  model::SensorSnapshot fetch() override;

 private:
  std::string path_;
  std::chrono::seconds max_age_;
};

}  // namespace heat_agent::io
