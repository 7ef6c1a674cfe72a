#include "io/snapshot_source.hpp"

#include <array>
#include <cmath>
#include <fstream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "core/errors.hpp"
#include "core/timestamp.hpp"

namespace heat_agent::io {
namespace {

std::optional<double> optional_number(const nlohmann::json& object, const char* key) {
  const auto it = object.find(key);
  if (it == object.end() || !it->is_number()) {
    return std::nullopt;
  }
  const double value = it->get<double>();
  if (!std::isfinite(value)) {
    return std::nullopt;
  }
  return value;
}

bool optional_flag(const nlohmann::json& object, const char* key) {
  const auto it = object.find(key);
  if (it == object.end()) {
    return false;
  }
  if (it->is_boolean()) {
    return it->get<bool>();
  }
  if (it->is_string()) {
    const std::string value = it->get<std::string>();
    return value == "on" || value == "true";
  }
  return false;
}

void read_forecast_vector(const nlohmann::json& forecast, const char* key,
                          std::array<std::optional<double>, model::kForecastSteps>& out) {
  const auto it = forecast.find(key);
  if (it == forecast.end() || !it->is_array()) {
    return;
  }
  for (std::size_t i = 0; i < model::kForecastSteps && i < it->size(); ++i) {
    const auto& item = (*it)[i];
    if (item.is_number() && std::isfinite(item.get<double>())) {
      out[i] = item.get<double>();
    }
  }
}

}  // namespace

model::SensorSnapshot parse_snapshot(const nlohmann::json& document) {
  if (!document.is_object()) {
    throw core::NoDataError({"snapshot"});
  }

  model::SensorSnapshot snapshot{};
  std::vector<std::string> missing;

  const auto require = [&](const char* key, double& field) {
    const std::optional<double> value = optional_number(document, key);
    if (!value.has_value()) {
      missing.emplace_back(key);
      return;
    }
    field = *value;
  };

  require("indoor_temp", snapshot.indoor_c);
  require("target_indoor_temp", snapshot.target_indoor_c);
  require("outdoor_temp", snapshot.outdoor_c);
  require("outlet_temp_actual", snapshot.outlet_actual_c);

  const auto mode_it = document.find("heating_mode");
  if (mode_it == document.end() || !mode_it->is_string()) {
    missing.emplace_back("heating_mode");
  } else {
    const std::string mode = mode_it->get<std::string>();
    snapshot.heating_on = mode == "heat" || mode == "auto";
  }

  const auto timestamp_it = document.find("timestamp");
  if (timestamp_it == document.end() || !timestamp_it->is_number()) {
    missing.emplace_back("timestamp");
  } else {
    snapshot.timestamp_s = timestamp_it->get<std::int64_t>();
  }

  if (!missing.empty()) {
    throw core::NoDataError(std::move(missing));
  }

  snapshot.other_rooms_c = optional_number(document, "other_rooms_temp");
  snapshot.secondary_zone_c = optional_number(document, "secondary_zone_temp");
  snapshot.pv_power_w = optional_number(document, "pv_power_w");
  snapshot.tv_on = optional_flag(document, "tv_on");

  if (const auto it = document.find("blocking"); it != document.end() && it->is_object()) {
    snapshot.blocking.dhw = optional_flag(*it, "dhw");
    snapshot.blocking.defrost = optional_flag(*it, "defrost");
    snapshot.blocking.disinfect = optional_flag(*it, "disinfect");
    snapshot.blocking.boost = optional_flag(*it, "boost");
  }

  if (const auto it = document.find("forecast"); it != document.end() && it->is_object()) {
    if (const auto issued = it->find("issued_at"); issued != it->end() && issued->is_number()) {
      snapshot.forecast.issued_at_s = issued->get<std::int64_t>();
    }
    read_forecast_vector(*it, "outdoor_temp", snapshot.forecast.outdoor_c);
    read_forecast_vector(*it, "pv_power_w", snapshot.forecast.pv_power_w);
  }

  return snapshot;
}

JsonFileSnapshotSource::JsonFileSnapshotSource(std::string path, const std::chrono::seconds max_age)
    : path_(std::move(path)), max_age_(max_age) {}

model::SensorSnapshot JsonFileSnapshotSource::fetch() {
  std::ifstream input(path_);
  if (!input.is_open()) {
    throw core::NetworkError("snapshot unavailable at " + path_);
  }

  nlohmann::json document;
  try {
    document = nlohmann::json::parse(input);
  } catch (const nlohmann::json::parse_error& ex) {
    throw core::NetworkError("snapshot at " + path_ + " is not valid JSON: " + ex.what());
  }

  model::SensorSnapshot snapshot = parse_snapshot(document);
  const std::int64_t age_s = core::unix_seconds_now() - snapshot.timestamp_s;
  if (age_s > static_cast<std::int64_t>(max_age_.count())) {
    throw core::NetworkError("snapshot at " + path_ + " is stale (" + std::to_string(age_s) + " s old)");
  }
  return snapshot;
}

}  // namespace heat_agent::io
