#include "store/learning_state_store.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

#include "core/errors.hpp"

namespace heat_agent::store {
namespace {

nlohmann::json encode_context(const model::PredictionContext& context) {
  return nlohmann::json{{"start_indoor_c", context.start_indoor_c},
                        {"outlet_c", context.outlet_c},
                        {"outdoor_c", context.outdoor_c},
                        {"heat_input", context.heat_input},
                        {"horizon_hours", context.horizon_hours},
                        {"other_rooms_reference", context.other_rooms_reference}};
}

model::PredictionContext decode_context(const nlohmann::json& value) {
  model::PredictionContext context{};
  context.start_indoor_c = value.value("start_indoor_c", context.start_indoor_c);
  context.outlet_c = value.value("outlet_c", context.outlet_c);
  context.outdoor_c = value.value("outdoor_c", context.outdoor_c);
  context.heat_input = value.value("heat_input", context.heat_input);
  context.horizon_hours = value.value("horizon_hours", context.horizon_hours);
  context.other_rooms_reference = value.value("other_rooms_reference", context.other_rooms_reference);
  return context;
}

nlohmann::json encode_prediction(const model::PredictionRecord& record) {
  return nlohmann::json{{"timestamp", record.timestamp_s},
                        {"predicted_indoor_delta", record.predicted_indoor_delta},
                        {"actual_indoor_delta", record.actual_indoor_delta},
                        {"context", encode_context(record.context)}};
}

model::PredictionRecord decode_prediction(const nlohmann::json& value) {
  model::PredictionRecord record{};
  record.timestamp_s = value.value("timestamp", record.timestamp_s);
  record.predicted_indoor_delta = value.value("predicted_indoor_delta", record.predicted_indoor_delta);
  record.actual_indoor_delta = value.value("actual_indoor_delta", record.actual_indoor_delta);
  if (const auto it = value.find("context"); it != value.end() && it->is_object()) {
    record.context = decode_context(*it);
  }
  return record;
}

nlohmann::json encode_update(const model::ParameterUpdateRecord& update) {
  return nlohmann::json{{"timestamp", update.timestamp_s},
                        {"thermal_time_constant", update.time_constant_delta},
                        {"heat_loss_coefficient", update.heat_loss_delta},
                        {"outlet_effectiveness", update.effectiveness_delta},
                        {"learning_rate", update.learning_rate},
                        {"confidence", update.confidence}};
}

model::ParameterUpdateRecord decode_update(const nlohmann::json& value) {
  model::ParameterUpdateRecord update{};
  update.timestamp_s = value.value("timestamp", update.timestamp_s);
  update.time_constant_delta = value.value("thermal_time_constant", update.time_constant_delta);
  update.heat_loss_delta = value.value("heat_loss_coefficient", update.heat_loss_delta);
  update.effectiveness_delta = value.value("outlet_effectiveness", update.effectiveness_delta);
  update.learning_rate = value.value("learning_rate", update.learning_rate);
  update.confidence = value.value("confidence", update.confidence);
  return update;
}

template <typename Buffer, typename Decode>
void decode_history(const nlohmann::json& section, const char* key, Buffer& buffer, Decode decode) {
  const auto it = section.find(key);
  if (it == section.end()) {
    return;
  }
  if (!it->is_array()) {
    throw std::runtime_error(std::string(key) + " must be an array");
  }
  buffer.clear();
  for (const auto& item : *it) {
    buffer.push(decode(item));
  }
}

void sync_file(const std::string& path) {
  const int fd = ::open(path.c_str(), O_RDONLY);
  if (fd < 0) {
    throw core::PersistenceFault("unable to reopen " + path + ": " + std::strerror(errno));
  }
  const int rc = ::fsync(fd);
  ::close(fd);
  if (rc != 0) {
    throw core::PersistenceFault("fsync failed for " + path + ": " + std::strerror(errno));
  }
}

}  // namespace

nlohmann::json encode_learning_state(const model::LearningState& state) {
  nlohmann::json predictions = nlohmann::json::array();
  for (std::size_t i = 0; i < state.predictions.size(); ++i) {
    predictions.push_back(encode_prediction(state.predictions[i]));
  }

  nlohmann::json updates = nlohmann::json::array();
  for (std::size_t i = 0; i < state.parameter_updates.size(); ++i) {
    updates.push_back(encode_update(state.parameter_updates[i]));
  }

  const model::OperationalState& operational = state.operational;
  nlohmann::json operational_json{{"last_applied_at", operational.last_applied_at_s},
                                  {"last_block_kind", operational.last_block_kind},
                                  {"last_block_end", operational.last_block_end_s}};
  operational_json["last_applied_outlet_c"] =
      operational.last_applied_outlet_c.has_value() ? nlohmann::json(*operational.last_applied_outlet_c)
                                                    : nlohmann::json(nullptr);
  if (operational.pending.has_value()) {
    operational_json["pending_prediction"] = {{"issued_at", operational.pending->issued_at_s},
                                              {"predicted_indoor_delta", operational.pending->predicted_indoor_delta},
                                              {"context", encode_context(operational.pending->context)}};
  } else {
    operational_json["pending_prediction"] = nullptr;
  }

  return nlohmann::json{
      {"metadata",
       {{"format", kLearningStateFormat},
        {"version", state.schema_version},
        {"last_updated", state.last_updated_s},
        {"baseline_source", state.baseline_source}}},
      {"parameters",
       {{"thermal_time_constant", state.parameters.thermal_time_constant_h},
        {"heat_loss_coefficient", state.parameters.heat_loss_coefficient},
        {"outlet_effectiveness", state.parameters.outlet_effectiveness},
        {"learning_confidence", state.parameters.learning_confidence}}},
      {"secondary_heater",
       {{"coefficient_kw", state.secondary_heater.coefficient_kw},
        {"confidence", state.secondary_heater.confidence},
        {"sessions", state.secondary_heater.sessions}}},
      {"learning_state",
       {{"cycle_count", state.cycle_count}, {"prediction_history", predictions}, {"parameter_history", updates}}},
      {"operational_state", operational_json},
  };
}

model::LearningState decode_learning_state(const nlohmann::json& document, const model::LearningState& defaults) {
  if (!document.is_object()) {
    throw std::runtime_error("learning state must be a JSON object");
  }

  model::LearningState state = defaults;

  if (const auto it = document.find("metadata"); it != document.end()) {
    const std::string format = it->value("format", std::string(kLearningStateFormat));
    if (format != kLearningStateFormat) {
      throw std::runtime_error("unexpected learning state format: " + format);
    }
    const auto version = it->value("version", model::kLearningStateVersion);
    if (version > model::kLearningStateVersion) {
      std::cerr << "[store] state written by newer schema v" << version << "; reading known fields\n";
    }
    state.last_updated_s = it->value("last_updated", state.last_updated_s);
    state.baseline_source = it->value("baseline_source", state.baseline_source);
  }
  state.schema_version = model::kLearningStateVersion;

  if (const auto it = document.find("parameters"); it != document.end()) {
    model::ThermalParameters& params = state.parameters;
    params.thermal_time_constant_h = it->value("thermal_time_constant", params.thermal_time_constant_h);
    params.heat_loss_coefficient = it->value("heat_loss_coefficient", params.heat_loss_coefficient);
    params.outlet_effectiveness = it->value("outlet_effectiveness", params.outlet_effectiveness);
    params.learning_confidence = it->value("learning_confidence", params.learning_confidence);
  }

  if (const auto it = document.find("secondary_heater"); it != document.end()) {
    model::SecondaryHeaterState& heater = state.secondary_heater;
    heater.coefficient_kw = it->value("coefficient_kw", heater.coefficient_kw);
    heater.confidence = it->value("confidence", heater.confidence);
    heater.sessions = it->value("sessions", heater.sessions);
  }

  if (const auto it = document.find("learning_state"); it != document.end()) {
    state.cycle_count = it->value("cycle_count", state.cycle_count);
    decode_history(*it, "prediction_history", state.predictions, decode_prediction);
    decode_history(*it, "parameter_history", state.parameter_updates, decode_update);
  }

  if (const auto it = document.find("operational_state"); it != document.end()) {
    model::OperationalState& operational = state.operational;
    if (const auto applied = it->find("last_applied_outlet_c"); applied != it->end()) {
      operational.last_applied_outlet_c =
          applied->is_null() ? std::nullopt : std::optional<double>(applied->get<double>());
    }
    operational.last_applied_at_s = it->value("last_applied_at", operational.last_applied_at_s);
    operational.last_block_kind = it->value("last_block_kind", operational.last_block_kind);
    operational.last_block_end_s = it->value("last_block_end", operational.last_block_end_s);
    if (const auto pending = it->find("pending_prediction"); pending != it->end()) {
      if (pending->is_object()) {
        model::PendingPrediction decoded{};
        decoded.issued_at_s = pending->value("issued_at", decoded.issued_at_s);
        decoded.predicted_indoor_delta = pending->value("predicted_indoor_delta", decoded.predicted_indoor_delta);
        if (const auto context = pending->find("context"); context != pending->end() && context->is_object()) {
          decoded.context = decode_context(*context);
        }
        operational.pending = decoded;
      } else {
        operational.pending.reset();
      }
    }
  }

  return state;
}

LearningStateStore::LearningStateStore(std::string path, model::LearningState defaults)
    : path_(std::move(path)), defaults_(std::move(defaults)) {}

void LearningStateStore::save(const model::LearningState& state) const {
  const std::filesystem::path target(path_);
  const std::filesystem::path temporary = target.string() + ".tmp";

  std::error_code ec;
  if (target.has_parent_path()) {
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
      throw core::PersistenceFault("unable to create " + target.parent_path().string() + ": " + ec.message());
    }
  }

  {
    std::ofstream output(temporary, std::ios::trunc);
    if (!output.is_open()) {
      throw core::PersistenceFault("unable to open " + temporary.string() + " for writing");
    }
    output << encode_learning_state(state).dump(2) << '\n';
    output.flush();
    if (!output.good()) {
      throw core::PersistenceFault("write failed for " + temporary.string());
    }
  }

  sync_file(temporary.string());

  std::filesystem::rename(temporary, target, ec);
  if (ec) {
    throw core::PersistenceFault("rename to " + target.string() + " failed: " + ec.message());
  }
}

model::LearningState LearningStateStore::load() const {
  std::ifstream input(path_);
  if (!input.is_open()) {
    std::cerr << "[store] no learning state at " << path_ << "; cold start with defaults\n";
    return defaults_;
  }

  try {
    const nlohmann::json document = nlohmann::json::parse(input);
    model::LearningState state = decode_learning_state(document, defaults_);
    std::cerr << "[store] warm start from " << path_ << " (cycle " << state.cycle_count << ", "
              << state.predictions.size() << " predictions)\n";
    return state;
  } catch (const nlohmann::json::exception& ex) {
    std::cerr << "[store] corrupt learning state at " << path_ << " (" << ex.what() << "); cold start with defaults\n";
  } catch (const std::runtime_error& ex) {
    std::cerr << "[store] invalid learning state at " << path_ << " (" << ex.what() << "); cold start with defaults\n";
  }
  return defaults_;
}

}  // namespace heat_agent::store
