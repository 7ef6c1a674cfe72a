#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "model/ring_buffer.hpp"

namespace heat_agent::model {

inline constexpr std::uint32_t kLearningStateVersion = 2;
inline constexpr std::size_t kPredictionHistory = 50;
inline constexpr std::size_t kParameterHistory = 100;

struct ParameterRange {
  double min{0.0};
  double max{0.0};

  [[nodiscard]] double clamp(const double value) const noexcept { return std::clamp(value, min, max); }
  [[nodiscard]] double span() const noexcept { return max - min; }
  [[nodiscard]] bool contains(const double value) const noexcept { return value >= min && value <= max; }
};

struct ParameterBounds {
  ParameterRange time_constant_h{6.0, 72.0};
  ParameterRange heat_loss{0.01, 0.15};
  ParameterRange effectiveness{0.3, 1.5};
  ParameterRange confidence{0.1, 5.0};
};

struct ThermalParameters {
  double thermal_time_constant_h{12.0};
  double heat_loss_coefficient{0.10};
  double outlet_effectiveness{0.40};
  double learning_confidence{3.0};

  bool operator==(const ThermalParameters& other) const {
    return thermal_time_constant_h == other.thermal_time_constant_h &&
           heat_loss_coefficient == other.heat_loss_coefficient &&
           outlet_effectiveness == other.outlet_effectiveness && learning_confidence == other.learning_confidence;
  }
};

// Inputs needed to re-evaluate a one-cycle prediction under perturbed parameters.
struct PredictionContext {
  double start_indoor_c{0.0};
  double outlet_c{0.0};
  double outdoor_c{0.0};
  double heat_input{0.0};
  double horizon_hours{0.0};
  bool other_rooms_reference{false};

  bool operator==(const PredictionContext& other) const {
    return start_indoor_c == other.start_indoor_c && outlet_c == other.outlet_c && outdoor_c == other.outdoor_c &&
           heat_input == other.heat_input && horizon_hours == other.horizon_hours &&
           other_rooms_reference == other.other_rooms_reference;
  }
};

struct PredictionRecord {
  std::int64_t timestamp_s{0};
  double predicted_indoor_delta{0.0};
  double actual_indoor_delta{0.0};
  PredictionContext context{};

  [[nodiscard]] double error() const noexcept { return actual_indoor_delta - predicted_indoor_delta; }

  bool operator==(const PredictionRecord& other) const {
    return timestamp_s == other.timestamp_s && predicted_indoor_delta == other.predicted_indoor_delta &&
           actual_indoor_delta == other.actual_indoor_delta && context == other.context;
  }
};

// Audit trail entry; never replayed.
struct ParameterUpdateRecord {
  std::int64_t timestamp_s{0};
  double time_constant_delta{0.0};
  double heat_loss_delta{0.0};
  double effectiveness_delta{0.0};
  double learning_rate{0.0};
  double confidence{0.0};

  bool operator==(const ParameterUpdateRecord& other) const {
    return timestamp_s == other.timestamp_s && time_constant_delta == other.time_constant_delta &&
           heat_loss_delta == other.heat_loss_delta && effectiveness_delta == other.effectiveness_delta &&
           learning_rate == other.learning_rate && confidence == other.confidence;
  }
};

struct SecondaryHeaterState {
  double coefficient_kw{2.5};
  double confidence{0.0};
  std::uint32_t sessions{0};

  bool operator==(const SecondaryHeaterState& other) const {
    return coefficient_kw == other.coefficient_kw && confidence == other.confidence && sessions == other.sessions;
  }
};

struct PendingPrediction {
  std::int64_t issued_at_s{0};
  double predicted_indoor_delta{0.0};
  PredictionContext context{};

  bool operator==(const PendingPrediction& other) const {
    return issued_at_s == other.issued_at_s && predicted_indoor_delta == other.predicted_indoor_delta &&
           context == other.context;
  }
};

struct OperationalState {
  std::optional<double> last_applied_outlet_c{};
  std::int64_t last_applied_at_s{0};
  std::optional<PendingPrediction> pending{};
  std::string last_block_kind{"none"};
  std::int64_t last_block_end_s{0};

  bool operator==(const OperationalState& other) const {
    return last_applied_outlet_c == other.last_applied_outlet_c && last_applied_at_s == other.last_applied_at_s &&
           pending == other.pending && last_block_kind == other.last_block_kind &&
           last_block_end_s == other.last_block_end_s;
  }
};

using PredictionHistory = RingBuffer<PredictionRecord, kPredictionHistory>;
using ParameterHistory = RingBuffer<ParameterUpdateRecord, kParameterHistory>;

// Sole persisted entity. Owned by the control agent; mutated only through learner results.
struct LearningState {
  std::uint32_t schema_version{kLearningStateVersion};
  ThermalParameters parameters{};
  SecondaryHeaterState secondary_heater{};
  PredictionHistory predictions{};
  ParameterHistory parameter_updates{};
  std::uint64_t cycle_count{0};
  std::int64_t last_updated_s{0};
  std::string baseline_source{"default"};
  OperationalState operational{};

  bool operator==(const LearningState& other) const {
    return schema_version == other.schema_version && parameters == other.parameters &&
           secondary_heater == other.secondary_heater && predictions == other.predictions &&
           parameter_updates == other.parameter_updates && cycle_count == other.cycle_count &&
           last_updated_s == other.last_updated_s && baseline_source == other.baseline_source &&
           operational == other.operational;
  }
};

}  // namespace heat_agent::model
