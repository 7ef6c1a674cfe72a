#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "model/thermal_state.hpp"

namespace heat_agent::store {

inline constexpr const char* kLearningStateFormat = "heat_agent.learning_state";

nlohmann::json encode_learning_state(const model::LearningState& state);

// Missing or unknown fields take their value from `defaults`.
// Throws nlohmann::json::exception or std::runtime_error on a malformed document.
model::LearningState decode_learning_state(const nlohmann::json& document, const model::LearningState& defaults);

class LearningStateStore {
 public:
  explicit LearningStateStore(std::string path, model::LearningState defaults = {});

  // Writes to a sibling temporary file, syncs it, then renames over the target.
  // Throws core::PersistenceFault.
  void save(const model::LearningState& state) const;

  // Falls back to the defaults (cold start) when the file is missing or corrupt.
  [[nodiscard]] model::LearningState load() const;

  [[nodiscard]] const std::string& path() const noexcept { return path_; }

 private:
  std::string path_;
  model::LearningState defaults_;
};

}  // namespace heat_agent::store
