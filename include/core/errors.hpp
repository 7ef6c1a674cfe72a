#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace heat_agent::core {

// A required snapshot field was absent.
class NoDataError : public std::runtime_error {
 public:
  explicit NoDataError(std::vector<std::string> missing)
      : std::runtime_error(describe(missing)), missing_(std::move(missing)) {}

  const std::vector<std::string>& missing() const noexcept { return missing_; }

 private:
  static std::string describe(const std::vector<std::string>& missing) {
    std::string message = "missing required inputs:";
    for (const auto& name : missing) {
      message += ' ';
      message += name;
    }
    return message;
  }

  std::vector<std::string> missing_;
};

// Communication failure with the sensor/actuator collaborator.
class NetworkError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Equilibrium left the energy-conservation envelope.
class ModelIntegrityFault : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class PersistenceFault : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace heat_agent::core
