#pragma once

#include <string>

#include "model/control_status.hpp"

namespace heat_agent::io {

class CommandSink {
 public:
  // Throws core::NetworkError when the command cannot be delivered.
  virtual void emit(const model::OutletCommand& command) = 0;
  virtual ~CommandSink() = default;
};

// Publishes the command for the building-automation bridge; replaced atomically.
class JsonFileCommandSink final : public CommandSink {
 public:
  explicit JsonFileCommandSink(std::string path);

  void emit(const model::OutletCommand& command) override;

 private:
  std::string path_;
};

}  // namespace heat_agent::io
