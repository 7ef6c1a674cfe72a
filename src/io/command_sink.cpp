#include "io/command_sink.hpp"

#include <filesystem>
#include <fstream>
#include <utility>

#include <nlohmann/json.hpp>

#include "core/errors.hpp"

namespace heat_agent::io {

JsonFileCommandSink::JsonFileCommandSink(std::string path) : path_(std::move(path)) {}

void JsonFileCommandSink::emit(const model::OutletCommand& command) {
  const nlohmann::json document{{"timestamp", command.timestamp_s},
                                {"outlet_temp", command.outlet_c},
                                {"status", model::to_string(command.status)},
                                {"status_code", static_cast<int>(command.status)},
                                {"held", command.held}};

  const std::filesystem::path target(path_);
  const std::filesystem::path temporary = target.string() + ".tmp";
  {
    std::ofstream output(temporary, std::ios::trunc);
    if (!output.is_open()) {
      throw core::NetworkError("unable to write command to " + temporary.string());
    }
    output << document.dump() << '\n';
    if (!output.good()) {
      throw core::NetworkError("short write for command at " + temporary.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(temporary, target, ec);
  if (ec) {
    throw core::NetworkError("unable to publish command to " + path_ + ": " + ec.message());
  }
}

}  // namespace heat_agent::io
