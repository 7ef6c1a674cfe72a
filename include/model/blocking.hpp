#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "model/sensor_snapshot.hpp"

namespace heat_agent::model {

enum class blocking_kind : std::uint8_t {
  NONE = 0,
  DHW = 1,
  DEFROST = 2,
  DISINFECT = 3,
  BOOST = 4,
};

const char* to_string(blocking_kind kind) noexcept;
blocking_kind blocking_kind_from_string(const std::string& name) noexcept;

// Highest-priority active mode; DHW wins over DEFROST over DISINFECT over BOOST.
blocking_kind primary_blocking_kind(const BlockingFlags& flags) noexcept;
std::vector<std::string> blocking_reasons(const BlockingFlags& flags);

// Hot-water-like modes leave the outlet hotter than the space-heating target.
inline bool heats_outlet(const blocking_kind kind) noexcept {
  return kind == blocking_kind::DHW || kind == blocking_kind::DISINFECT || kind == blocking_kind::BOOST;
}

struct BlockingEvent {
  blocking_kind kind{blocking_kind::NONE};
  std::int64_t start_s{0};
  std::optional<double> pre_block_target_c{};
  std::optional<std::int64_t> end_s{};
};

}  // namespace heat_agent::model
