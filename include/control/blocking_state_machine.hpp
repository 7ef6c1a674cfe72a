#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "model/blocking.hpp"
#include "model/sensor_snapshot.hpp"

namespace heat_agent::control {

enum class blocking_phase : std::uint8_t {
  NORMAL = 0,
  BLOCKED = 1,
  GRACE = 2,
};

enum class wait_direction : std::uint8_t {
  NONE = 0,
  COOLDOWN = 1,
  RECOVERY = 2,
};

const char* to_string(blocking_phase phase) noexcept;

struct BlockingDecision {
  blocking_phase phase{blocking_phase::NORMAL};
  bool transitioned{false};
  // Command to hold while not NORMAL; empty when nothing has been applied yet.
  std::optional<double> held_outlet_c{};
  std::vector<std::string> reasons{};
};

// NORMAL -> BLOCKED on any abnormal heat-pump mode. BLOCKED -> GRACE once the mode ends.
// GRACE -> NORMAL when the outlet crosses the interim target in the expected direction,
// or unconditionally after the grace timeout. Only BlockingEvent state lives here.
class BlockingStateMachine {
 public:
  // skip_grace resumes NORMAL as soon as the abnormal mode ends; used when another
  // controller owns the outlet and there is no command to protect.
  BlockingStateMachine(core::BlockingConfig config, double max_change_per_cycle_c, bool skip_grace = false) noexcept;

  BlockingDecision observe(const model::BlockingFlags& flags, double outlet_actual_c, std::int64_t now_s,
                           std::optional<double> last_applied_c);

  [[nodiscard]] blocking_phase phase() const noexcept { return phase_; }
  [[nodiscard]] wait_direction direction() const noexcept { return direction_; }
  [[nodiscard]] std::optional<double> interim_target_c() const noexcept { return interim_target_c_; }
  [[nodiscard]] const std::optional<model::BlockingEvent>& event() const noexcept { return event_; }
  // Set once GRACE completes; cleared at the next onset.
  [[nodiscard]] const std::optional<model::BlockingEvent>& last_completed() const noexcept { return last_completed_; }

 private:
  void enter_blocked(const model::BlockingFlags& flags, std::int64_t now_s, std::optional<double> last_applied_c);
  void enter_grace(double outlet_actual_c, std::int64_t now_s);
  void complete(std::int64_t now_s, const char* reason);
  [[nodiscard]] std::optional<double> held_outlet() const noexcept;

  core::BlockingConfig config_;
  double max_change_per_cycle_c_{2.0};
  bool skip_grace_{false};

  blocking_phase phase_{blocking_phase::NORMAL};
  wait_direction direction_{wait_direction::NONE};
  std::optional<double> interim_target_c_{};
  std::int64_t grace_started_s_{0};
  std::optional<model::BlockingEvent> event_{};
  std::optional<model::BlockingEvent> last_completed_{};
};

}  // namespace heat_agent::control
