#include "control/blocking_state_machine.hpp"

#include <iostream>

namespace heat_agent::control {

const char* to_string(const blocking_phase phase) noexcept {
  switch (phase) {
    case blocking_phase::NORMAL:
      return "normal";
    case blocking_phase::BLOCKED:
      return "blocked";
    case blocking_phase::GRACE:
      return "grace";
  }
  return "unknown";
}

BlockingStateMachine::BlockingStateMachine(core::BlockingConfig config, const double max_change_per_cycle_c,
                                           const bool skip_grace) noexcept
    : config_(config), max_change_per_cycle_c_(max_change_per_cycle_c), skip_grace_(skip_grace) {}

std::optional<double> BlockingStateMachine::held_outlet() const noexcept {
  if (phase_ == blocking_phase::GRACE && interim_target_c_.has_value()) {
    return interim_target_c_;
  }
  if (event_.has_value()) {
    return event_->pre_block_target_c;
  }
  return std::nullopt;
}

void BlockingStateMachine::enter_blocked(const model::BlockingFlags& flags, const std::int64_t now_s,
                                         const std::optional<double> last_applied_c) {
  const model::blocking_kind kind = model::primary_blocking_kind(flags);
  if (phase_ == blocking_phase::GRACE && event_.has_value()) {
    // Re-entry keeps the original pre-block target.
    event_->kind = kind;
    event_->end_s.reset();
  } else {
    event_ = model::BlockingEvent{kind, now_s, last_applied_c, std::nullopt};
    last_completed_.reset();
  }
  phase_ = blocking_phase::BLOCKED;
  direction_ = wait_direction::NONE;
  interim_target_c_.reset();
  std::cerr << "[blocking] " << model::to_string(kind) << " active; control suspended\n";
}

void BlockingStateMachine::enter_grace(const double outlet_actual_c, const std::int64_t now_s) {
  event_->end_s = now_s;
  if (skip_grace_) {
    complete(now_s, "grace skipped in shadow mode");
    return;
  }
  const std::optional<double> target = event_->pre_block_target_c;
  if (!target.has_value()) {
    complete(now_s, "no pre-block target");
    return;
  }

  const double delta = outlet_actual_c - *target;
  if (delta > 0.0) {
    direction_ = wait_direction::COOLDOWN;
    interim_target_c_ = *target + max_change_per_cycle_c_;
  } else if (delta < 0.0) {
    direction_ = wait_direction::RECOVERY;
    interim_target_c_ = *target;
  } else {
    complete(now_s, "outlet already at target");
    return;
  }

  phase_ = blocking_phase::GRACE;
  grace_started_s_ = now_s;
  std::cerr << "[blocking] " << model::to_string(event_->kind) << " ended; grace "
            << (direction_ == wait_direction::COOLDOWN ? "cooldown" : "recovery") << " toward "
            << *interim_target_c_ << " C\n";
}

void BlockingStateMachine::complete(const std::int64_t now_s, const char* reason) {
  if (event_.has_value()) {
    event_->end_s = now_s;
    last_completed_ = event_;
  }
  event_.reset();
  phase_ = blocking_phase::NORMAL;
  direction_ = wait_direction::NONE;
  interim_target_c_.reset();
  std::cerr << "[blocking] control resumed (" << reason << ")\n";
}

BlockingDecision BlockingStateMachine::observe(const model::BlockingFlags& flags, const double outlet_actual_c,
                                               const std::int64_t now_s, const std::optional<double> last_applied_c) {
  const blocking_phase before = phase_;
  const bool active = flags.any();

  switch (phase_) {
    case blocking_phase::NORMAL:
      if (active) {
        enter_blocked(flags, now_s, last_applied_c);
      }
      break;

    case blocking_phase::BLOCKED:
      if (active) {
        event_->kind = model::primary_blocking_kind(flags);
      } else {
        enter_grace(outlet_actual_c, now_s);
      }
      break;

    case blocking_phase::GRACE: {
      if (active) {
        enter_blocked(flags, now_s, last_applied_c);
        break;
      }
      const double threshold = direction_ == wait_direction::COOLDOWN
                                   ? *interim_target_c_ + config_.stabilization_margin_c
                                   : *interim_target_c_ - config_.stabilization_margin_c;
      const bool stabilized = direction_ == wait_direction::COOLDOWN ? outlet_actual_c <= threshold
                                                                     : outlet_actual_c >= threshold;
      const auto grace_limit_s = static_cast<std::int64_t>(config_.grace_max.count()) * 60;
      if (stabilized) {
        complete(now_s, "outlet stabilized");
      } else if (now_s - grace_started_s_ >= grace_limit_s) {
        complete(now_s, "grace timeout");
      }
      break;
    }
  }

  BlockingDecision decision{};
  decision.phase = phase_;
  decision.transitioned = phase_ != before;
  decision.held_outlet_c = phase_ == blocking_phase::NORMAL ? std::nullopt : held_outlet();
  decision.reasons = model::blocking_reasons(flags);
  return decision;
}

}  // namespace heat_agent::control
