#include "heat/secondary_heater.hpp"

#include <algorithm>
#include <iostream>

namespace heat_agent::heat {
namespace {
constexpr double kSessionsForFullConfidence = 50.0;
constexpr double kMaxConfidence = 0.9;
}  // namespace

SecondaryHeater::SecondaryHeater(core::SecondaryHeaterConfig config, const model::SecondaryHeaterState& state) noexcept
    : config_(config), state_(state) {
  state_.coefficient_kw = std::clamp(state_.coefficient_kw, config_.coefficient_min_kw, config_.coefficient_max_kw);
}

double SecondaryHeater::heat_kw(const double differential_c) const noexcept {
  return std::max(0.0, differential_c) * state_.coefficient_kw * config_.distribution_factor;
}

double SecondaryHeater::current_kw(const model::SensorSnapshot& snapshot) {
  if (!snapshot.secondary_zone_c.has_value() || !snapshot.other_rooms_c.has_value()) {
    if (session_.has_value()) {
      std::cerr << "[heat] secondary heater inputs lost; session discarded\n";
      session_.reset();
    }
    last_differential_c_ = 0.0;
    return 0.0;
  }

  const double differential_c = *snapshot.secondary_zone_c - *snapshot.other_rooms_c;
  last_differential_c_ = differential_c;

  if (!session_.has_value()) {
    if (differential_c > config_.on_differential_c) {
      session_ = Session{snapshot.timestamp_s, *snapshot.other_rooms_c, differential_c};
      std::cerr << "[heat] secondary heater detected (differential " << differential_c << " C)\n";
    }
  } else if (differential_c < config_.off_differential_c) {
    finish_session(snapshot.timestamp_s, *snapshot.other_rooms_c);
  } else {
    session_->peak_differential_c = std::max(session_->peak_differential_c, differential_c);
  }

  return session_.has_value() ? heat_kw(differential_c) : 0.0;
}

double SecondaryHeater::projected_kw(const model::SensorSnapshot& /*snapshot*/, std::size_t /*step*/,
                                     std::int64_t /*at_s*/) const {
  return session_.has_value() ? heat_kw(last_differential_c_) : 0.0;
}

void SecondaryHeater::finish_session(const std::int64_t end_s, const double end_reference_c) {
  const Session session = *session_;
  session_.reset();

  const double hours = static_cast<double>(end_s - session.start_s) / 3600.0;
  const double min_hours = static_cast<double>(config_.min_session.count()) / 60.0;
  if (hours < min_hours || hours <= 0.0) {
    std::cerr << "[heat] secondary heater session too short; ignored\n";
    return;
  }

  ++state_.sessions;
  state_.confidence = std::min(kMaxConfidence, static_cast<double>(state_.sessions) / kSessionsForFullConfidence);

  const double rise_rate_c_per_h = (end_reference_c - session.start_reference_c) / hours;
  if (rise_rate_c_per_h <= 0.0 || session.peak_differential_c <= 0.0) {
    return;
  }

  const double implied_kw = config_.building_capacity_kwh_per_c * rise_rate_c_per_h / session.peak_differential_c;
  const double updated = state_.coefficient_kw + config_.learning_rate * (implied_kw - state_.coefficient_kw);
  state_.coefficient_kw = std::clamp(updated, config_.coefficient_min_kw, config_.coefficient_max_kw);
  std::cerr << "[heat] secondary heater coefficient now " << state_.coefficient_kw << " kW/C after "
            << state_.sessions << " sessions\n";
}

}  // namespace heat_agent::heat
