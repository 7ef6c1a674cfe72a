#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>

namespace heat_agent::core {

inline std::uint64_t unix_timestamp_now_ns() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

inline std::int64_t unix_seconds_now() {
  return static_cast<std::int64_t>(unix_timestamp_now_ns() / 1'000'000'000ULL);
}

// Local wall-clock hour in [0, 24), or a negative value when the conversion fails.
inline double local_hour_of_day(const std::int64_t unix_seconds) {
  const std::time_t raw = static_cast<std::time_t>(unix_seconds);
  std::tm local{};
  if (localtime_r(&raw, &local) == nullptr) {
    return -1.0;
  }
  return static_cast<double>(local.tm_hour) + static_cast<double>(local.tm_min) / 60.0;
}

}  // namespace heat_agent::core
