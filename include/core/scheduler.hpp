#pragma once

#include <cstdint>

namespace heat_agent::core {

// Multiplexes the fast blocking-poll tick and the slow control cycle on one thread.
class CycleScheduler {
 public:
  explicit CycleScheduler(std::uint64_t ticks_per_cycle = 1) noexcept;

  [[nodiscard]] std::uint64_t tick() const noexcept;
  [[nodiscard]] std::uint64_t ticks_per_cycle() const noexcept;

  // True on the first tick and every ticks_per_cycle ticks after it.
  [[nodiscard]] bool cycle_due() const noexcept;

  void advance() noexcept;

 private:
  std::uint64_t tick_count_{0};
  std::uint64_t ticks_per_cycle_{1};
};

}  // namespace heat_agent::core
