#include "core/scheduler.hpp"

namespace heat_agent::core {

CycleScheduler::CycleScheduler(const std::uint64_t ticks_per_cycle) noexcept
    : ticks_per_cycle_(ticks_per_cycle == 0 ? 1 : ticks_per_cycle) {}

std::uint64_t CycleScheduler::tick() const noexcept { return tick_count_; }

std::uint64_t CycleScheduler::ticks_per_cycle() const noexcept { return ticks_per_cycle_; }

bool CycleScheduler::cycle_due() const noexcept { return (tick_count_ % ticks_per_cycle_) == 0; }

void CycleScheduler::advance() noexcept { ++tick_count_; }

}  // namespace heat_agent::core
