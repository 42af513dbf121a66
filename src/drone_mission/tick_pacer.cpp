#include "drone_mission/tick_pacer.hpp"

#include <thread>

namespace drone_mission {

void RealTimePacer::wait(const Duration& interval) {
    const SteadyClock::duration steady_interval = std::chrono::duration_cast<SteadyClock::duration>(interval);
    const TimePoint now = SteadyClock::now();
    TimePoint next_tick = optional_next_tick_.value_or(now) + steady_interval;
    if (next_tick < now) {
        next_tick = now;
    }
    std::this_thread::sleep_until(next_tick);
    optional_next_tick_ = next_tick;
}

void RealTimePacer::reset() {
    optional_next_tick_.reset();
}

void ImmediatePacer::wait(const Duration&) {}

}  // namespace drone_mission
