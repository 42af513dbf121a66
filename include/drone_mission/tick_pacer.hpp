// === Tick Pacer ==============================================================
//
// The single suspension point of the engine. Phase loops call wait() once
// per tick; the pacer decides whether that maps to wall-clock time.

#pragma once

#include <optional>

#include "drone_mission/types.hpp"

namespace drone_mission {

/** @brief Suspends the mission between ticks. */
class TickPacer {
  public:
    virtual ~TickPacer() = default;

    /** @brief Block for @p interval of mission time. */
    virtual void wait(const Duration& interval) = 0;

    /** @brief Start a new mission; no deadline carries over from the previous one. */
    virtual void reset() {}
};

/**
 * @brief Sleeps on steady-clock deadlines so ticks do not drift.
 *
 * Each deadline is the previous deadline plus the interval, so slow ticks
 * are caught up rather than accumulated.
 */
class RealTimePacer final : public TickPacer {
  public:
    void wait(const Duration& interval) override;
    void reset() override;

  private:
    std::optional<TimePoint> optional_next_tick_;
};

/** @brief Returns immediately; runs missions as fast as the CPU allows. */
class ImmediatePacer final : public TickPacer {
  public:
    void wait(const Duration& interval) override;
};

}  // namespace drone_mission
