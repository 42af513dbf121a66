// === Telemetry Bus ===========================================================
//
// Thread-safe FIFO sink. Producers push snapshots through the TelemetrySink
// interface; consumers drain them at their own pace.

#pragma once

#include <mutex>
#include <optional>
#include <queue>
#include <vector>

#include "drone_mission/telemetry_sink.hpp"

namespace drone_mission {

/** @brief Thread-safe FIFO used to hand snapshots to downstream consumers. */
class TelemetryBus final : public TelemetrySink {
  public:
    /** @brief Enqueue a snapshot. */
    void accept(const TelemetrySnapshot& snapshot) override;
    /** @brief Attempt to consume a pending snapshot without blocking. */
    [[nodiscard]] std::optional<TelemetrySnapshot> try_consume();
    /** @brief Remove and return every pending snapshot in arrival order. */
    [[nodiscard]] std::vector<TelemetrySnapshot> drain();
    /** @brief Number of snapshots waiting to be consumed. */
    [[nodiscard]] std::size_t pending() const;

  private:
    mutable std::mutex mutex_;
    std::queue<TelemetrySnapshot> queue_snapshots_;
};

}  // namespace drone_mission
