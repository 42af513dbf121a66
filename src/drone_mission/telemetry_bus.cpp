#include "drone_mission/telemetry_bus.hpp"

#include <utility>

namespace drone_mission {

void TelemetryBus::accept(const TelemetrySnapshot& snapshot) {
    std::scoped_lock lock(mutex_);
    queue_snapshots_.push(snapshot);
}

std::optional<TelemetrySnapshot> TelemetryBus::try_consume() {
    std::scoped_lock lock(mutex_);
    if (queue_snapshots_.empty()) {
        return std::nullopt;
    }
    TelemetrySnapshot snapshot = std::move(queue_snapshots_.front());
    queue_snapshots_.pop();
    return snapshot;
}

std::vector<TelemetrySnapshot> TelemetryBus::drain() {
    std::scoped_lock lock(mutex_);
    std::vector<TelemetrySnapshot> list_snapshots;
    list_snapshots.reserve(queue_snapshots_.size());
    while (!queue_snapshots_.empty()) {
        list_snapshots.push_back(std::move(queue_snapshots_.front()));
        queue_snapshots_.pop();
    }
    return list_snapshots;
}

std::size_t TelemetryBus::pending() const {
    std::scoped_lock lock(mutex_);
    return queue_snapshots_.size();
}

}  // namespace drone_mission
