#include "beacon_presence/report_bus.hpp"

#include <utility>

namespace beacon_presence {

void ReportBus::publish(ReportEvent event) {
    std::scoped_lock lock(mutex_);
    queue_events_.push(std::move(event));
}

std::optional<ReportEvent> ReportBus::try_consume() {
    std::scoped_lock lock(mutex_);
    if (queue_events_.empty()) {
        return std::nullopt;
    }
    ReportEvent event = std::move(queue_events_.front());
    queue_events_.pop();
    return event;
}

std::size_t ReportBus::pending() const {
    std::scoped_lock lock(mutex_);
    return queue_events_.size();
}

}  // namespace beacon_presence
