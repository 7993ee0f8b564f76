// === Report Bus ==============================================================
//
// Provides a minimal thread-safe queue that hands receiver reports from the
// transport threads to the single ingest worker.

#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

#include "beacon_presence/receiver_report.hpp"
#include "beacon_presence/types.hpp"

namespace beacon_presence {

/** @brief A report stamped with its arrival time. */
struct ReportEvent final {
    ReceiverReport report{};
    TimePoint received_at{};
};

/** @brief Thread-safe FIFO used to exchange report events. */
class ReportBus final {
  public:
    /** @brief Publish a report event for the ingest worker. */
    void publish(ReportEvent event);
    /** @brief Attempt to consume a pending event without blocking. */
    [[nodiscard]] std::optional<ReportEvent> try_consume();
    /** @brief Number of events waiting to be consumed. */
    [[nodiscard]] std::size_t pending() const;

  private:
    mutable std::mutex mutex_;
    std::queue<ReportEvent> queue_events_;
};

}  // namespace beacon_presence
