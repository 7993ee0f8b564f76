// === Tracker Runtime =========================================================
//
// Wires configuration, the presence tracker, the report bus and the HTTP API
// together. A single ingest worker drains the report bus and runs the reaper
// on its interval, so reports and sweeps are applied by one thread; HTTP
// threads only read from the tracker or publish to the bus.

#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>

#include <spdlog/logger.h>

#include "beacon_presence/configuration.hpp"
#include "beacon_presence/http_api.hpp"
#include "beacon_presence/http_server.hpp"
#include "beacon_presence/presence_tracker.hpp"
#include "beacon_presence/report_bus.hpp"

namespace beacon_presence {

/** @brief High-level owner of the tracker, its worker thread and the HTTP server. */
class TrackerRuntime final {
  public:
    explicit TrackerRuntime(Configuration configuration);
    ~TrackerRuntime();

    /** @brief Load the persisted registry and bind the HTTP listener. */
    void initialize();
    /** @brief Start the ingest worker. */
    void run();
    /** @brief Stop the HTTP server, flush queued reports and join the worker. */
    void shutdown();

    [[nodiscard]] PresenceTracker& tracker() noexcept;
    [[nodiscard]] unsigned short http_port() const noexcept;

  private:
    /** @brief Fixed-cadence loop applying queued reports and scheduled sweeps. */
    void ingest_loop();
    /** @brief Apply every queued report; returns how many were applied. */
    std::size_t drain_reports();

    Configuration configuration_;
    ReportBus report_bus_;
    PresenceTracker tracker_;
    HttpApi http_api_;
    HttpServer http_server_;
    std::atomic<bool> flag_running_{false};
    std::thread ingest_thread_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace beacon_presence
