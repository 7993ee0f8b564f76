#include "beacon_presence/tracker_runtime.hpp"

#include <chrono>
#include <optional>
#include <utility>

#include "beacon_presence/logging.hpp"
#include "beacon_presence/registry_store.hpp"
#include "beacon_presence/version.hpp"

namespace beacon_presence {

TrackerRuntime::TrackerRuntime(Configuration configuration)
    : configuration_(std::move(configuration)),
      report_bus_(),
      tracker_(configuration_.tracker, std::make_shared<JsonFileRegistryStore>(configuration_.data_file)),
      http_api_(tracker_, report_bus_, configuration_.http),
      http_server_(configuration_.http, http_api_),
      logger_(get_logger()) {}

TrackerRuntime::~TrackerRuntime() {
    shutdown();
}

/**
 * @brief Restore persisted state before any request can observe the registry.
 */
void TrackerRuntime::initialize() {
    logger_->info("Initializing beacon presence tracker {}", k_version);
    tracker_.load();
    http_server_.start();
}

/**
 * @brief Start the background ingest worker.
 */
void TrackerRuntime::run() {
    if (flag_running_.exchange(true)) {
        return;
    }
    logger_->info("Starting ingest loop at {} Hz", configuration_.ingest_hz);
    ingest_thread_ = std::thread(&TrackerRuntime::ingest_loop, this);
}

/**
 * @brief Stop accepting requests, then let the worker finish queued reports.
 */
void TrackerRuntime::shutdown() {
    http_server_.stop();
    if (!flag_running_.exchange(false)) {
        return;
    }
    logger_->info("Shutting down tracker runtime");
    if (ingest_thread_.joinable()) {
        ingest_thread_.join();
    }
    const std::size_t flushed = drain_reports();
    if (flushed > 0) {
        logger_->info("Applied {} queued reports during shutdown", flushed);
    }
}

PresenceTracker& TrackerRuntime::tracker() noexcept {
    return tracker_;
}

unsigned short TrackerRuntime::http_port() const noexcept {
    return http_server_.bound_port();
}

void TrackerRuntime::ingest_loop() {
    using SteadyClock = std::chrono::steady_clock;
    const auto tick_interval = std::chrono::duration_cast<SteadyClock::duration>(std::chrono::duration<double>{1.0 / configuration_.ingest_hz});
    const auto reaper_interval = std::chrono::duration_cast<SteadyClock::duration>(configuration_.reaper_interval);
    auto next_tick = SteadyClock::now();
    auto next_sweep = SteadyClock::now() + reaper_interval;
    while (flag_running_.load()) {
        const auto now = SteadyClock::now();
        if (now < next_tick) {
            std::this_thread::sleep_for(next_tick - now);
            continue;
        }
        try {
            drain_reports();
            if (now >= next_sweep) {
                tracker_.sweep(now_ms());
                next_sweep = now + reaper_interval;
            }
        } catch (const std::exception& exc) {
            logger_->error("Ingest loop error: {}", exc.what());
        }
        next_tick = now + tick_interval;
    }
}

std::size_t TrackerRuntime::drain_reports() {
    std::size_t applied_count = 0;
    while (true) {
        std::optional<ReportEvent> optional_event = report_bus_.try_consume();
        if (!optional_event.has_value()) {
            break;
        }
        const IngestResult result = tracker_.ingest(optional_event->report, optional_event->received_at);
        if (result.status != IngestStatus::Merged) {
            logger_->warn("Report from '{}' not applied: {}", optional_event->report.receiver_id, to_string(result.status));
        }
        ++applied_count;
    }
    return applied_count;
}

}  // namespace beacon_presence
