// === Presence Tracker ========================================================
//
// The single shared tracking engine. Owns the registry and its store, applies
// reports and reaper sweeps, and answers queries. Mutations (ingest, sweep,
// reset) are serialized by a writer mutex that is held across the merge and the
// follow-up persistence write, so a slow write never interleaves with another
// mutation. Readers take a shared lock and only wait while the in-memory
// registry is being modified, never on persistence I/O.

#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include <json/json.h>
#include <spdlog/logger.h>

#include "beacon_presence/ingestion_merger.hpp"
#include "beacon_presence/query_service.hpp"
#include "beacon_presence/reaper.hpp"
#include "beacon_presence/receiver_report.hpp"
#include "beacon_presence/registry.hpp"
#include "beacon_presence/registry_store.hpp"

namespace beacon_presence {

/**
 * @brief Tunable parameters of the tracking engine.
 *
 * Populated at startup from the configuration loader and treated as
 * immutable while the tracker runs.
 */
struct TrackerConfig final {
    StalenessThresholds thresholds{};
    int persist_retries{2};                  /**< Extra write attempts after a failed save. */
    Milliseconds retry_backoff{200};         /**< Base delay between write attempts. */
};

/** @brief Thread-safe owner of the registry and its persistence. */
class PresenceTracker final {
  public:
    PresenceTracker(TrackerConfig config, RegistryStorePtr store);

    [[nodiscard]] const TrackerConfig& config() const noexcept;

    /** @brief Replace the in-memory registry with the stored document. */
    void load();
    /** @brief Merge @p report as of @p now and persist the result. */
    IngestResult ingest(const ReceiverReport& report, TimePoint now);
    /** @brief Run one reaper pass; persists only when something was removed. */
    ReapSummary sweep(TimePoint now);
    /** @brief Empty the registry and persist the empty document. Returns false if the write failed. */
    bool reset();

    [[nodiscard]] std::optional<BeaconMatch> find_beacon(std::string_view identity) const;
    /** @brief Fresh receivers ranked by signal, or empty optional when the beacon is unknown. */
    [[nodiscard]] std::optional<std::vector<RankedReceiver>> ranked_receivers_for(std::string_view identity, TimePoint now) const;
    [[nodiscard]] StatusSummary status_summary(TimePoint now) const;
    [[nodiscard]] PresenceStatistics statistics(TimePoint now) const;
    [[nodiscard]] std::vector<BeaconOverview> beacon_overview(TimePoint now) const;
    [[nodiscard]] std::optional<BeaconDetail> beacon_detail(std::string_view name_fragment, TimePoint now) const;
    [[nodiscard]] std::vector<LocatedBeacon> located_beacons(TimePoint now, std::string_view name_prefix) const;
    [[nodiscard]] RegistrySnapshot snapshot() const;
    /** @brief Whole registry as a JSON document with legacy escaped text decoded. */
    [[nodiscard]] Json::Value list_all() const;

  private:
    /** @brief Run @p query against the registry under a shared lock. */
    template <typename Query>
    auto with_query_service(Query&& query) const {
        std::shared_lock lock(mutex_registry_);
        const QueryService query_service{registry_, config_.thresholds};
        return query(query_service);
    }

    /** @brief Write the registry; caller holds the writer mutex. */
    bool persist_locked(const std::string& operation_name);
    /** @brief Apply bounded retries to a persistence write. */
    void retry_if_needed(const std::function<void()>& operation, const std::string& operation_name);

    TrackerConfig config_;
    RegistryStorePtr store_;
    Registry registry_;
    IngestionMerger merger_;
    Reaper reaper_;
    mutable std::shared_mutex mutex_registry_;
    std::mutex mutex_writer_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace beacon_presence
