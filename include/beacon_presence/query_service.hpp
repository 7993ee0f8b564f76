// === Query Service ===========================================================
//
// Read-only views over a registry. Every result is a detached copy, so callers
// may keep it after the registry changes. Besides the lookup, status and
// snapshot queries, the service computes the aggregates behind the operator
// views (statistics, per-beacon overview, beacon detail, located beacons).

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "beacon_presence/presence_records.hpp"
#include "beacon_presence/presence_resolver.hpp"
#include "beacon_presence/registry.hpp"
#include "beacon_presence/types.hpp"

namespace beacon_presence {

/** @brief A beacon together with the address it is stored under. */
struct BeaconMatch final {
    std::string address{};
    BeaconRecord beacon{};
};

/** @brief Aggregate receiver and beacon counts. */
struct StatusSummary final {
    std::size_t receiver_total{};
    std::size_t receiver_active{};
    std::size_t beacon_total{};
    std::size_t beacon_active{};
};

/** @brief Min/max/mean over a set of signal samples. */
struct SignalSummary final {
    std::size_t sample_count{};
    double average_dbm{};
    int strongest_dbm{};
    int weakest_dbm{};
};

/** @brief Status counts extended with coverage and signal aggregates. */
struct PresenceStatistics final {
    StatusSummary status{};
    std::size_t multi_receiver_beacons{};     /**< Active beacons seen by more than one active receiver. */
    std::size_t single_receiver_beacons{};    /**< Active beacons seen by exactly one active receiver. */
    std::optional<SignalSummary> signal{};    /**< Over all active detections; empty when there are none. */
};

/** @brief One row of the beacon overview. */
struct BeaconOverview final {
    std::string address{};
    std::string name{};
    std::size_t active_receivers{};
    int strongest_rssi_dbm{k_unknown_rssi_dbm};
    std::optional<TimePoint> newest_update{};
    bool active{};
};

/** @brief A detection as listed in a beacon detail view. */
struct DetectionEntry final {
    std::string receiver_id{};
    std::string receiver_name{};
    int rssi_dbm{k_unknown_rssi_dbm};
    bool online{};
    std::optional<TimePoint> observed_at{};
    bool recent{};    /**< Observed inside the active window. */
};

/** @brief Full history of one beacon across receivers. */
struct BeaconDetail final {
    std::string address{};
    std::string name{};
    TimePoint first_seen{};
    std::vector<DetectionEntry> detections{};
    std::optional<SignalSummary> recent_signal{};
};

/** @brief A beacon with at least one fresh receiver. */
struct LocatedBeacon final {
    std::string address{};
    std::string name{};
    std::string display_name{};
    TimePoint first_seen{};
    std::vector<RankedReceiver> receivers{};
};

/** @brief Read-only queries over a registry. */
class QueryService final {
  public:
    QueryService(const Registry& registry, StalenessThresholds thresholds);

    /**
     * @brief Find a beacon by address, or failing that by exact name.
     *
     * Names are not unique; the first match in registry order wins.
     */
    [[nodiscard]] std::optional<BeaconMatch> find_beacon(std::string_view identity) const;
    /** @brief First beacon whose name contains @p fragment. */
    [[nodiscard]] std::optional<BeaconMatch> find_beacon_by_name_fragment(std::string_view fragment) const;
    /** @brief Fresh receivers for the beacon named or addressed by @p identity. */
    [[nodiscard]] std::optional<std::vector<RankedReceiver>> receivers_for(std::string_view identity, TimePoint now) const;

    [[nodiscard]] StatusSummary status_summary(TimePoint now) const;
    [[nodiscard]] PresenceStatistics statistics(TimePoint now) const;
    /** @brief One row per beacon: active rows first, then strongest signal first. */
    [[nodiscard]] std::vector<BeaconOverview> beacon_overview(TimePoint now) const;
    [[nodiscard]] std::optional<BeaconDetail> beacon_detail(std::string_view name_fragment, TimePoint now) const;
    /** @brief Beacons named with @p name_prefix that have fresh receivers, strongest first. */
    [[nodiscard]] std::vector<LocatedBeacon> located_beacons(TimePoint now, std::string_view name_prefix) const;

    [[nodiscard]] RegistrySnapshot snapshot() const;

  private:
    const Registry& registry_;
    StalenessThresholds thresholds_;
};

}  // namespace beacon_presence
