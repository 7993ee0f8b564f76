#pragma once

#include <map>
#include <optional>
#include <string>

#include "beacon_presence/types.hpp"

namespace beacon_presence {

/**
 * @brief Attributes a receiver supplies alongside each report.
 */
struct ReceiverAttributes final {
    std::string name{};          /**< Display name; defaults to the receiver id. */
    std::string type{};          /**< Hardware kind tag. */
    int batch{1};                /**< Index of this report fragment. */
    int total_batches{1};        /**< Number of fragments in the report. */
};

/**
 * @brief Stored state of a fixed receiver.
 */
struct ReceiverRecord final {
    std::string name{};          /**< Display name at the last report. */
    std::string type{};          /**< Hardware kind tag. */
    TimePoint last_report{};     /**< Arrival time of the most recent report. */
    int batch{1};                /**< Batch index of the most recent report. */
    int total_batches{1};        /**< Batch total of the most recent report. */
};

/**
 * @brief One receiver's most recent observation of one beacon.
 */
struct Detection final {
    std::string receiver_name{};              /**< Receiver display name when observed. */
    int rssi_dbm{k_unknown_rssi_dbm};         /**< Normalized signal strength in dBm. */
    bool online{};                            /**< Receiver-asserted liveness flag. */
    std::optional<TimePoint> update_time{};   /**< Observation time; absent in some legacy documents. */
    std::string last_update{};                /**< Legacy "YYYY/M/D H:M:S" local time, if any. */
};

/** @brief Detections of one beacon keyed by receiver id. */
using DetectionMap = std::map<std::string, Detection>;

/**
 * @brief Stored state of a tracked beacon.
 */
struct BeaconRecord final {
    std::string name{};          /**< Mutable display name. */
    TimePoint first_seen{};      /**< Time of the first ingested sighting. */
    DetectionMap detections{};   /**< At most one detection per receiver. */
};

using ReceiverMap = std::map<std::string, ReceiverRecord>;
using BeaconMap = std::map<std::string, BeaconRecord>;

/**
 * @brief Detached copy of the whole registry.
 */
struct RegistrySnapshot final {
    ReceiverMap receivers{};
    BeaconMap beacons{};
};

}  // namespace beacon_presence
