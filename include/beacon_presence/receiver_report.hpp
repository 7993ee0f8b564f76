// === Receiver Report =========================================================
//
// Wire-independent representation of one receiver report and the parsing of
// its JSON form. Signal strength arrives either as a bare number or as a
// structured {average, current} reading; it is carried as a tagged value until
// the ingestion boundary collapses it to a single scalar.

#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <json/json.h>

#include "beacon_presence/types.hpp"

namespace beacon_presence {

/** @brief Structured signal reading offered by newer receiver firmware. */
struct StructuredSignal final {
    std::optional<double> average{};   /**< Smoothed reading in dBm. */
    std::optional<double> current{};   /**< Instantaneous reading in dBm. */
};

/** @brief Signal strength as reported: missing, scalar, or structured. */
using SignalReading = std::variant<std::monostate, double, StructuredSignal>;

/**
 * @brief Collapse a reading to an integer dBm value.
 *
 * Structured readings prefer the average and fall back to the current value.
 * Readings with no usable number yield k_unknown_rssi_dbm.
 */
[[nodiscard]] int normalize_signal_strength(const SignalReading& reading);

/**
 * @brief Round a raw dBm value; non-finite values and values outside
 * [k_min_rssi_dbm, k_max_rssi_dbm] yield k_unknown_rssi_dbm.
 */
[[nodiscard]] int round_signal_dbm(double value) noexcept;

/** @brief One beacon entry inside a receiver report. */
struct ObservedBeacon final {
    std::string address{};                 /**< Hardware address; empty when missing. */
    std::optional<std::string> name{};     /**< Advertised name, if supplied. */
    SignalReading signal{};                /**< Raw signal strength. */
    bool online{};                         /**< Receiver-asserted liveness. */
};

/** @brief Everything one receiver sent in one report fragment. */
struct ReceiverReport final {
    std::string receiver_id{};                     /**< Empty when the report lacks one. */
    std::optional<std::string> receiver_name{};
    std::optional<std::string> receiver_type{};
    int batch{1};
    int total_batches{1};
    std::vector<ObservedBeacon> beacons{};
};

/**
 * @brief Build a report from its JSON body.
 *
 * Fields with the wrong JSON type are treated as absent; validation of
 * required identities happens in the ingestion merger. `batch`,
 * `total_batches` and `beacons` are also accepted inside an `event_data`
 * object.
 */
[[nodiscard]] ReceiverReport parse_receiver_report(const Json::Value& body);

/** @brief Parse a single beacon entry. */
[[nodiscard]] ObservedBeacon parse_observed_beacon(const Json::Value& entry);

/** @brief Interpret a JSON rssi field as a tagged reading. */
[[nodiscard]] SignalReading parse_signal_reading(const Json::Value& value);

}  // namespace beacon_presence
