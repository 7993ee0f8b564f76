#include "beacon_presence/receiver_report.hpp"

#include <cmath>

namespace beacon_presence {

namespace {

std::optional<std::string> optional_string(const Json::Value& object, const char* key) {
    const Json::Value& value = object[key];
    if (!value.isString() || value.asString().empty()) {
        return std::nullopt;
    }
    return value.asString();
}

std::optional<double> optional_number(const Json::Value& object, const char* key) {
    const Json::Value& value = object[key];
    if (!value.isNumeric()) {
        return std::nullopt;
    }
    return value.asDouble();
}

int positive_int_or(const Json::Value& value, int fallback) {
    if (!value.isNumeric()) {
        return fallback;
    }
    const double parsed_value = value.asDouble();
    if (!(parsed_value >= 1.0) || parsed_value > 1'000'000.0) {
        return fallback;
    }
    return static_cast<int>(parsed_value);
}

}  // namespace

int round_signal_dbm(double value) noexcept {
    if (!std::isfinite(value) || value < k_min_rssi_dbm || value > k_max_rssi_dbm) {
        return k_unknown_rssi_dbm;
    }
    return static_cast<int>(std::lround(value));
}

int normalize_signal_strength(const SignalReading& reading) {
    if (const auto* scalar = std::get_if<double>(&reading)) {
        return round_signal_dbm(*scalar);
    }
    if (const auto* structured = std::get_if<StructuredSignal>(&reading)) {
        if (structured->average.has_value()) {
            return round_signal_dbm(*structured->average);
        }
        if (structured->current.has_value()) {
            return round_signal_dbm(*structured->current);
        }
    }
    return k_unknown_rssi_dbm;
}

SignalReading parse_signal_reading(const Json::Value& value) {
    if (value.isNumeric()) {
        return value.asDouble();
    }
    if (value.isObject()) {
        return StructuredSignal{optional_number(value, "average"), optional_number(value, "current")};
    }
    return std::monostate{};
}

ObservedBeacon parse_observed_beacon(const Json::Value& entry) {
    ObservedBeacon beacon{};
    if (!entry.isObject()) {
        return beacon;
    }
    beacon.address = optional_string(entry, "mac").value_or(std::string{});
    beacon.name = optional_string(entry, "name");
    beacon.signal = parse_signal_reading(entry["rssi"]);
    beacon.online = entry["online"].isBool() && entry["online"].asBool();
    return beacon;
}

ReceiverReport parse_receiver_report(const Json::Value& body) {
    ReceiverReport report{};
    if (!body.isObject()) {
        return report;
    }
    report.receiver_id = optional_string(body, "device_id").value_or(std::string{});
    report.receiver_name = optional_string(body, "device_name");
    report.receiver_type = optional_string(body, "device_type");

    const Json::Value& payload = body["event_data"].isObject() ? body["event_data"] : body;
    report.batch = positive_int_or(payload["batch"], 1);
    report.total_batches = positive_int_or(payload["total_batches"], 1);

    const Json::Value& entries = payload["beacons"];
    if (entries.isArray()) {
        report.beacons.reserve(entries.size());
        for (const Json::Value& entry : entries) {
            report.beacons.push_back(parse_observed_beacon(entry));
        }
    }
    return report;
}

}  // namespace beacon_presence
