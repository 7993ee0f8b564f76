#include "beacon_presence/presence_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <utility>

#include "beacon_presence/staleness.hpp"
#include "beacon_presence/text_decoding.hpp"

namespace beacon_presence {

namespace {
constexpr int k_strong_floor_dbm{-60};
constexpr int k_medium_floor_dbm{-70};
constexpr int k_weak_floor_dbm{-80};
constexpr std::string_view k_numbered_beacon_marker{"ESP-C3-"};
constexpr char k_unknown_beacon_label[] = "Unknown beacon";
}  // namespace

std::vector<RankedReceiver> ranked_receivers(const BeaconRecord& beacon, TimePoint now, Milliseconds threshold) {
    std::vector<RankedReceiver> list_ranked;
    list_ranked.reserve(beacon.detections.size());
    for (const auto& [receiver_id, detection] : beacon.detections) {
        const std::optional<TimePoint> observed_at = resolve_timestamp(detection);
        if (!observed_at.has_value() || !is_within(*observed_at, now, threshold)) {
            continue;
        }
        RankedReceiver ranked{};
        ranked.receiver_id = receiver_id;
        ranked.receiver_name = detection.receiver_name.empty() ? receiver_id : decode_unicode_escapes(detection.receiver_name);
        ranked.rssi_dbm = detection.rssi_dbm;
        ranked.online = detection.online;
        ranked.observed_at = *observed_at;
        ranked.observed_at_text = format_local_time(*observed_at);
        list_ranked.push_back(std::move(ranked));
    }

    std::stable_sort(list_ranked.begin(), list_ranked.end(), [](const RankedReceiver& lhs, const RankedReceiver& rhs) {
        return lhs.rssi_dbm > rhs.rssi_dbm;
    });
    return list_ranked;
}

SignalLevel classify_signal(int rssi_dbm) noexcept {
    if (rssi_dbm >= k_strong_floor_dbm) {
        return SignalLevel::Strong;
    }
    if (rssi_dbm >= k_medium_floor_dbm) {
        return SignalLevel::Medium;
    }
    if (rssi_dbm >= k_weak_floor_dbm) {
        return SignalLevel::Weak;
    }
    return SignalLevel::VeryWeak;
}

std::string_view to_string(SignalLevel level) noexcept {
    switch (level) {
        case SignalLevel::Strong:
            return "strong";
        case SignalLevel::Medium:
            return "medium";
        case SignalLevel::Weak:
            return "weak";
        case SignalLevel::VeryWeak:
            return "very_weak";
    }
    return "unknown";
}

std::string beacon_display_name(std::string_view beacon_name) {
    if (beacon_name.empty()) {
        return k_unknown_beacon_label;
    }
    const std::size_t marker_position = beacon_name.find(k_numbered_beacon_marker);
    if (marker_position == std::string_view::npos) {
        return std::string{beacon_name};
    }
    const std::string_view tail = beacon_name.substr(marker_position + k_numbered_beacon_marker.size());
    const auto digits_end = std::find_if(tail.begin(), tail.end(), [](char character) {
        return std::isdigit(static_cast<unsigned char>(character)) == 0;
    });
    if (digits_end == tail.begin()) {
        return std::string{beacon_name};
    }
    return "Beacon " + std::string(tail.begin(), digits_end);
}

}  // namespace beacon_presence
