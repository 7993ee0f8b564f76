#include "beacon_presence/query_service.hpp"

#include <algorithm>
#include <utility>

#include "beacon_presence/staleness.hpp"
#include "beacon_presence/text_decoding.hpp"

namespace beacon_presence {

namespace {

std::optional<SignalSummary> summarize_signals(const std::vector<int>& list_samples) {
    if (list_samples.empty()) {
        return std::nullopt;
    }
    SignalSummary summary{};
    summary.sample_count = list_samples.size();
    summary.strongest_dbm = *std::max_element(list_samples.begin(), list_samples.end());
    summary.weakest_dbm = *std::min_element(list_samples.begin(), list_samples.end());
    double total = 0.0;
    for (const int sample : list_samples) {
        total += sample;
    }
    summary.average_dbm = total / static_cast<double>(list_samples.size());
    return summary;
}

}  // namespace

QueryService::QueryService(const Registry& registry, StalenessThresholds thresholds)
    : registry_(registry),
      thresholds_(thresholds) {}

std::optional<BeaconMatch> QueryService::find_beacon(std::string_view identity) const {
    const BeaconMap& map_beacons = registry_.beacons();
    const auto iterator_address = map_beacons.find(std::string{identity});
    if (iterator_address != map_beacons.end()) {
        return BeaconMatch{iterator_address->first, iterator_address->second};
    }
    for (const auto& [address, beacon] : map_beacons) {
        if (beacon.name == identity) {
            return BeaconMatch{address, beacon};
        }
    }
    return std::nullopt;
}

std::optional<BeaconMatch> QueryService::find_beacon_by_name_fragment(std::string_view fragment) const {
    if (fragment.empty()) {
        return std::nullopt;
    }
    for (const auto& [address, beacon] : registry_.beacons()) {
        if (beacon.name.find(fragment) != std::string::npos) {
            return BeaconMatch{address, beacon};
        }
    }
    return std::nullopt;
}

std::optional<std::vector<RankedReceiver>> QueryService::receivers_for(std::string_view identity, TimePoint now) const {
    const std::optional<BeaconMatch> match = find_beacon(identity);
    if (!match.has_value()) {
        return std::nullopt;
    }
    return ranked_receivers(match->beacon, now, thresholds_.freshness);
}

StatusSummary QueryService::status_summary(TimePoint now) const {
    StatusSummary summary{};
    summary.receiver_total = registry_.receivers().size();
    for (const auto& [receiver_id, receiver] : registry_.receivers()) {
        if (is_receiver_active(receiver, now, thresholds_.active_window)) {
            ++summary.receiver_active;
        }
    }
    summary.beacon_total = registry_.beacons().size();
    for (const auto& [address, beacon] : registry_.beacons()) {
        const bool any_active = std::any_of(beacon.detections.begin(), beacon.detections.end(), [&](const auto& entry) {
            return is_detection_active(entry.second, now, thresholds_.active_window);
        });
        if (any_active) {
            ++summary.beacon_active;
        }
    }
    return summary;
}

PresenceStatistics QueryService::statistics(TimePoint now) const {
    PresenceStatistics statistics{};
    statistics.status = status_summary(now);

    std::vector<int> list_samples;
    for (const auto& [address, beacon] : registry_.beacons()) {
        std::size_t active_count = 0;
        for (const auto& [receiver_id, detection] : beacon.detections) {
            if (is_detection_active(detection, now, thresholds_.active_window)) {
                ++active_count;
                list_samples.push_back(detection.rssi_dbm);
            }
        }
        if (active_count > 1) {
            ++statistics.multi_receiver_beacons;
        } else if (active_count == 1) {
            ++statistics.single_receiver_beacons;
        }
    }
    statistics.signal = summarize_signals(list_samples);
    return statistics;
}

std::vector<BeaconOverview> QueryService::beacon_overview(TimePoint now) const {
    std::vector<BeaconOverview> list_rows;
    list_rows.reserve(registry_.beacons().size());
    for (const auto& [address, beacon] : registry_.beacons()) {
        BeaconOverview row{};
        row.address = address;
        row.name = beacon.name;
        for (const auto& [receiver_id, detection] : beacon.detections) {
            if (is_detection_active(detection, now, thresholds_.active_window)) {
                ++row.active_receivers;
                row.strongest_rssi_dbm = std::max(row.strongest_rssi_dbm, detection.rssi_dbm);
            }
            const std::optional<TimePoint> observed_at = resolve_timestamp(detection);
            if (observed_at.has_value() && (!row.newest_update.has_value() || *observed_at > *row.newest_update)) {
                row.newest_update = observed_at;
            }
        }
        row.active = row.active_receivers > 0;
        list_rows.push_back(std::move(row));
    }

    std::stable_sort(list_rows.begin(), list_rows.end(), [](const BeaconOverview& lhs, const BeaconOverview& rhs) {
        if (lhs.active != rhs.active) {
            return lhs.active;
        }
        return lhs.strongest_rssi_dbm > rhs.strongest_rssi_dbm;
    });
    return list_rows;
}

std::optional<BeaconDetail> QueryService::beacon_detail(std::string_view name_fragment, TimePoint now) const {
    const std::optional<BeaconMatch> match = find_beacon_by_name_fragment(name_fragment);
    if (!match.has_value()) {
        return std::nullopt;
    }

    BeaconDetail detail{};
    detail.address = match->address;
    detail.name = match->beacon.name;
    detail.first_seen = match->beacon.first_seen;

    std::vector<int> list_recent_samples;
    for (const auto& [receiver_id, detection] : match->beacon.detections) {
        DetectionEntry entry{};
        entry.receiver_id = receiver_id;
        entry.receiver_name = detection.receiver_name.empty() ? receiver_id : decode_unicode_escapes(detection.receiver_name);
        entry.rssi_dbm = detection.rssi_dbm;
        entry.online = detection.online;
        entry.observed_at = resolve_timestamp(detection);
        entry.recent = entry.observed_at.has_value() && is_within(*entry.observed_at, now, thresholds_.active_window);
        if (entry.recent) {
            list_recent_samples.push_back(entry.rssi_dbm);
        }
        detail.detections.push_back(std::move(entry));
    }

    std::stable_sort(detail.detections.begin(), detail.detections.end(), [](const DetectionEntry& lhs, const DetectionEntry& rhs) {
        if (lhs.recent != rhs.recent) {
            return lhs.recent;
        }
        if (lhs.recent) {
            return lhs.rssi_dbm > rhs.rssi_dbm;
        }
        return lhs.observed_at.value_or(TimePoint{}) > rhs.observed_at.value_or(TimePoint{});
    });
    detail.recent_signal = summarize_signals(list_recent_samples);
    return detail;
}

std::vector<LocatedBeacon> QueryService::located_beacons(TimePoint now, std::string_view name_prefix) const {
    std::vector<LocatedBeacon> list_located;
    for (const auto& [address, beacon] : registry_.beacons()) {
        if (!name_prefix.empty() && beacon.name.compare(0, name_prefix.size(), name_prefix) != 0) {
            continue;
        }
        std::vector<RankedReceiver> list_receivers = ranked_receivers(beacon, now, thresholds_.freshness);
        if (list_receivers.empty()) {
            continue;
        }
        LocatedBeacon located{};
        located.address = address;
        located.name = beacon.name;
        located.display_name = beacon_display_name(beacon.name);
        located.first_seen = beacon.first_seen;
        located.receivers = std::move(list_receivers);
        list_located.push_back(std::move(located));
    }

    // Receivers are ranked, so the front entry carries the strongest signal.
    std::stable_sort(list_located.begin(), list_located.end(), [](const LocatedBeacon& lhs, const LocatedBeacon& rhs) {
        return lhs.receivers.front().rssi_dbm > rhs.receivers.front().rssi_dbm;
    });
    return list_located;
}

RegistrySnapshot QueryService::snapshot() const {
    return registry_.snapshot();
}

}  // namespace beacon_presence
