#include "beacon_presence/reaper.hpp"

#include <string>
#include <utility>
#include <vector>

#include "beacon_presence/staleness.hpp"

namespace beacon_presence {

Reaper::Reaper(Milliseconds retention)
    : retention_(retention) {}

Milliseconds Reaper::retention() const noexcept {
    return retention_;
}

ReapSummary Reaper::sweep(Registry& registry, TimePoint now) const {
    ReapSummary summary{};

    std::vector<std::string> list_expired_receivers;
    for (const auto& [receiver_id, receiver] : registry.receivers()) {
        if (!is_within(receiver.last_report, now, retention_)) {
            list_expired_receivers.push_back(receiver_id);
        }
    }
    for (const std::string& receiver_id : list_expired_receivers) {
        if (registry.remove_receiver(receiver_id)) {
            ++summary.receivers_removed;
        }
    }

    std::vector<std::pair<std::string, std::string>> list_expired_detections;
    std::vector<std::string> list_addresses;
    for (const auto& [address, beacon] : registry.beacons()) {
        list_addresses.push_back(address);
        for (const auto& [receiver_id, detection] : beacon.detections) {
            if (!is_detection_fresh(detection, now, retention_)) {
                list_expired_detections.emplace_back(address, receiver_id);
            }
        }
    }
    for (const auto& [address, receiver_id] : list_expired_detections) {
        if (registry.remove_detection(address, receiver_id)) {
            ++summary.detections_removed;
        }
    }
    for (const std::string& address : list_addresses) {
        if (registry.remove_beacon_if_empty(address)) {
            ++summary.beacons_removed;
        }
    }
    return summary;
}

}  // namespace beacon_presence
