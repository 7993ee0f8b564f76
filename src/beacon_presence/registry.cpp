#include "beacon_presence/registry.hpp"

#include <utility>

namespace beacon_presence {

Registry::Registry(RegistrySnapshot snapshot)
    : map_receivers_(std::move(snapshot.receivers)),
      map_beacons_(std::move(snapshot.beacons)) {}

void Registry::upsert_receiver(const std::string& receiver_id, const ReceiverAttributes& attributes, TimePoint now) {
    ReceiverRecord& record = map_receivers_[receiver_id];
    record.name = attributes.name;
    record.type = attributes.type;
    record.last_report = now;
    record.batch = attributes.batch;
    record.total_batches = attributes.total_batches;
}

void Registry::upsert_beacon(const std::string& address, const std::optional<std::string>& name, TimePoint now) {
    const auto [iterator_beacon, inserted] = map_beacons_.try_emplace(address);
    BeaconRecord& record = iterator_beacon->second;
    if (inserted) {
        record.first_seen = now;
    }
    if (name.has_value()) {
        record.name = *name;
    }
}

void Registry::upsert_detection(const std::string& address, const std::string& receiver_id, Detection detection, TimePoint now) {
    const auto [iterator_beacon, inserted] = map_beacons_.try_emplace(address);
    if (inserted) {
        iterator_beacon->second.first_seen = now;
    }
    detection.update_time = now;
    detection.last_update.clear();
    iterator_beacon->second.detections.insert_or_assign(receiver_id, std::move(detection));
}

std::optional<BeaconRecord> Registry::get_beacon(const std::string& address) const {
    const auto iterator_beacon = map_beacons_.find(address);
    if (iterator_beacon == map_beacons_.end()) {
        return std::nullopt;
    }
    return iterator_beacon->second;
}

std::optional<ReceiverRecord> Registry::get_receiver(const std::string& receiver_id) const {
    const auto iterator_receiver = map_receivers_.find(receiver_id);
    if (iterator_receiver == map_receivers_.end()) {
        return std::nullopt;
    }
    return iterator_receiver->second;
}

const BeaconMap& Registry::beacons() const noexcept {
    return map_beacons_;
}

const ReceiverMap& Registry::receivers() const noexcept {
    return map_receivers_;
}

std::size_t Registry::detection_count() const noexcept {
    std::size_t count = 0;
    for (const auto& [address, beacon] : map_beacons_) {
        count += beacon.detections.size();
    }
    return count;
}

bool Registry::remove_receiver(const std::string& receiver_id) {
    return map_receivers_.erase(receiver_id) > 0;
}

bool Registry::remove_detection(const std::string& address, const std::string& receiver_id) {
    const auto iterator_beacon = map_beacons_.find(address);
    if (iterator_beacon == map_beacons_.end()) {
        return false;
    }
    return iterator_beacon->second.detections.erase(receiver_id) > 0;
}

bool Registry::remove_beacon_if_empty(const std::string& address) {
    const auto iterator_beacon = map_beacons_.find(address);
    if (iterator_beacon == map_beacons_.end() || !iterator_beacon->second.detections.empty()) {
        return false;
    }
    map_beacons_.erase(iterator_beacon);
    return true;
}

void Registry::clear() noexcept {
    map_receivers_.clear();
    map_beacons_.clear();
}

RegistrySnapshot Registry::snapshot() const {
    return RegistrySnapshot{map_receivers_, map_beacons_};
}

}  // namespace beacon_presence
