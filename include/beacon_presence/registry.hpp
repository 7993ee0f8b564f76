// === Registry ================================================================
//
// Holds the current known state of receivers and tracked beacons. The
// registry is plain storage: it is not synchronized and performs no
// validation. Callers that share an instance across threads go through
// PresenceTracker, which serializes writers.

#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "beacon_presence/presence_records.hpp"

namespace beacon_presence {

/** @brief Owns every receiver, beacon and detection record. */
class Registry final {
  public:
    Registry() = default;
    explicit Registry(RegistrySnapshot snapshot);

    /** @brief Create or refresh a receiver with the supplied attributes. */
    void upsert_receiver(const std::string& receiver_id, const ReceiverAttributes& attributes, TimePoint now);
    /**
     * @brief Create a beacon stamped with @p now, or rename an existing one.
     *
     * An existing beacon keeps its first_seen time; its name only changes
     * when @p name carries a value.
     */
    void upsert_beacon(const std::string& address, const std::optional<std::string>& name, TimePoint now);
    /** @brief Replace the detection for (@p address, @p receiver_id), stamping it with @p now. */
    void upsert_detection(const std::string& address, const std::string& receiver_id, Detection detection, TimePoint now);

    /** @brief Copy of the beacon stored under @p address. */
    [[nodiscard]] std::optional<BeaconRecord> get_beacon(const std::string& address) const;
    /** @brief Copy of the receiver stored under @p receiver_id. */
    [[nodiscard]] std::optional<ReceiverRecord> get_receiver(const std::string& receiver_id) const;
    [[nodiscard]] const BeaconMap& beacons() const noexcept;
    [[nodiscard]] const ReceiverMap& receivers() const noexcept;
    /** @brief Total number of detections across all beacons. */
    [[nodiscard]] std::size_t detection_count() const noexcept;

    bool remove_receiver(const std::string& receiver_id);
    bool remove_detection(const std::string& address, const std::string& receiver_id);
    /** @brief Drop the beacon when it has no detections left. */
    bool remove_beacon_if_empty(const std::string& address);
    void clear() noexcept;

    [[nodiscard]] RegistrySnapshot snapshot() const;

  private:
    ReceiverMap map_receivers_;
    BeaconMap map_beacons_;
};

}  // namespace beacon_presence
