// === Presence Resolver =======================================================
//
// Derives, for one beacon, the receivers currently observing it ranked by
// signal strength. The strongest signal is used as a proximity proxy; it is an
// ordering heuristic, not a calibrated distance.

#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "beacon_presence/presence_records.hpp"
#include "beacon_presence/types.hpp"

namespace beacon_presence {

/** @brief One receiver observing a beacon, as returned to callers. */
struct RankedReceiver final {
    std::string receiver_id{};
    std::string receiver_name{};       /**< Decoded display name; falls back to the id. */
    int rssi_dbm{k_unknown_rssi_dbm};
    bool online{};
    TimePoint observed_at{};           /**< Resolved observation time. */
    std::string observed_at_text{};    /**< observed_at rendered in local time. */
};

/** @brief Coarse signal bands used by presentation layers. */
enum class SignalLevel {
    Strong,     /**< At least -60 dBm. */
    Medium,     /**< At least -70 dBm. */
    Weak,       /**< At least -80 dBm. */
    VeryWeak    /**< Below -80 dBm. */
};

/**
 * @brief Fresh detections of @p beacon, strongest first.
 *
 * Detections whose timestamp cannot be resolved, or whose age exceeds
 * @p threshold, are excluded. Equal signals keep registry order.
 */
[[nodiscard]] std::vector<RankedReceiver> ranked_receivers(const BeaconRecord& beacon, TimePoint now, Milliseconds threshold);

[[nodiscard]] SignalLevel classify_signal(int rssi_dbm) noexcept;
[[nodiscard]] std::string_view to_string(SignalLevel level) noexcept;

/** @brief Friendly label for a beacon name ("ESP-C3-7" becomes "Beacon 7"). */
[[nodiscard]] std::string beacon_display_name(std::string_view beacon_name);

}  // namespace beacon_presence
