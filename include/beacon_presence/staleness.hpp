// === Staleness Evaluator =====================================================
//
// Pure functions that decide whether an observation is still usable at a given
// time. Two timestamp sources are supported: the numeric epoch timestamp
// written by current receivers and the localized "YYYY/M/D H:M:S" string found
// in documents produced by older firmware. A timestamp that cannot be resolved
// always classifies as stale.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "beacon_presence/presence_records.hpp"
#include "beacon_presence/types.hpp"

namespace beacon_presence {

/** @brief Parse "YYYY/M/D H:M:S" interpreted in the local time zone. */
[[nodiscard]] std::optional<TimePoint> parse_local_timestamp(std::string_view text);

/** @brief Render @p time_point as "YYYY/M/D HH:MM:SS" in the local time zone. */
[[nodiscard]] std::string format_local_time(TimePoint time_point);

/**
 * @brief Observation time of @p detection.
 *
 * Prefers the numeric timestamp and falls back to the legacy string. Returns
 * an empty optional when neither yields a time.
 */
[[nodiscard]] std::optional<TimePoint> resolve_timestamp(const Detection& detection);

/**
 * @brief True when @p observed is at most @p threshold older than @p now.
 *
 * Future observations are always within. The age is taken as an unsigned
 * difference so that distant timestamps cannot overflow the subtraction.
 */
[[nodiscard]] constexpr bool is_within(TimePoint observed, TimePoint now, Milliseconds threshold) noexcept {
    if (observed >= now) {
        return true;
    }
    if (threshold.count() < 0) {
        return false;
    }
    const std::uint64_t age_ms = static_cast<std::uint64_t>(to_epoch_ms(now)) - static_cast<std::uint64_t>(to_epoch_ms(observed));
    return age_ms <= static_cast<std::uint64_t>(threshold.count());
}

/** @brief Detection passes the freshness test for @p threshold. */
[[nodiscard]] bool is_detection_fresh(const Detection& detection, TimePoint now, Milliseconds threshold);

/** @brief Detection is online and inside the active window. */
[[nodiscard]] bool is_detection_active(const Detection& detection, TimePoint now, Milliseconds active_window);

/** @brief Receiver reported inside the active window. */
[[nodiscard]] bool is_receiver_active(const ReceiverRecord& receiver, TimePoint now, Milliseconds active_window);

}  // namespace beacon_presence
