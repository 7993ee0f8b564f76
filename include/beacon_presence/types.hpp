// === Core Types ==============================================================
//
// Collects shared time aliases and tunable thresholds used throughout the
// presence tracker (wall-clock timestamps, staleness windows, retention).

#pragma once

#include <chrono>
#include <cstdint>

namespace beacon_presence {

/**
 * @brief Alias for the wall clock; persisted timestamps are epoch based.
 */
using SystemClock = std::chrono::system_clock;

/**
 * @brief Alias for millisecond durations used by every threshold.
 */
using Milliseconds = std::chrono::milliseconds;

/**
 * @brief Alias for wall-clock timestamps with millisecond resolution.
 */
using TimePoint = std::chrono::time_point<SystemClock, Milliseconds>;

/**
 * @brief Current wall-clock time truncated to milliseconds.
 */
inline TimePoint now_ms() {
    return std::chrono::time_point_cast<Milliseconds>(SystemClock::now());
}

/**
 * @brief Build a timestamp from milliseconds since the Unix epoch.
 */
constexpr TimePoint from_epoch_ms(std::int64_t epoch_ms) {
    return TimePoint{Milliseconds{epoch_ms}};
}

/**
 * @brief Milliseconds since the Unix epoch for @p time_point.
 */
constexpr std::int64_t to_epoch_ms(TimePoint time_point) {
    return time_point.time_since_epoch().count();
}

/**
 * @brief Latest timestamp accepted from persisted or parsed input
 * (9999-12-31T23:59:59.999Z).
 */
inline constexpr std::int64_t k_max_epoch_ms{253'402'300'799'999};

/**
 * @brief True when @p epoch_ms lies between the Unix epoch and year 9999.
 *
 * Anything outside is treated as a missing timestamp so that time arithmetic
 * on stored values can never overflow.
 */
constexpr bool is_valid_epoch_ms(std::int64_t epoch_ms) noexcept {
    return epoch_ms >= 0 && epoch_ms <= k_max_epoch_ms;
}

/** @brief Signal strength stored when a report carries no usable reading. */
inline constexpr int k_unknown_rssi_dbm{-100};

/** @brief Weakest reading accepted as a real measurement. */
inline constexpr int k_min_rssi_dbm{-200};

/** @brief Strongest reading accepted as a real measurement. */
inline constexpr int k_max_rssi_dbm{50};

/**
 * @brief Time thresholds that classify observations.
 *
 * The three windows serve different purposes and are configured
 * independently: freshness decides what is displayable, the active window
 * drives aggregate "online" counts, and retention bounds storage growth.
 */
struct StalenessThresholds final {
    Milliseconds freshness{15'000};        /**< Maximum age of a displayable detection. */
    Milliseconds active_window{10'000};    /**< Maximum age counted as currently active. */
    Milliseconds retention{30 * 60'000};   /**< Age after which the reaper discards data. */
};

}  // namespace beacon_presence
