// === Configuration ===========================================================
//
// Exposes strongly-typed configuration objects that describe tracker
// thresholds, persistence, reaper cadence, logging and HTTP settings.
// `ConfigurationLoader` translates environment variables into these structures
// so downstream modules never touch `std::getenv` directly.

#pragma once

#include <filesystem>
#include <string>

#include "beacon_presence/http_api.hpp"
#include "beacon_presence/presence_tracker.hpp"
#include "beacon_presence/types.hpp"

namespace beacon_presence {

/**
 * @brief Immutable bundle of runtime knobs for the presence tracker daemon.
 *
 * Every field is populated by ConfigurationLoader; consumers should treat the
 * values as authoritative and avoid consulting environment variables
 * directly.
 */
struct Configuration final {
    std::string log_directory{};                      /**< Destination directory for structured logs. */
    std::string log_level{};                          /**< Requested spdlog level; empty keeps the default. */
    std::filesystem::path data_file{};                /**< Persisted registry document. */
    TrackerConfig tracker{};                          /**< Thresholds and persistence retry policy. */
    Milliseconds reaper_interval{30 * 60'000};        /**< Wall-clock time between reaper sweeps. */
    double ingest_hz{};                               /**< Ingest worker polling cadence in Hertz. */
    HttpConfig http{};                                /**< Listener and authorization settings. */
};

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables.
 */
class ConfigurationLoader final {
  public:
    static Configuration load();

  private:
    static StalenessThresholds load_thresholds();
    static HttpConfig load_http();
};

}  // namespace beacon_presence
