// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of environment-driven settings that feed
// the tracker runtime. `ConfigurationLoader` transforms raw environment
// variables into the strongly-typed `Configuration` structure.
//
// Responsibilities
// - Enforce defaults and sane bounds for thresholds, reaper cadence, retry
//   counts and listener settings.
// - Surface diagnostics via the logging subsystem whenever user input cannot
//   be parsed or violates expectations.
//
// Note: the logger is initialised here, before any other value is parsed, so
// parse warnings always have a sink.

#include "beacon_presence/configuration.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string_view>

#include "beacon_presence/logging.hpp"

namespace beacon_presence {

namespace {
constexpr std::string_view k_default_log_directory{"logs"};
constexpr std::string_view k_default_data_file{"data/blues/ble_data.json"};
constexpr std::string_view k_default_http_address{"0.0.0.0"};
constexpr double k_default_ingest_hz{20.0};
constexpr long long k_default_freshness_ms{15'000};
constexpr long long k_default_active_window_ms{10'000};
constexpr long long k_default_retention_ms{30 * 60'000};
constexpr long long k_default_reaper_interval_ms{30 * 60'000};
constexpr int k_default_persist_retries{2};
constexpr int k_default_http_port{8086};
constexpr int k_default_http_threads{2};
constexpr int k_max_http_port{65'535};
constexpr long long k_max_duration_ms{365LL * 24 * 60 * 60'000};
constexpr double k_min_ingest_hz{0.1};
constexpr double k_max_ingest_hz{1'000.0};

std::string parse_string(const char* variable_name, std::string_view fallback) {
    const char* raw_value = std::getenv(variable_name);
    if (raw_value == nullptr || std::string_view{raw_value}.empty()) {
        return std::string{fallback};
    }
    return std::string{raw_value};
}

double parse_double(const char* variable_name, double fallback, double minimum, double maximum) {
    const char* raw_value = std::getenv(variable_name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(raw_value);
        if (!(parsed_value >= minimum && parsed_value <= maximum)) {
            get_logger()->warn("{}={} is out of range [{}, {}]; using fallback {}", variable_name, parsed_value, minimum, maximum, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse {} as a number; using fallback {}", variable_name, fallback);
        return fallback;
    }
}

long long parse_milliseconds(const char* variable_name, long long fallback) {
    const char* raw_value = std::getenv(variable_name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const long long parsed_value = std::stoll(raw_value);
        if (parsed_value <= 0 || parsed_value > k_max_duration_ms) {
            get_logger()->warn("{}={} is out of range [1, {}]; using fallback {}ms", variable_name, parsed_value, k_max_duration_ms, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse {} as milliseconds; using fallback {}ms", variable_name, fallback);
        return fallback;
    }
}

int parse_int(const char* variable_name, int fallback, int minimum, int maximum) {
    const char* raw_value = std::getenv(variable_name);
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const int parsed_value = std::stoi(raw_value);
        if (parsed_value < minimum || parsed_value > maximum) {
            get_logger()->warn("{}={} is out of range [{}, {}]; using fallback {}", variable_name, parsed_value, minimum, maximum, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse {} as an integer; using fallback {}", variable_name, fallback);
        return fallback;
    }
}

}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = parse_string("BEACON_PRESENCE_LOG_DIR", k_default_log_directory);

    auto logger = initialize_logger(config.log_directory);
    logger->info("Loading configuration from environment");

    config.log_level = parse_string("BEACON_PRESENCE_LOG_LEVEL", "");
    config.data_file = parse_string("BEACON_PRESENCE_DATA_FILE", k_default_data_file);
    config.tracker.thresholds = load_thresholds();
    config.tracker.persist_retries = parse_int("BEACON_PRESENCE_PERSIST_RETRIES", k_default_persist_retries, 0, 10);
    config.reaper_interval = Milliseconds{parse_milliseconds("BEACON_PRESENCE_REAPER_INTERVAL_MS", k_default_reaper_interval_ms)};
    config.ingest_hz = parse_double("BEACON_PRESENCE_INGEST_HZ", k_default_ingest_hz, k_min_ingest_hz, k_max_ingest_hz);
    config.http = load_http();

    logger->info("Configuration loaded: data_file={} freshness_ms={} active_window_ms={} retention_ms={} reaper_interval_ms={} http={}:{}",
                 config.data_file.string(),
                 config.tracker.thresholds.freshness.count(),
                 config.tracker.thresholds.active_window.count(),
                 config.tracker.thresholds.retention.count(),
                 config.reaper_interval.count(),
                 config.http.address,
                 config.http.port);
    if (config.http.api_token.empty()) {
        logger->warn("BEACON_PRESENCE_API_TOKEN is not set; reset requests will be refused");
    }

    return config;
}

StalenessThresholds ConfigurationLoader::load_thresholds() {
    StalenessThresholds thresholds{};
    thresholds.freshness = Milliseconds{parse_milliseconds("BEACON_PRESENCE_FRESHNESS_MS", k_default_freshness_ms)};
    thresholds.active_window = Milliseconds{parse_milliseconds("BEACON_PRESENCE_ACTIVE_WINDOW_MS", k_default_active_window_ms)};
    thresholds.retention = Milliseconds{parse_milliseconds("BEACON_PRESENCE_RETENTION_MS", k_default_retention_ms)};
    return thresholds;
}

HttpConfig ConfigurationLoader::load_http() {
    HttpConfig http{};
    http.address = parse_string("BEACON_PRESENCE_HTTP_ADDRESS", k_default_http_address);
    http.port = static_cast<unsigned short>(parse_int("BEACON_PRESENCE_HTTP_PORT", k_default_http_port, 0, k_max_http_port));
    http.threads = parse_int("BEACON_PRESENCE_HTTP_THREADS", k_default_http_threads, 1, 64);
    http.api_token = parse_string("BEACON_PRESENCE_API_TOKEN", "");
    return http;
}

}  // namespace beacon_presence
