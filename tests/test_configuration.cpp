#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "beacon_presence/configuration.hpp"

using namespace beacon_presence;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    beacon_presence::test::ensure_logger_initialized();
    return true;
}();

const std::vector<std::string> k_variables{
    "BEACON_PRESENCE_LOG_DIR",
    "BEACON_PRESENCE_LOG_LEVEL",
    "BEACON_PRESENCE_DATA_FILE",
    "BEACON_PRESENCE_FRESHNESS_MS",
    "BEACON_PRESENCE_ACTIVE_WINDOW_MS",
    "BEACON_PRESENCE_RETENTION_MS",
    "BEACON_PRESENCE_REAPER_INTERVAL_MS",
    "BEACON_PRESENCE_INGEST_HZ",
    "BEACON_PRESENCE_PERSIST_RETRIES",
    "BEACON_PRESENCE_HTTP_ADDRESS",
    "BEACON_PRESENCE_HTTP_PORT",
    "BEACON_PRESENCE_HTTP_THREADS",
    "BEACON_PRESENCE_API_TOKEN",
};

/** @brief Clears every configuration variable on entry and exit. */
class ScopedEnvironment final {
  public:
    ScopedEnvironment() {
        clear();
    }

    ~ScopedEnvironment() {
        clear();
    }

    void set(const std::string& name, const std::string& value) {
        ::setenv(name.c_str(), value.c_str(), 1);
    }

  private:
    static void clear() {
        for (const std::string& name : k_variables) {
            ::unsetenv(name.c_str());
        }
    }
};
}  // namespace

TEST_CASE("ConfigurationLoader falls back to defaults") {
    ScopedEnvironment environment{};

    const Configuration config = ConfigurationLoader::load();

    REQUIRE(config.log_directory == "logs");
    REQUIRE(config.log_level.empty());
    REQUIRE(config.data_file == std::filesystem::path{"data/blues/ble_data.json"});
    REQUIRE(config.tracker.thresholds.freshness == Milliseconds{15'000});
    REQUIRE(config.tracker.thresholds.active_window == Milliseconds{10'000});
    REQUIRE(config.tracker.thresholds.retention == Milliseconds{1'800'000});
    REQUIRE(config.tracker.persist_retries == 2);
    REQUIRE(config.reaper_interval == Milliseconds{1'800'000});
    REQUIRE(config.ingest_hz == Approx(20.0));
    REQUIRE(config.http.address == "0.0.0.0");
    REQUIRE(config.http.port == 8086);
    REQUIRE(config.http.threads == 2);
    REQUIRE(config.http.api_token.empty());
}

TEST_CASE("ConfigurationLoader applies environment overrides") {
    ScopedEnvironment environment{};
    environment.set("BEACON_PRESENCE_DATA_FILE", "/var/lib/beacons/registry.json");
    environment.set("BEACON_PRESENCE_FRESHNESS_MS", "20000");
    environment.set("BEACON_PRESENCE_ACTIVE_WINDOW_MS", "5000");
    environment.set("BEACON_PRESENCE_RETENTION_MS", "600000");
    environment.set("BEACON_PRESENCE_REAPER_INTERVAL_MS", "60000");
    environment.set("BEACON_PRESENCE_INGEST_HZ", "5.5");
    environment.set("BEACON_PRESENCE_PERSIST_RETRIES", "0");
    environment.set("BEACON_PRESENCE_HTTP_ADDRESS", "127.0.0.1");
    environment.set("BEACON_PRESENCE_HTTP_PORT", "9090");
    environment.set("BEACON_PRESENCE_HTTP_THREADS", "4");
    environment.set("BEACON_PRESENCE_API_TOKEN", "token-1");
    environment.set("BEACON_PRESENCE_LOG_LEVEL", "debug");

    const Configuration config = ConfigurationLoader::load();

    REQUIRE(config.data_file == std::filesystem::path{"/var/lib/beacons/registry.json"});
    REQUIRE(config.tracker.thresholds.freshness == Milliseconds{20'000});
    REQUIRE(config.tracker.thresholds.active_window == Milliseconds{5'000});
    REQUIRE(config.tracker.thresholds.retention == Milliseconds{600'000});
    REQUIRE(config.reaper_interval == Milliseconds{60'000});
    REQUIRE(config.ingest_hz == Approx(5.5));
    REQUIRE(config.tracker.persist_retries == 0);
    REQUIRE(config.http.address == "127.0.0.1");
    REQUIRE(config.http.port == 9090);
    REQUIRE(config.http.threads == 4);
    REQUIRE(config.http.api_token == "token-1");
    REQUIRE(config.log_level == "debug");
}

TEST_CASE("ConfigurationLoader rejects invalid values") {
    ScopedEnvironment environment{};
    environment.set("BEACON_PRESENCE_FRESHNESS_MS", "soon");
    environment.set("BEACON_PRESENCE_ACTIVE_WINDOW_MS", "-5");
    environment.set("BEACON_PRESENCE_INGEST_HZ", "0");
    environment.set("BEACON_PRESENCE_PERSIST_RETRIES", "11");
    environment.set("BEACON_PRESENCE_HTTP_PORT", "70000");
    environment.set("BEACON_PRESENCE_HTTP_THREADS", "zero");

    const Configuration config = ConfigurationLoader::load();

    REQUIRE(config.tracker.thresholds.freshness == Milliseconds{15'000});
    REQUIRE(config.tracker.thresholds.active_window == Milliseconds{10'000});
    REQUIRE(config.ingest_hz == Approx(20.0));
    REQUIRE(config.tracker.persist_retries == 2);
    REQUIRE(config.http.port == 8086);
    REQUIRE(config.http.threads == 2);
}

TEST_CASE("ConfigurationLoader caps durations and the ingest rate") {
    ScopedEnvironment environment{};
    environment.set("BEACON_PRESENCE_FRESHNESS_MS", "9223372036854775807");
    environment.set("BEACON_PRESENCE_RETENTION_MS", "99999999999999");
    environment.set("BEACON_PRESENCE_REAPER_INTERVAL_MS", "0");
    environment.set("BEACON_PRESENCE_INGEST_HZ", "1e300");

    Configuration config = ConfigurationLoader::load();

    REQUIRE(config.tracker.thresholds.freshness == Milliseconds{15'000});
    REQUIRE(config.tracker.thresholds.retention == Milliseconds{1'800'000});
    REQUIRE(config.reaper_interval == Milliseconds{1'800'000});
    REQUIRE(config.ingest_hz == Approx(20.0));

    environment.set("BEACON_PRESENCE_INGEST_HZ", "0.01");
    environment.set("BEACON_PRESENCE_RETENTION_MS", "31536000000");
    config = ConfigurationLoader::load();
    REQUIRE(config.ingest_hz == Approx(20.0));
    REQUIRE(config.tracker.thresholds.retention == Milliseconds{31'536'000'000});
}
