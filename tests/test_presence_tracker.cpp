#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "test_support.hpp"
#include "beacon_presence/presence_tracker.hpp"

using namespace beacon_presence;
using beacon_presence::test::MemoryRegistryStore;
using beacon_presence::test::observed;
using beacon_presence::test::report_from;
using beacon_presence::test::temp_path;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    beacon_presence::test::ensure_logger_initialized();
    return true;
}();

constexpr TimePoint k_now = from_epoch_ms(1'700'000'000'000);

TrackerConfig fast_retry_config(int persist_retries) {
    TrackerConfig config{};
    config.persist_retries = persist_retries;
    config.retry_backoff = Milliseconds{1};
    return config;
}
}  // namespace

TEST_CASE("PresenceTracker requires a store") {
    REQUIRE_THROWS_AS(PresenceTracker(TrackerConfig{}, nullptr), std::invalid_argument);
}

TEST_CASE("Ingested reports are persisted and survive a reload") {
    const auto path = temp_path("tracker");
    {
        PresenceTracker tracker{TrackerConfig{}, std::make_shared<JsonFileRegistryStore>(path)};
        tracker.load();
        const IngestResult result = tracker.ingest(report_from("R1", {observed("AA:BB", std::string{"Tag"}, -58.0)}), k_now);
        REQUIRE(result.status == IngestStatus::Merged);
        REQUIRE(result.persisted);
    }

    PresenceTracker reloaded{TrackerConfig{}, std::make_shared<JsonFileRegistryStore>(path)};
    reloaded.load();
    const auto list_ranked = reloaded.ranked_receivers_for("Tag", k_now + Milliseconds{1'000});
    REQUIRE(list_ranked.has_value());
    REQUIRE(list_ranked->size() == 1);
    REQUIRE(list_ranked->front().receiver_id == "R1");
    REQUIRE(list_ranked->front().rssi_dbm == -58);
}

TEST_CASE("Rejected reports are not persisted") {
    auto store = std::make_shared<MemoryRegistryStore>();
    PresenceTracker tracker{fast_retry_config(0), store};

    const IngestResult result = tracker.ingest(report_from("", {observed("AA:BB", std::nullopt, -58.0)}), k_now);

    REQUIRE(result.status == IngestStatus::RejectedMissingReceiver);
    REQUIRE_FALSE(result.persisted);
    REQUIRE(store->save_attempts() == 0);
}

TEST_CASE("A failing store leaves the in-memory merge in place") {
    auto store = std::make_shared<MemoryRegistryStore>();
    store->set_fail_saves(true);
    PresenceTracker tracker{fast_retry_config(2), store};

    const IngestResult result = tracker.ingest(report_from("R1", {observed("AA:BB", std::nullopt, -58.0)}), k_now);

    REQUIRE(result.status == IngestStatus::Merged);
    REQUIRE(result.merged_count == 1);
    REQUIRE_FALSE(result.persisted);
    REQUIRE(store->save_attempts() == 3);
    REQUIRE(tracker.find_beacon("AA:BB").has_value());

    store->set_fail_saves(false);
    REQUIRE(tracker.ingest(report_from("R2", {observed("AA:BB", std::nullopt, -66.0)}), k_now).persisted);
    REQUIRE(store->stored().beacons.at("AA:BB").detections.size() == 2);
}

TEST_CASE("Load replaces the registry with the stored snapshot") {
    auto store = std::make_shared<MemoryRegistryStore>();
    RegistrySnapshot stored{};
    stored.beacons["AA:BB"].name = "Stored";
    store->set_stored(stored);

    PresenceTracker tracker{fast_retry_config(0), store};
    REQUIRE_FALSE(tracker.find_beacon("Stored").has_value());
    tracker.load();
    REQUIRE(tracker.find_beacon("Stored")->address == "AA:BB");
}

TEST_CASE("Sweeps persist only when something was removed") {
    auto store = std::make_shared<MemoryRegistryStore>();
    PresenceTracker tracker{fast_retry_config(0), store};
    (void)tracker.ingest(report_from("R1", {observed("AA:BB", std::nullopt, -58.0)}), k_now);
    const int saves_after_ingest = store->save_count();

    REQUIRE(tracker.sweep(k_now + Milliseconds{1'000}).total() == 0);
    REQUIRE(store->save_count() == saves_after_ingest);

    const ReapSummary summary = tracker.sweep(k_now + tracker.config().thresholds.retention + Milliseconds{1});
    REQUIRE(summary.receivers_removed == 1);
    REQUIRE(summary.detections_removed == 1);
    REQUIRE(summary.beacons_removed == 1);
    REQUIRE(store->save_count() == saves_after_ingest + 1);
    REQUIRE(store->stored().beacons.empty());
}

TEST_CASE("Reset clears memory and reports whether it was persisted") {
    auto store = std::make_shared<MemoryRegistryStore>();
    PresenceTracker tracker{fast_retry_config(0), store};
    (void)tracker.ingest(report_from("R1", {observed("AA:BB", std::nullopt, -58.0)}), k_now);

    REQUIRE(tracker.reset());
    REQUIRE(tracker.snapshot().beacons.empty());
    REQUIRE(tracker.snapshot().receivers.empty());
    REQUIRE(store->stored().beacons.empty());

    store->set_fail_saves(true);
    REQUIRE_FALSE(tracker.reset());
}

TEST_CASE("The full listing decodes escaped text") {
    auto store = std::make_shared<MemoryRegistryStore>();
    PresenceTracker tracker{fast_retry_config(0), store};
    ReceiverReport report = report_from("R1", {observed("AA:BB", std::string{R"(\u4e2d\u6587)"}, -58.0)});
    report.receiver_name = R"(\u0041-room)";
    (void)tracker.ingest(report, k_now);

    const Json::Value listing = tracker.list_all();
    REQUIRE(listing["devices"]["R1"]["name"].asString() == "A-room");
    REQUIRE(listing["beacons"]["AA:BB"]["name"].asString() == "\xE4\xB8\xAD\xE6\x96\x87");
}

TEST_CASE("Concurrent ingestion and queries keep detections unique") {
    auto store = std::make_shared<MemoryRegistryStore>();
    PresenceTracker tracker{fast_retry_config(0), store};
    constexpr int k_writers = 4;
    constexpr int k_rounds = 50;
    constexpr int k_beacons = 6;

    std::atomic<bool> flag_writing{true};
    std::vector<std::thread> list_writers;
    for (int writer = 0; writer < k_writers; ++writer) {
        list_writers.emplace_back([&tracker, writer]() {
            for (int round = 0; round < k_rounds; ++round) {
                std::vector<ObservedBeacon> list_observed;
                for (int beacon = 0; beacon < k_beacons; ++beacon) {
                    list_observed.push_back(observed("AA:0" + std::to_string(beacon), std::nullopt, -40.0 - writer - round % 10));
                }
                (void)tracker.ingest(report_from("R" + std::to_string(writer), list_observed), k_now + Milliseconds{round});
            }
        });
    }

    // Catch2 assertions are not thread-safe, so the reader only counts violations.
    std::atomic<int> violations{0};
    std::thread reader([&tracker, &flag_writing, &violations]() {
        while (flag_writing.load()) {
            const StatusSummary summary = tracker.status_summary(k_now);
            if (summary.beacon_total > static_cast<std::size_t>(k_beacons)) {
                ++violations;
            }
            for (const LocatedBeacon& located : tracker.located_beacons(k_now, "")) {
                if (located.receivers.size() > static_cast<std::size_t>(k_writers)) {
                    ++violations;
                }
            }
        }
    });

    for (auto& writer : list_writers) {
        writer.join();
    }
    flag_writing.store(false);
    reader.join();

    REQUIRE(violations.load() == 0);

    const RegistrySnapshot snapshot = tracker.snapshot();
    REQUIRE(snapshot.receivers.size() == static_cast<std::size_t>(k_writers));
    REQUIRE(snapshot.beacons.size() == static_cast<std::size_t>(k_beacons));
    for (const auto& [address, beacon] : snapshot.beacons) {
        REQUIRE(beacon.detections.size() == static_cast<std::size_t>(k_writers));
    }
}
