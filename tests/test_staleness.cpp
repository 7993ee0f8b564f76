#include <chrono>
#include <cstdint>
#include <ctime>
#include <limits>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "beacon_presence/staleness.hpp"

using namespace beacon_presence;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    beacon_presence::test::ensure_logger_initialized();
    return true;
}();

constexpr TimePoint k_now = from_epoch_ms(1'700'000'000'000);

Detection detection_at(TimePoint update_time, bool online = true) {
    Detection detection{};
    detection.receiver_name = "Hall";
    detection.rssi_dbm = -60;
    detection.online = online;
    detection.update_time = update_time;
    return detection;
}

TimePoint local_time_point(int year, int month, int day, int hour, int minute, int second) {
    std::tm local_tm{};
    local_tm.tm_year = year - 1900;
    local_tm.tm_mon = month - 1;
    local_tm.tm_mday = day;
    local_tm.tm_hour = hour;
    local_tm.tm_min = minute;
    local_tm.tm_sec = second;
    local_tm.tm_isdst = -1;
    return std::chrono::time_point_cast<Milliseconds>(SystemClock::from_time_t(std::mktime(&local_tm)));
}
}  // namespace

TEST_CASE("A detection exactly at the freshness threshold is still fresh") {
    const Milliseconds threshold{15'000};
    REQUIRE(is_detection_fresh(detection_at(k_now - threshold), k_now, threshold));
    REQUIRE_FALSE(is_detection_fresh(detection_at(k_now - threshold - Milliseconds{1}), k_now, threshold));
}

TEST_CASE("Detections stamped in the future count as fresh") {
    REQUIRE(is_detection_fresh(detection_at(k_now + Milliseconds{5'000}), k_now, Milliseconds{15'000}));
}

TEST_CASE("Legacy text timestamps are used when no numeric time is present") {
    Detection detection{};
    detection.last_update = "2025/11/7 20:32:24";

    const auto resolved = resolve_timestamp(detection);
    REQUIRE(resolved.has_value());
    REQUIRE(*resolved == local_time_point(2025, 11, 7, 20, 32, 24));

    SECTION("a numeric time takes precedence") {
        detection.update_time = k_now;
        REQUIRE(resolve_timestamp(detection) == k_now);
    }

    SECTION("a zero numeric time is treated as absent") {
        detection.update_time = from_epoch_ms(0);
        REQUIRE(resolve_timestamp(detection) == local_time_point(2025, 11, 7, 20, 32, 24));
    }
}

TEST_CASE("Detections without a resolvable timestamp are never fresh") {
    Detection detection{};
    detection.online = true;
    detection.last_update = "yesterday-ish";

    REQUIRE_FALSE(resolve_timestamp(detection).has_value());
    REQUIRE_FALSE(is_detection_fresh(detection, k_now, Milliseconds{1'000'000'000}));
    REQUIRE_FALSE(is_detection_active(detection, k_now, Milliseconds{1'000'000'000}));
}

TEST_CASE("Malformed local timestamps are rejected") {
    REQUIRE_FALSE(parse_local_timestamp("").has_value());
    REQUIRE_FALSE(parse_local_timestamp("2025/11/7").has_value());
    REQUIRE_FALSE(parse_local_timestamp("2025/13/7 10:00:00").has_value());
    REQUIRE_FALSE(parse_local_timestamp("2025/11/7 24:00:00").has_value());
    REQUIRE_FALSE(parse_local_timestamp("2025/11/7 10:00:00 extra").has_value());
    REQUIRE_FALSE(parse_local_timestamp("2025-11-07T10:00:00").has_value());
}

TEST_CASE("Formatted local times parse back to the same second") {
    const TimePoint observed = local_time_point(2024, 3, 9, 7, 5, 3);
    const std::string text = format_local_time(observed);

    REQUIRE(text == "2024/3/9 07:05:03");
    REQUIRE(parse_local_timestamp(text) == observed);
}

TEST_CASE("Active detections must be online and inside the active window") {
    const Milliseconds window{10'000};
    REQUIRE(is_detection_active(detection_at(k_now - Milliseconds{2'000}), k_now, window));
    REQUIRE_FALSE(is_detection_active(detection_at(k_now - Milliseconds{2'000}, false), k_now, window));
    REQUIRE_FALSE(is_detection_active(detection_at(k_now - Milliseconds{12'000}), k_now, window));
}

TEST_CASE("Receivers are active while their last report is inside the window") {
    ReceiverRecord receiver{};
    receiver.last_report = k_now - Milliseconds{10'000};
    REQUIRE(is_receiver_active(receiver, k_now, Milliseconds{10'000}));

    receiver.last_report = k_now - Milliseconds{10'001};
    REQUIRE_FALSE(is_receiver_active(receiver, k_now, Milliseconds{10'000}));
}

TEST_CASE("The active window includes its own boundary") {
    const Milliseconds window{10'000};
    REQUIRE(is_detection_active(detection_at(k_now - window), k_now, window));
    REQUIRE_FALSE(is_detection_active(detection_at(k_now - window - Milliseconds{1}), k_now, window));
}

TEST_CASE("Local timestamps outside the supported years are rejected") {
    REQUIRE_FALSE(parse_local_timestamp("99999999/1/1 0:0:0").has_value());
    REQUIRE_FALSE(parse_local_timestamp("10000/1/1 00:00:00").has_value());
    REQUIRE_FALSE(parse_local_timestamp("1969/12/31 12:00:00").has_value());
}

TEST_CASE("Signed fields in local timestamps are rejected") {
    REQUIRE_FALSE(parse_local_timestamp("2025/11/7 -3:00:00").has_value());
    REQUIRE_FALSE(parse_local_timestamp("2025/11/7 10:-5:00").has_value());
    REQUIRE_FALSE(parse_local_timestamp("2025/11/7 10:05:-1").has_value());
    REQUIRE_FALSE(parse_local_timestamp("2025/11/7 +3:00:00").has_value());
}

TEST_CASE("Ages spanning the whole timestamp range do not wrap around") {
    const TimePoint earliest{Milliseconds{std::numeric_limits<std::int64_t>::min()}};
    const TimePoint latest{Milliseconds{std::numeric_limits<std::int64_t>::max()}};

    REQUIRE_FALSE(is_within(earliest, latest, Milliseconds{15'000}));
    REQUIRE_FALSE(is_within(earliest, k_now, Milliseconds{15'000}));
    REQUIRE(is_within(latest, earliest, Milliseconds{15'000}));
}
