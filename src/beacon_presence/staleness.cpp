#include "beacon_presence/staleness.hpp"

#include <charconv>
#include <cstdint>
#include <ctime>

#include <fmt/format.h>

namespace beacon_presence {

namespace {

constexpr int k_min_year{1970};
constexpr int k_max_year{9999};

/**
 * @brief Consume an unsigned decimal field followed by @p separator.
 *
 * A separator of '\0' means the field must end the input. Signs are rejected.
 */
bool consume_field(std::string_view& text, char separator, int& out_value) {
    if (text.empty() || text.front() < '0' || text.front() > '9') {
        return false;
    }
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    const auto [ptr, error_code] = std::from_chars(begin, end, out_value);
    if (error_code != std::errc{} || ptr == begin) {
        return false;
    }
    text.remove_prefix(static_cast<std::size_t>(ptr - begin));
    if (separator == '\0') {
        return text.empty();
    }
    if (text.empty() || text.front() != separator) {
        return false;
    }
    text.remove_prefix(1);
    return true;
}

}  // namespace

std::optional<TimePoint> parse_local_timestamp(std::string_view text) {
    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    if (!consume_field(text, '/', year) || !consume_field(text, '/', month) || !consume_field(text, ' ', day)
        || !consume_field(text, ':', hour) || !consume_field(text, ':', minute) || !consume_field(text, '\0', second)) {
        return std::nullopt;
    }
    if (year < k_min_year || year > k_max_year || month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59
        || second > 60) {
        return std::nullopt;
    }

    std::tm local_tm{};
    local_tm.tm_year = year - 1900;
    local_tm.tm_mon = month - 1;
    local_tm.tm_mday = day;
    local_tm.tm_hour = hour;
    local_tm.tm_min = minute;
    local_tm.tm_sec = second;
    local_tm.tm_isdst = -1;
    const std::time_t epoch_seconds = std::mktime(&local_tm);
    if (epoch_seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    const std::int64_t epoch_ms = static_cast<std::int64_t>(epoch_seconds) * 1'000;
    if (!is_valid_epoch_ms(epoch_ms)) {
        return std::nullopt;
    }
    return from_epoch_ms(epoch_ms);
}

std::string format_local_time(TimePoint time_point) {
    const std::time_t epoch_seconds = static_cast<std::time_t>(to_epoch_ms(time_point) / 1'000);
    std::tm local_tm{};
    if (localtime_r(&epoch_seconds, &local_tm) == nullptr) {
        return std::to_string(to_epoch_ms(time_point));
    }
    return fmt::format("{}/{}/{} {:02}:{:02}:{:02}",
                       local_tm.tm_year + 1900,
                       local_tm.tm_mon + 1,
                       local_tm.tm_mday,
                       local_tm.tm_hour,
                       local_tm.tm_min,
                       local_tm.tm_sec);
}

std::optional<TimePoint> resolve_timestamp(const Detection& detection) {
    if (detection.update_time.has_value() && to_epoch_ms(*detection.update_time) != 0) {
        return detection.update_time;
    }
    if (detection.last_update.empty()) {
        return std::nullopt;
    }
    return parse_local_timestamp(detection.last_update);
}

bool is_detection_fresh(const Detection& detection, TimePoint now, Milliseconds threshold) {
    const std::optional<TimePoint> observed = resolve_timestamp(detection);
    return observed.has_value() && is_within(*observed, now, threshold);
}

bool is_detection_active(const Detection& detection, TimePoint now, Milliseconds active_window) {
    return detection.online && is_detection_fresh(detection, now, active_window);
}

bool is_receiver_active(const ReceiverRecord& receiver, TimePoint now, Milliseconds active_window) {
    return is_within(receiver.last_report, now, active_window);
}

}  // namespace beacon_presence
