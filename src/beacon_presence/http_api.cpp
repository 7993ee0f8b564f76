#include "beacon_presence/http_api.hpp"

#include <cctype>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "beacon_presence/logging.hpp"
#include "beacon_presence/staleness.hpp"
#include "beacon_presence/version.hpp"

namespace beacon_presence {

namespace {

constexpr std::string_view k_api_root{"/api/ble/"};
constexpr std::string_view k_beacon_segment{"beacon/"};
constexpr std::string_view k_receivers_suffix{"/receivers"};
constexpr std::string_view k_detail_suffix{"/detail"};
constexpr std::string_view k_numbered_beacon_prefix{"ESP-C3-"};
constexpr std::string_view k_bearer_prefix{"Bearer "};

std::string write_json(const Json::Value& value) {
    Json::StreamWriterBuilder writer_builder;
    writer_builder["indentation"] = "";
    writer_builder["emitUTF8"] = true;
    return Json::writeString(writer_builder, value);
}

Json::Value json_count(std::size_t count) {
    return Json::Value{static_cast<Json::UInt64>(count)};
}

Json::Value json_time(TimePoint time_point) {
    return Json::Value{static_cast<Json::Int64>(to_epoch_ms(time_point))};
}

HttpResponse make_json_response(const HttpRequest& request, http::status status, const Json::Value& body) {
    HttpResponse response{status, request.version()};
    response.set(http::field::server, "beacon_presence/" + std::string{k_version});
    response.set(http::field::content_type, "application/json; charset=utf-8");
    response.keep_alive(request.keep_alive());
    response.body() = write_json(body);
    response.prepare_payload();
    return response;
}

HttpResponse make_error_response(const HttpRequest& request, http::status status, std::string_view message) {
    Json::Value body{Json::objectValue};
    body["success"] = false;
    body["message"] = std::string{message};
    return make_json_response(request, status, body);
}

Json::Value encode_ranked_receiver(const RankedReceiver& ranked) {
    Json::Value entry{Json::objectValue};
    entry["receiverId"] = ranked.receiver_id;
    entry["receiver"] = ranked.receiver_name;
    entry["rssi"] = ranked.rssi_dbm;
    entry["online"] = ranked.online;
    entry["signal_level"] = std::string{to_string(classify_signal(ranked.rssi_dbm))};
    entry["last_update"] = ranked.observed_at_text;
    entry["lastUpdateTime"] = json_time(ranked.observed_at);
    return entry;
}

Json::Value encode_signal_summary(const std::optional<SignalSummary>& summary) {
    if (!summary.has_value()) {
        return Json::Value{Json::nullValue};
    }
    Json::Value entry{Json::objectValue};
    entry["samples"] = json_count(summary->sample_count);
    entry["average"] = summary->average_dbm;
    entry["strongest"] = summary->strongest_dbm;
    entry["weakest"] = summary->weakest_dbm;
    return entry;
}

Json::Value encode_status(const StatusSummary& status) {
    Json::Value entry{Json::objectValue};
    entry["receivers"]["total"] = json_count(status.receiver_total);
    entry["receivers"]["active"] = json_count(status.receiver_active);
    entry["beacons"]["total"] = json_count(status.beacon_total);
    entry["beacons"]["active"] = json_count(status.beacon_active);
    return entry;
}

std::string_view target_path(std::string_view target) {
    const std::size_t query_position = target.find('?');
    return query_position == std::string_view::npos ? target : target.substr(0, query_position);
}

bool ends_with(std::string_view text, std::string_view suffix) {
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

int hex_value(char digit) {
    if (digit >= '0' && digit <= '9') {
        return digit - '0';
    }
    const char lower = static_cast<char>(std::tolower(static_cast<unsigned char>(digit)));
    if (lower >= 'a' && lower <= 'f') {
        return lower - 'a' + 10;
    }
    return -1;
}

}  // namespace

std::string url_decode(std::string_view text, bool form_encoded) {
    std::string decoded;
    decoded.reserve(text.size());
    for (std::size_t index = 0; index < text.size(); ++index) {
        const char character = text[index];
        if (character == '%' && index + 2 < text.size()) {
            const int high = hex_value(text[index + 1]);
            const int low = hex_value(text[index + 2]);
            if (high >= 0 && low >= 0) {
                decoded.push_back(static_cast<char>((high << 4) | low));
                index += 2;
                continue;
            }
        }
        if (character == '+' && form_encoded) {
            decoded.push_back(' ');
            continue;
        }
        decoded.push_back(character);
    }
    return decoded;
}

std::string query_parameter(std::string_view target, std::string_view key) {
    const std::size_t query_position = target.find('?');
    if (query_position == std::string_view::npos) {
        return {};
    }
    std::string_view query = target.substr(query_position + 1);
    while (!query.empty()) {
        const std::size_t separator = query.find('&');
        const std::string_view pair = query.substr(0, separator);
        const std::size_t equals = pair.find('=');
        if (pair.substr(0, equals) == key) {
            return equals == std::string_view::npos ? std::string{} : url_decode(pair.substr(equals + 1), true);
        }
        if (separator == std::string_view::npos) {
            break;
        }
        query.remove_prefix(separator + 1);
    }
    return {};
}

HttpApi::HttpApi(PresenceTracker& tracker, ReportBus& report_bus, HttpConfig config)
    : tracker_(tracker),
      report_bus_(report_bus),
      config_(std::move(config)),
      logger_(get_logger()) {}

HttpResponse HttpApi::handle(const HttpRequest& request) {
    return handle(request, now_ms());
}

HttpResponse HttpApi::handle(const HttpRequest& request, TimePoint now) {
    const std::string_view target{request.target().data(), request.target().size()};
    const std::string_view path = target_path(target);
    if (path.substr(0, k_api_root.size()) != k_api_root) {
        return make_error_response(request, http::status::not_found, "unknown route");
    }
    const std::string_view route = path.substr(k_api_root.size());
    const http::verb method = request.method();

    try {
        if (route == "data") {
            if (method == http::verb::get) {
                return handle_list_all(request, now);
            }
            if (method == http::verb::delete_) {
                return handle_reset(request);
            }
            return make_error_response(request, http::status::method_not_allowed, "method not allowed");
        }
        if (route == "report") {
            if (method != http::verb::post) {
                return make_error_response(request, http::status::method_not_allowed, "method not allowed");
            }
            return handle_report(request, now);
        }

        if (method != http::verb::get) {
            return make_error_response(request, http::status::method_not_allowed, "method not allowed");
        }
        if (route == "status") {
            return handle_status(request, now);
        }
        if (route == "statistics") {
            return handle_statistics(request, now);
        }
        if (route == "overview") {
            return handle_overview(request, now);
        }
        if (route == "beacons") {
            return handle_located_beacons(request, query_parameter(target, "prefix"), now);
        }
        if (route == "esp-c3-beacons") {
            return handle_located_beacons(request, k_numbered_beacon_prefix, now);
        }
        if (route.substr(0, k_beacon_segment.size()) == k_beacon_segment) {
            const std::string_view beacon_route = route.substr(k_beacon_segment.size());
            if (ends_with(beacon_route, k_receivers_suffix) && beacon_route.size() > k_receivers_suffix.size()) {
                return handle_receivers(request, url_decode(beacon_route.substr(0, beacon_route.size() - k_receivers_suffix.size())), now);
            }
            if (ends_with(beacon_route, k_detail_suffix) && beacon_route.size() > k_detail_suffix.size()) {
                return handle_detail(request, url_decode(beacon_route.substr(0, beacon_route.size() - k_detail_suffix.size())), now);
            }
        }
        return make_error_response(request, http::status::not_found, "unknown route");
    } catch (const std::exception& exc) {
        logger_->error(R"({{"component":"http","target":{},"error":{}}})", json_quoted(target), json_quoted(exc.what()));
        return make_error_response(request, http::status::internal_server_error, "internal error");
    }
}

HttpResponse HttpApi::handle_list_all(const HttpRequest& request, TimePoint now) const {
    const Json::Value document = tracker_.list_all();
    Json::Value body{Json::objectValue};
    body["success"] = true;
    body["data"] = document;
    body["timestamp"] = json_time(now);
    if (document["devices"].empty() && document["beacons"].empty()) {
        body["message"] = "no data";
    }
    return make_json_response(request, http::status::ok, body);
}

HttpResponse HttpApi::handle_reset(const HttpRequest& request) {
    if (!is_authorized(request)) {
        logger_->warn(R"({{"component":"http","action":"reset","result":"unauthorized"}})");
        return make_error_response(request, http::status::forbidden, "unauthorized");
    }
    if (!tracker_.reset()) {
        return make_error_response(request, http::status::internal_server_error, "registry cleared but could not be persisted");
    }
    Json::Value body{Json::objectValue};
    body["success"] = true;
    body["message"] = "beacon data reset";
    return make_json_response(request, http::status::ok, body);
}

HttpResponse HttpApi::handle_located_beacons(const HttpRequest& request, std::string_view name_prefix, TimePoint now) const {
    Json::Value data{Json::arrayValue};
    for (const LocatedBeacon& located : tracker_.located_beacons(now, name_prefix)) {
        Json::Value entry{Json::objectValue};
        entry["mac"] = located.address;
        entry["name"] = located.name;
        entry["displayName"] = located.display_name;
        entry["first_seen"] = json_time(located.first_seen);
        entry["receivers"] = Json::Value{Json::arrayValue};
        for (const RankedReceiver& ranked : located.receivers) {
            entry["receivers"].append(encode_ranked_receiver(ranked));
        }
        data.append(entry);
    }
    Json::Value body{Json::objectValue};
    body["success"] = true;
    body["data"] = data;
    body["timestamp"] = json_time(now);
    return make_json_response(request, http::status::ok, body);
}

HttpResponse HttpApi::handle_receivers(const HttpRequest& request, const std::string& identity, TimePoint now) const {
    const std::optional<BeaconMatch> match = tracker_.find_beacon(identity);
    if (!match.has_value()) {
        return make_error_response(request, http::status::not_found, "beacon not found");
    }
    const std::vector<RankedReceiver> list_ranked = ranked_receivers(match->beacon, now, tracker_.config().thresholds.freshness);

    Json::Value data{Json::objectValue};
    data["beaconId"] = match->beacon.name;
    data["beaconMac"] = match->address;
    data["displayName"] = beacon_display_name(match->beacon.name);
    data["receivers"] = Json::Value{Json::arrayValue};
    for (const RankedReceiver& ranked : list_ranked) {
        data["receivers"].append(encode_ranked_receiver(ranked));
    }
    data["timestamp"] = json_time(now);

    Json::Value body{Json::objectValue};
    body["success"] = true;
    body["data"] = data;
    return make_json_response(request, http::status::ok, body);
}

HttpResponse HttpApi::handle_detail(const HttpRequest& request, const std::string& name_fragment, TimePoint now) const {
    const std::optional<BeaconDetail> detail = tracker_.beacon_detail(name_fragment, now);
    if (!detail.has_value()) {
        return make_error_response(request, http::status::not_found, "beacon not found");
    }

    Json::Value data{Json::objectValue};
    data["mac"] = detail->address;
    data["name"] = detail->name;
    data["first_seen"] = json_time(detail->first_seen);
    data["first_seen_text"] = format_local_time(detail->first_seen);
    data["detections"] = Json::Value{Json::arrayValue};
    for (const DetectionEntry& detection : detail->detections) {
        Json::Value entry{Json::objectValue};
        entry["receiverId"] = detection.receiver_id;
        entry["receiver"] = detection.receiver_name;
        entry["rssi"] = detection.rssi_dbm;
        entry["online"] = detection.online;
        entry["recent"] = detection.recent;
        if (detection.observed_at.has_value()) {
            entry["lastUpdateTime"] = json_time(*detection.observed_at);
            entry["last_update"] = format_local_time(*detection.observed_at);
        }
        data["detections"].append(entry);
    }
    data["recent_signal"] = encode_signal_summary(detail->recent_signal);

    Json::Value body{Json::objectValue};
    body["success"] = true;
    body["data"] = data;
    body["timestamp"] = json_time(now);
    return make_json_response(request, http::status::ok, body);
}

HttpResponse HttpApi::handle_status(const HttpRequest& request, TimePoint now) const {
    Json::Value status = encode_status(tracker_.status_summary(now));
    status["active_window"] = static_cast<Json::Int64>(tracker_.config().thresholds.active_window.count());
    status["freshness"] = static_cast<Json::Int64>(tracker_.config().thresholds.freshness.count());
    status["version"] = std::string{k_version};
    status["timestamp"] = json_time(now);

    Json::Value body{Json::objectValue};
    body["success"] = true;
    body["status"] = status;
    return make_json_response(request, http::status::ok, body);
}

HttpResponse HttpApi::handle_statistics(const HttpRequest& request, TimePoint now) const {
    const PresenceStatistics statistics = tracker_.statistics(now);
    Json::Value data = encode_status(statistics.status);
    data["beacons"]["multi_receiver"] = json_count(statistics.multi_receiver_beacons);
    data["beacons"]["single_receiver"] = json_count(statistics.single_receiver_beacons);
    data["signal"] = encode_signal_summary(statistics.signal);
    data["timestamp"] = json_time(now);

    Json::Value body{Json::objectValue};
    body["success"] = true;
    body["statistics"] = data;
    return make_json_response(request, http::status::ok, body);
}

HttpResponse HttpApi::handle_overview(const HttpRequest& request, TimePoint now) const {
    Json::Value data{Json::arrayValue};
    for (const BeaconOverview& row : tracker_.beacon_overview(now)) {
        Json::Value entry{Json::objectValue};
        entry["mac"] = row.address;
        entry["name"] = row.name;
        entry["active"] = row.active;
        entry["active_receivers"] = json_count(row.active_receivers);
        entry["strongest_rssi"] = row.strongest_rssi_dbm;
        if (row.newest_update.has_value()) {
            entry["newest_update"] = json_time(*row.newest_update);
        }
        data.append(entry);
    }
    Json::Value body{Json::objectValue};
    body["success"] = true;
    body["data"] = data;
    body["timestamp"] = json_time(now);
    return make_json_response(request, http::status::ok, body);
}

HttpResponse HttpApi::handle_report(const HttpRequest& request, TimePoint now) {
    const std::string& str_body = request.body();
    Json::CharReaderBuilder reader_builder;
    const std::unique_ptr<Json::CharReader> reader{reader_builder.newCharReader()};
    Json::Value document;
    std::string str_errors;
    bool parsed = false;
    try {
        parsed = reader->parse(str_body.data(), str_body.data() + str_body.size(), &document, &str_errors);
    } catch (const Json::Exception& exc) {
        str_errors = exc.what();
    }
    if (!parsed || !document.isObject()) {
        logger_->warn(R"({{"component":"http","action":"report","result":"invalid json"}})");
        logger_->debug("Report parse errors: {}", str_errors);
        return make_error_response(request, http::status::bad_request, "report body must be a JSON object");
    }

    ReceiverReport report = parse_receiver_report(document);
    if (report.receiver_id.empty()) {
        logger_->warn(R"({{"component":"http","action":"report","result":"missing device_id"}})");
        return make_error_response(request, http::status::bad_request, "device_id is required");
    }

    const std::size_t entry_count = report.beacons.size();
    report_bus_.publish(ReportEvent{std::move(report), now});

    Json::Value body{Json::objectValue};
    body["success"] = true;
    body["accepted"] = json_count(entry_count);
    return make_json_response(request, http::status::accepted, body);
}

bool HttpApi::is_authorized(const HttpRequest& request) const {
    if (config_.api_token.empty()) {
        return false;
    }
    const auto header = request[http::field::authorization];
    const std::string_view authorization{header.data(), header.size()};
    return authorization.substr(0, k_bearer_prefix.size()) == k_bearer_prefix
        && authorization.substr(k_bearer_prefix.size()) == config_.api_token;
}

}  // namespace beacon_presence
