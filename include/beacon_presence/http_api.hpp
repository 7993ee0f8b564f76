// === HTTP API ================================================================
//
// Routes HTTP requests onto the presence tracker: JSON query endpoints for
// dashboards and chat front-ends, report ingestion for receivers, and the
// privileged reset. Handlers are synchronous and transport-agnostic; the
// socket side lives in HttpServer.

#pragma once

#include <string>
#include <string_view>

#include <boost/beast/http.hpp>
#include <json/json.h>
#include <spdlog/logger.h>

#include "beacon_presence/presence_tracker.hpp"
#include "beacon_presence/report_bus.hpp"
#include "beacon_presence/types.hpp"

namespace beacon_presence {

namespace http = boost::beast::http;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

/** @brief Listener and authorization settings. */
struct HttpConfig final {
    std::string address{"0.0.0.0"};
    unsigned short port{8086};
    int threads{2};
    std::string api_token{};    /**< Bearer token for reset; empty refuses every reset. */
};

/** @brief Maps requests to tracker operations and encodes JSON responses. */
class HttpApi final {
  public:
    HttpApi(PresenceTracker& tracker, ReportBus& report_bus, HttpConfig config);

    /** @brief Handle @p request using the current wall-clock time. */
    [[nodiscard]] HttpResponse handle(const HttpRequest& request);
    /** @brief Handle @p request as of @p now. */
    [[nodiscard]] HttpResponse handle(const HttpRequest& request, TimePoint now);

  private:
    HttpResponse handle_list_all(const HttpRequest& request, TimePoint now) const;
    HttpResponse handle_reset(const HttpRequest& request);
    HttpResponse handle_located_beacons(const HttpRequest& request, std::string_view name_prefix, TimePoint now) const;
    HttpResponse handle_receivers(const HttpRequest& request, const std::string& identity, TimePoint now) const;
    HttpResponse handle_detail(const HttpRequest& request, const std::string& name_fragment, TimePoint now) const;
    HttpResponse handle_status(const HttpRequest& request, TimePoint now) const;
    HttpResponse handle_statistics(const HttpRequest& request, TimePoint now) const;
    HttpResponse handle_overview(const HttpRequest& request, TimePoint now) const;
    HttpResponse handle_report(const HttpRequest& request, TimePoint now);
    [[nodiscard]] bool is_authorized(const HttpRequest& request) const;

    PresenceTracker& tracker_;
    ReportBus& report_bus_;
    HttpConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
};

/** @brief Decode %XX escapes (and '+' as space when @p form_encoded). */
[[nodiscard]] std::string url_decode(std::string_view text, bool form_encoded = false);

/** @brief Value of @p key in the query part of @p target, decoded; empty when absent. */
[[nodiscard]] std::string query_parameter(std::string_view target, std::string_view key);

}  // namespace beacon_presence
