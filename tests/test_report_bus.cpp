#include <string>
#include <thread>
#include <vector>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "test_support.hpp"
#include "beacon_presence/report_bus.hpp"

using namespace beacon_presence;
using beacon_presence::test::report_from;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    beacon_presence::test::ensure_logger_initialized();
    return true;
}();
}  // namespace

TEST_CASE("ReportBus delivers reports in publish order") {
    ReportBus bus{};
    REQUIRE_FALSE(bus.try_consume().has_value());

    bus.publish(ReportEvent{report_from("R1", {}), from_epoch_ms(1'000)});
    bus.publish(ReportEvent{report_from("R2", {}), from_epoch_ms(2'000)});
    REQUIRE(bus.pending() == 2);

    const auto first = bus.try_consume();
    REQUIRE(first.has_value());
    REQUIRE(first->report.receiver_id == "R1");
    REQUIRE(first->received_at == from_epoch_ms(1'000));
    REQUIRE(bus.try_consume()->report.receiver_id == "R2");
    REQUIRE(bus.pending() == 0);
}

TEST_CASE("ReportBus accepts publishers on several threads") {
    ReportBus bus{};
    constexpr int k_threads = 4;
    constexpr int k_reports_per_thread = 250;

    std::vector<std::thread> list_threads;
    for (int thread_index = 0; thread_index < k_threads; ++thread_index) {
        list_threads.emplace_back([&bus, thread_index]() {
            for (int index = 0; index < k_reports_per_thread; ++index) {
                bus.publish(ReportEvent{report_from("R" + std::to_string(thread_index), {}), from_epoch_ms(index)});
            }
        });
    }
    for (auto& thread : list_threads) {
        thread.join();
    }

    REQUIRE(bus.pending() == static_cast<std::size_t>(k_threads * k_reports_per_thread));
    std::size_t consumed = 0;
    while (bus.try_consume().has_value()) {
        ++consumed;
    }
    REQUIRE(consumed == static_cast<std::size_t>(k_threads * k_reports_per_thread));
}
