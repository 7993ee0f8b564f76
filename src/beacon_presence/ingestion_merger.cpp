#include "beacon_presence/ingestion_merger.hpp"

#include <string>
#include <utility>

#include <fmt/format.h>

#include "beacon_presence/logging.hpp"

namespace beacon_presence {

namespace {
constexpr char k_default_receiver_type[] = "ESP32";
}  // namespace

std::string_view to_string(IngestStatus status) noexcept {
    switch (status) {
        case IngestStatus::Merged:
            return "merged";
        case IngestStatus::RejectedMissingReceiver:
            return "rejected_missing_receiver";
    }
    return "unknown";
}

IngestionMerger::IngestionMerger()
    : logger_(get_logger()) {}

IngestResult IngestionMerger::merge(Registry& registry, const ReceiverReport& report, TimePoint now) const {
    IngestResult result{};
    if (report.receiver_id.empty()) {
        logger_->warn(R"({{"component":"ingest","action":"reject","reason":"missing receiver id","entries":{}}})",
                      report.beacons.size());
        result.status = IngestStatus::RejectedMissingReceiver;
        return result;
    }

    ReceiverAttributes attributes{};
    attributes.name = report.receiver_name.value_or(report.receiver_id);
    attributes.type = report.receiver_type.value_or(k_default_receiver_type);
    attributes.batch = report.batch;
    attributes.total_batches = report.total_batches;
    registry.upsert_receiver(report.receiver_id, attributes, now);

    for (const ObservedBeacon& observed : report.beacons) {
        if (observed.address.empty()) {
            ++result.skipped_count;
            continue;
        }
        registry.upsert_beacon(observed.address, observed.name, now);

        Detection detection{};
        detection.receiver_name = attributes.name;
        detection.rssi_dbm = normalize_signal_strength(observed.signal);
        detection.online = observed.online;
        registry.upsert_detection(observed.address, report.receiver_id, std::move(detection), now);
        ++result.merged_count;
    }

    if (result.skipped_count > 0) {
        logger_->warn(R"({{"component":"ingest","receiver":{},"action":"skip","reason":"missing address","count":{}}})",
                      json_quoted(report.receiver_id),
                      result.skipped_count);
    }

    const std::string batch_info = report.total_batches > 1
        ? fmt::format(" (batch {}/{})", report.batch, report.total_batches)
        : std::string{};
    logger_->info("{} reported {} beacons{}", attributes.name, result.merged_count, batch_info);
    return result;
}

}  // namespace beacon_presence
