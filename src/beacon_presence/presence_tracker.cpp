#include "beacon_presence/presence_tracker.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <utility>

#include "beacon_presence/logging.hpp"
#include "beacon_presence/text_decoding.hpp"

namespace beacon_presence {

PresenceTracker::PresenceTracker(TrackerConfig config, RegistryStorePtr store)
    : config_(config),
      store_(std::move(store)),
      reaper_(config_.thresholds.retention),
      logger_(get_logger()) {
    if (store_ == nullptr) {
        throw std::invalid_argument("PresenceTracker requires a registry store");
    }
    config_.persist_retries = std::max(0, config_.persist_retries);
    logger_->info("Initializing presence tracker: freshness={}ms active_window={}ms retention={}ms",
                  config_.thresholds.freshness.count(),
                  config_.thresholds.active_window.count(),
                  config_.thresholds.retention.count());
}

const TrackerConfig& PresenceTracker::config() const noexcept {
    return config_;
}

void PresenceTracker::load() {
    RegistrySnapshot snapshot = store_->load();
    std::scoped_lock writer_lock(mutex_writer_);
    std::unique_lock registry_lock(mutex_registry_);
    registry_ = Registry{std::move(snapshot)};
}

IngestResult PresenceTracker::ingest(const ReceiverReport& report, TimePoint now) {
    std::scoped_lock writer_lock(mutex_writer_);
    IngestResult result{};
    {
        std::unique_lock registry_lock(mutex_registry_);
        result = merger_.merge(registry_, report, now);
    }
    if (result.status != IngestStatus::Merged) {
        return result;
    }
    result.persisted = persist_locked("ingest");
    return result;
}

ReapSummary PresenceTracker::sweep(TimePoint now) {
    std::scoped_lock writer_lock(mutex_writer_);
    ReapSummary summary{};
    {
        std::unique_lock registry_lock(mutex_registry_);
        summary = reaper_.sweep(registry_, now);
    }
    if (summary.total() == 0) {
        logger_->debug("Reaper found nothing older than {}ms", reaper_.retention().count());
        return summary;
    }
    logger_->info(R"({{"component":"reaper","receivers":{},"detections":{},"beacons":{}}})",
                  summary.receivers_removed,
                  summary.detections_removed,
                  summary.beacons_removed);
    persist_locked("sweep");
    return summary;
}

bool PresenceTracker::reset() {
    std::scoped_lock writer_lock(mutex_writer_);
    {
        std::unique_lock registry_lock(mutex_registry_);
        registry_.clear();
    }
    logger_->warn(R"({{"component":"tracker","action":"reset"}})");
    return persist_locked("reset");
}

std::optional<BeaconMatch> PresenceTracker::find_beacon(std::string_view identity) const {
    return with_query_service([&](const QueryService& query_service) {
        return query_service.find_beacon(identity);
    });
}

std::optional<std::vector<RankedReceiver>> PresenceTracker::ranked_receivers_for(std::string_view identity, TimePoint now) const {
    return with_query_service([&](const QueryService& query_service) {
        return query_service.receivers_for(identity, now);
    });
}

StatusSummary PresenceTracker::status_summary(TimePoint now) const {
    return with_query_service([&](const QueryService& query_service) {
        return query_service.status_summary(now);
    });
}

PresenceStatistics PresenceTracker::statistics(TimePoint now) const {
    return with_query_service([&](const QueryService& query_service) {
        return query_service.statistics(now);
    });
}

std::vector<BeaconOverview> PresenceTracker::beacon_overview(TimePoint now) const {
    return with_query_service([&](const QueryService& query_service) {
        return query_service.beacon_overview(now);
    });
}

std::optional<BeaconDetail> PresenceTracker::beacon_detail(std::string_view name_fragment, TimePoint now) const {
    return with_query_service([&](const QueryService& query_service) {
        return query_service.beacon_detail(name_fragment, now);
    });
}

std::vector<LocatedBeacon> PresenceTracker::located_beacons(TimePoint now, std::string_view name_prefix) const {
    return with_query_service([&](const QueryService& query_service) {
        return query_service.located_beacons(now, name_prefix);
    });
}

RegistrySnapshot PresenceTracker::snapshot() const {
    return with_query_service([](const QueryService& query_service) {
        return query_service.snapshot();
    });
}

Json::Value PresenceTracker::list_all() const {
    return decode_text_fields(to_document(snapshot()));
}

bool PresenceTracker::persist_locked(const std::string& operation_name) {
    // Only writers modify the registry and they all hold mutex_writer_, so it
    // can be read here without the shared lock.
    const RegistrySnapshot snapshot = registry_.snapshot();
    try {
        retry_if_needed([this, &snapshot]() { store_->save(snapshot); }, operation_name);
        return true;
    } catch (const std::exception& exc) {
        logger_->error(R"({{"component":"tracker","operation":{},"result":"persist failed","error":{}}})",
                       json_quoted(operation_name),
                       json_quoted(exc.what()));
        return false;
    }
}

void PresenceTracker::retry_if_needed(const std::function<void()>& operation, const std::string& operation_name) {
    int attempt = 0;
    while (attempt <= config_.persist_retries) {
        try {
            operation();
            return;
        } catch (const std::exception& exc) {
            logger_->warn(
                R"({{"component":"tracker","operation":{},"attempt":{},"error":{}}})",
                json_quoted(operation_name),
                attempt,
                json_quoted(exc.what())
            );
            if (attempt == config_.persist_retries) {
                throw;
            }
        }
        ++attempt;
        std::this_thread::sleep_for(config_.retry_backoff * attempt);
    }
}

}  // namespace beacon_presence
