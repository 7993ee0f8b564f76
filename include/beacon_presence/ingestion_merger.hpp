// === Ingestion Merger ========================================================
//
// Folds one receiver report into the registry: refreshes the receiver,
// creates or renames beacons, and replaces the (beacon, receiver) detection
// with the normalized observation. Invalid input is rejected or skipped here,
// so the registry only ever sees well-formed records.

#pragma once

#include <cstddef>
#include <memory>
#include <string_view>

#include <spdlog/logger.h>

#include "beacon_presence/receiver_report.hpp"
#include "beacon_presence/registry.hpp"

namespace beacon_presence {

/** @brief Outcome category of a single ingest. */
enum class IngestStatus {
    Merged,                    /**< Receiver refreshed and entries merged. */
    RejectedMissingReceiver    /**< Report lacked a receiver id; nothing changed. */
};

/** @brief Result of ingesting one report. */
struct IngestResult final {
    IngestStatus status{IngestStatus::Merged};
    std::size_t merged_count{};    /**< Beacon entries written to the registry. */
    std::size_t skipped_count{};   /**< Entries dropped for lacking an address. */
    bool persisted{};              /**< Registry document was written after the merge. */
};

[[nodiscard]] std::string_view to_string(IngestStatus status) noexcept;

/** @brief Applies receiver reports to a registry. */
class IngestionMerger final {
  public:
    IngestionMerger();

    /** @brief Merge @p report into @p registry as of @p now. */
    IngestResult merge(Registry& registry, const ReceiverReport& report, TimePoint now) const;

  private:
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace beacon_presence
