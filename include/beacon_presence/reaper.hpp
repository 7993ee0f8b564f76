// === Reaper ==================================================================
//
// Periodic sweep that bounds registry growth. Retention is deliberately much
// coarser than the freshness and active windows: it decides what is kept in
// storage, not what is currently visible.

#pragma once

#include <cstddef>

#include "beacon_presence/registry.hpp"
#include "beacon_presence/types.hpp"

namespace beacon_presence {

/** @brief Counts of records removed by one sweep. */
struct ReapSummary final {
    std::size_t receivers_removed{};
    std::size_t detections_removed{};
    std::size_t beacons_removed{};

    [[nodiscard]] std::size_t total() const noexcept {
        return receivers_removed + detections_removed + beacons_removed;
    }
};

/** @brief Evicts receivers, detections and beacons older than retention. */
class Reaper final {
  public:
    explicit Reaper(Milliseconds retention);

    [[nodiscard]] Milliseconds retention() const noexcept;

    /**
     * @brief Remove everything in @p registry older than retention at @p now.
     *
     * Detections without a resolvable timestamp count as expired. Beacons
     * left without detections are removed.
     */
    ReapSummary sweep(Registry& registry, TimePoint now) const;

  private:
    Milliseconds retention_;
};

}  // namespace beacon_presence
