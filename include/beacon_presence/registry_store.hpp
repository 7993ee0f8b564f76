// === Registry Store ==========================================================
//
// Persistence contract for the registry: the whole registry is read and
// written as one JSON document. `JsonFileRegistryStore` keeps the document on
// disk and replaces it atomically (temporary file, then rename) so readers
// never observe a partially written file.

#pragma once

#include <filesystem>
#include <memory>

#include <json/json.h>
#include <spdlog/logger.h>

#include "beacon_presence/presence_records.hpp"

namespace beacon_presence {

/** @brief Durable storage for registry snapshots. */
class RegistryStore {
  public:
    virtual ~RegistryStore() = default;

    /** @brief Load the stored registry; an empty snapshot when nothing usable is stored. */
    [[nodiscard]] virtual RegistrySnapshot load() = 0;
    /** @brief Replace the stored registry. Throws std::runtime_error on failure. */
    virtual void save(const RegistrySnapshot& snapshot) = 0;
};

using RegistryStorePtr = std::shared_ptr<RegistryStore>;

/** @brief Encode a snapshot as the persisted {devices, beacons} document. */
[[nodiscard]] Json::Value to_document(const RegistrySnapshot& snapshot);

/**
 * @brief Decode a persisted document.
 *
 * Missing sections or fields fall back to defaults; legacy fields
 * (`receiver`, `last_update`) are honoured.
 */
[[nodiscard]] RegistrySnapshot from_document(const Json::Value& document);

/** @brief Registry store backed by a single JSON file. */
class JsonFileRegistryStore final : public RegistryStore {
  public:
    explicit JsonFileRegistryStore(std::filesystem::path path_document);

    [[nodiscard]] const std::filesystem::path& path() const noexcept;

    [[nodiscard]] RegistrySnapshot load() override;
    void save(const RegistrySnapshot& snapshot) override;

  private:
    std::filesystem::path path_document_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace beacon_presence
