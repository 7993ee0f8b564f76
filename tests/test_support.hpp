// Shared builders for reports, stores and temporary paths used across tests.

#pragma once

#include <unistd.h>

#include <atomic>
#include <filesystem>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "beacon_presence/receiver_report.hpp"
#include "beacon_presence/registry_store.hpp"

namespace beacon_presence::test {

inline ObservedBeacon observed(std::string address, std::optional<std::string> name, SignalReading signal, bool online = true) {
    ObservedBeacon beacon{};
    beacon.address = std::move(address);
    beacon.name = std::move(name);
    beacon.signal = signal;
    beacon.online = online;
    return beacon;
}

inline ReceiverReport report_from(std::string receiver_id, std::vector<ObservedBeacon> beacons) {
    ReceiverReport report{};
    report.receiver_id = std::move(receiver_id);
    report.beacons = std::move(beacons);
    return report;
}

/** @brief Unique, initially absent path under the system temp directory. */
inline std::filesystem::path temp_path(const std::string& stem) {
    static std::atomic<int> counter{0};
    const auto directory = std::filesystem::temp_directory_path() / "beacon_presence_tests";
    std::filesystem::create_directories(directory);
    auto path = directory / (stem + "-" + std::to_string(::getpid()) + "-" + std::to_string(counter.fetch_add(1)) + ".json");
    std::filesystem::remove(path);
    return path;
}

/** @brief In-memory store that records saves and can be told to fail. */
class MemoryRegistryStore final : public RegistryStore {
  public:
    RegistrySnapshot load() override {
        std::scoped_lock lock(mutex_);
        return stored_;
    }

    void save(const RegistrySnapshot& snapshot) override {
        std::scoped_lock lock(mutex_);
        ++save_attempts_;
        if (fail_saves_) {
            throw std::runtime_error("disk full");
        }
        stored_ = snapshot;
        ++save_count_;
    }

    void set_fail_saves(bool fail_saves) {
        std::scoped_lock lock(mutex_);
        fail_saves_ = fail_saves;
    }

    void set_stored(RegistrySnapshot snapshot) {
        std::scoped_lock lock(mutex_);
        stored_ = std::move(snapshot);
    }

    [[nodiscard]] RegistrySnapshot stored() const {
        std::scoped_lock lock(mutex_);
        return stored_;
    }

    [[nodiscard]] int save_count() const {
        std::scoped_lock lock(mutex_);
        return save_count_;
    }

    [[nodiscard]] int save_attempts() const {
        std::scoped_lock lock(mutex_);
        return save_attempts_;
    }

  private:
    mutable std::mutex mutex_;
    RegistrySnapshot stored_{};
    bool fail_saves_{false};
    int save_count_{0};
    int save_attempts_{0};
};

}  // namespace beacon_presence::test
