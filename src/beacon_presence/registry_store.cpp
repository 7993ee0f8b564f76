#include "beacon_presence/registry_store.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include "beacon_presence/logging.hpp"
#include "beacon_presence/receiver_report.hpp"
#include "beacon_presence/text_decoding.hpp"

namespace beacon_presence {

namespace {

constexpr char k_devices_key[] = "devices";
constexpr char k_beacons_key[] = "beacons";

std::string string_or(const Json::Value& object, const char* key, const std::string& fallback) {
    const Json::Value& value = object[key];
    return value.isString() ? value.asString() : fallback;
}

/** @brief Epoch milliseconds under @p key; absent when missing or outside is_valid_epoch_ms. */
std::optional<std::int64_t> optional_epoch_ms(const Json::Value& object, const char* key) {
    const Json::Value& value = object[key];
    if (!value.isNumeric()) {
        return std::nullopt;
    }
    if (value.isInt64()) {
        const std::int64_t epoch_ms = value.asInt64();
        return is_valid_epoch_ms(epoch_ms) ? std::optional<std::int64_t>{epoch_ms} : std::nullopt;
    }
    const double raw_value = value.asDouble();
    if (!std::isfinite(raw_value) || raw_value < 0.0 || raw_value > static_cast<double>(k_max_epoch_ms)) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(raw_value);
}

int batch_or(const Json::Value& object, const char* key) {
    const Json::Value& value = object[key];
    if (!value.isNumeric()) {
        return 1;
    }
    const double raw_value = value.asDouble();
    if (!(raw_value >= 1.0) || raw_value > 1'000'000.0) {
        return 1;
    }
    return static_cast<int>(raw_value);
}

int rssi_or_unknown(const Json::Value& object, const char* key) {
    const Json::Value& value = object[key];
    return value.isNumeric() ? round_signal_dbm(value.asDouble()) : k_unknown_rssi_dbm;
}

ReceiverRecord decode_receiver(const std::string& receiver_id, const Json::Value& entry) {
    ReceiverRecord receiver{};
    receiver.name = string_or(entry, "name", receiver_id);
    receiver.type = string_or(entry, "type", "");
    receiver.last_report = from_epoch_ms(optional_epoch_ms(entry, "update").value_or(0));
    receiver.batch = batch_or(entry, "batch");
    receiver.total_batches = batch_or(entry, "total_batches");
    return receiver;
}

Detection decode_detection(const Json::Value& entry) {
    Detection detection{};
    detection.receiver_name = string_or(entry, "receiver_name", string_or(entry, "receiver", ""));
    detection.rssi_dbm = rssi_or_unknown(entry, "rssi");
    detection.online = entry["online"].isBool() && entry["online"].asBool();
    if (const std::optional<std::int64_t> update_ms = optional_epoch_ms(entry, "update_time"); update_ms.has_value()) {
        detection.update_time = from_epoch_ms(*update_ms);
    }
    detection.last_update = string_or(entry, "last_update", "");
    return detection;
}

BeaconRecord decode_beacon(const Json::Value& entry) {
    BeaconRecord beacon{};
    beacon.name = string_or(entry, "name", "");
    beacon.first_seen = from_epoch_ms(optional_epoch_ms(entry, "first_seen").value_or(0));
    const Json::Value& detections = entry["detections"];
    if (detections.isObject()) {
        for (const std::string& receiver_id : detections.getMemberNames()) {
            if (detections[receiver_id].isObject()) {
                beacon.detections.emplace(receiver_id, decode_detection(detections[receiver_id]));
            }
        }
    }
    return beacon;
}

}  // namespace

Json::Value to_document(const RegistrySnapshot& snapshot) {
    Json::Value document{Json::objectValue};
    Json::Value& devices = document[k_devices_key] = Json::Value{Json::objectValue};
    for (const auto& [receiver_id, receiver] : snapshot.receivers) {
        Json::Value& entry = devices[receiver_id];
        entry["name"] = receiver.name;
        entry["type"] = receiver.type;
        entry["update"] = Json::Int64{to_epoch_ms(receiver.last_report)};
        entry["batch"] = receiver.batch;
        entry["total_batches"] = receiver.total_batches;
    }

    Json::Value& beacons = document[k_beacons_key] = Json::Value{Json::objectValue};
    for (const auto& [address, beacon] : snapshot.beacons) {
        Json::Value& entry = beacons[address];
        entry["name"] = beacon.name;
        entry["first_seen"] = Json::Int64{to_epoch_ms(beacon.first_seen)};
        Json::Value& detections = entry["detections"] = Json::Value{Json::objectValue};
        for (const auto& [receiver_id, detection] : beacon.detections) {
            Json::Value& detection_entry = detections[receiver_id];
            detection_entry["receiver_name"] = detection.receiver_name;
            detection_entry["rssi"] = detection.rssi_dbm;
            detection_entry["online"] = detection.online;
            if (detection.update_time.has_value()) {
                detection_entry["update_time"] = Json::Int64{to_epoch_ms(*detection.update_time)};
                detection_entry["last_seen"] = Json::Int64{to_epoch_ms(*detection.update_time)};
            }
            if (!detection.last_update.empty()) {
                detection_entry["last_update"] = detection.last_update;
            }
        }
    }
    return document;
}

RegistrySnapshot from_document(const Json::Value& document) {
    RegistrySnapshot snapshot{};
    if (!document.isObject()) {
        return snapshot;
    }
    const Json::Value& devices = document[k_devices_key];
    if (devices.isObject()) {
        for (const std::string& receiver_id : devices.getMemberNames()) {
            if (devices[receiver_id].isObject()) {
                snapshot.receivers.emplace(receiver_id, decode_receiver(receiver_id, devices[receiver_id]));
            }
        }
    }
    const Json::Value& beacons = document[k_beacons_key];
    if (beacons.isObject()) {
        for (const std::string& address : beacons.getMemberNames()) {
            if (beacons[address].isObject()) {
                snapshot.beacons.emplace(address, decode_beacon(beacons[address]));
            }
        }
    }
    return snapshot;
}

JsonFileRegistryStore::JsonFileRegistryStore(std::filesystem::path path_document)
    : path_document_(std::move(path_document)),
      logger_(get_logger()) {}

const std::filesystem::path& JsonFileRegistryStore::path() const noexcept {
    return path_document_;
}

RegistrySnapshot JsonFileRegistryStore::load() {
    std::ifstream stream_document(path_document_);
    if (!stream_document.is_open()) {
        logger_->warn(R"({{"component":"store","action":"load","path":{},"result":"missing; starting empty"}})",
                      json_quoted(path_document_.string()));
        return RegistrySnapshot{};
    }

    Json::CharReaderBuilder reader_builder;
    Json::Value document;
    std::string str_errors;
    bool parsed = false;
    try {
        parsed = Json::parseFromStream(reader_builder, stream_document, &document, &str_errors);
    } catch (const Json::Exception& exc) {
        // The reader throws instead of failing once nesting exceeds its stack limit.
        str_errors = exc.what();
    }
    if (!parsed || !document.isObject()) {
        logger_->warn(R"({{"component":"store","action":"load","path":{},"result":"unparsable; starting empty"}})",
                      json_quoted(path_document_.string()));
        logger_->debug("Parse errors for {}: {}", path_document_.string(), str_errors);
        return RegistrySnapshot{};
    }

    RegistrySnapshot snapshot = from_document(decode_text_fields(document));
    logger_->info("Loaded registry from {}: {} receivers, {} beacons",
                  path_document_.string(),
                  snapshot.receivers.size(),
                  snapshot.beacons.size());
    return snapshot;
}

void JsonFileRegistryStore::save(const RegistrySnapshot& snapshot) {
    Json::StreamWriterBuilder writer_builder;
    writer_builder["indentation"] = "  ";
    writer_builder["emitUTF8"] = true;
    const std::string str_document = Json::writeString(writer_builder, to_document(snapshot));

    std::error_code error_code;
    if (path_document_.has_parent_path()) {
        std::filesystem::create_directories(path_document_.parent_path(), error_code);
        if (error_code) {
            throw std::runtime_error("Unable to create data directory " + path_document_.parent_path().string()
                                     + ": " + error_code.message());
        }
    }

    const auto unique_suffix = std::chrono::steady_clock::now().time_since_epoch().count();
    std::filesystem::path path_temp = path_document_;
    path_temp += "." + std::to_string(unique_suffix) + ".tmp";

    {
        std::ofstream stream_temp(path_temp, std::ios::trunc);
        if (!stream_temp.is_open()) {
            throw std::runtime_error("Unable to open temporary file " + path_temp.string());
        }
        stream_temp << str_document;
        stream_temp.flush();
        if (stream_temp.fail()) {
            stream_temp.close();
            std::filesystem::remove(path_temp, error_code);
            throw std::runtime_error("Write failed for " + path_temp.string());
        }
    }

    std::filesystem::rename(path_temp, path_document_, error_code);
    if (error_code) {
        const std::string str_message = error_code.message();
        std::filesystem::remove(path_temp, error_code);
        throw std::runtime_error("Unable to replace " + path_document_.string() + ": " + str_message);
    }
}

}  // namespace beacon_presence
