#pragma once

#include "beacon_presence/logging.hpp"

#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/sinks/ostream_sink.h>

namespace beacon_presence::test {

/** @brief Shared tracker logger for tests; rotating files land in the temp directory. */
inline void ensure_logger_initialized() {
    static const std::shared_ptr<spdlog::logger> logger_handle = []() {
        const auto log_dir = std::filesystem::temp_directory_path() / "beacon_presence_tests_logs";
        return beacon_presence::initialize_logger(log_dir.string());
    }();
    (void)logger_handle;
}

/**
 * @brief Attaches a message-only sink to the tracker logger for its lifetime.
 *
 * Not safe while other threads log; tests attach it around synchronous calls.
 */
class CapturedLogLines final {
  public:
    CapturedLogLines()
        : sink_(std::make_shared<spdlog::sinks::ostream_sink_mt>(stream_lines_)) {
        ensure_logger_initialized();
        sink_->set_pattern("%v");
        beacon_presence::get_logger()->sinks().push_back(sink_);
    }

    ~CapturedLogLines() {
        auto& sinks = beacon_presence::get_logger()->sinks();
        for (auto it = sinks.begin(); it != sinks.end(); ++it) {
            if (*it == sink_) {
                sinks.erase(it);
                break;
            }
        }
    }

    CapturedLogLines(const CapturedLogLines&) = delete;
    CapturedLogLines& operator=(const CapturedLogLines&) = delete;

    /** @brief Lines written so far, without their terminators. */
    [[nodiscard]] std::vector<std::string> lines() {
        sink_->flush();
        std::vector<std::string> list_lines;
        std::istringstream stream_text{stream_lines_.str()};
        std::string line;
        while (std::getline(stream_text, line)) {
            list_lines.push_back(line);
        }
        return list_lines;
    }

  private:
    std::ostringstream stream_lines_;
    std::shared_ptr<spdlog::sinks::ostream_sink_mt> sink_;
};

}  // namespace beacon_presence::test
