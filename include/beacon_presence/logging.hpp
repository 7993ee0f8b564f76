#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

namespace beacon_presence {

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

std::shared_ptr<spdlog::logger> get_logger();

void set_log_level(const std::string& str_level);

/**
 * @brief Render @p text as a quoted, escaped JSON string.
 *
 * Structured log lines embed receiver ids, paths and exception messages
 * through this so the file sink stays one JSON object per line.
 */
[[nodiscard]] std::string json_quoted(std::string_view text);

}  // namespace beacon_presence
