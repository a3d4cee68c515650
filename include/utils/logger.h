// logger.h - spdlog setup for the segdl tool and library
#pragma once

#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace segdl::logger {

// Convert textual level to spdlog level (case-insensitive). Unknown -> info.
spdlog::level::level_enum parse_level(const std::string& level_text);

// Log directory: SEGDL_LOG_DIR or ~/.segdl/logs.
std::string get_log_dir();

// Today's log file path (segdl.jsonl.YYYY-MM-DD).
std::string get_log_file_path();

// SEGDL_LOG_RETENTION_DAYS, 1..364 (default: 7).
int get_retention_days();

// Remove segdl.jsonl.* files dated before today - retention_days.
void cleanup_old_logs(const std::string& log_dir, int retention_days);

// Install the default logger. additional_sinks replaces the file sink,
// which is how tests capture output.
void init(const std::string& level = "info",
          const std::string& pattern = "[%Y-%m-%d %T.%e] [%l] %v",
          const std::string& file_path = "",
          std::vector<spdlog::sink_ptr> additional_sinks = {});

// stderr (human readable) + daily JSON-lines file, configured from
// SEGDL_LOG_LEVEL, SEGDL_LOG_DIR and SEGDL_LOG_RETENTION_DAYS.
// console_level caps what reaches stderr so progress output stays readable.
void init_from_env(const std::string& console_level = "warn");

}  // namespace segdl::logger
