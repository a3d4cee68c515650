#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <utility>

namespace segdl {

struct DownloadConfig {
    int segments{10};
    size_t chunk_size{1024 * 1024};
    std::chrono::milliseconds timeout{20000};
    int max_retries{0};
    std::chrono::milliseconds backoff{1000};
    std::chrono::milliseconds progress_interval{500};
};

// Defaults, then the JSON file at SEGDL_CONFIG (or ~/.segdl/config.json),
// then SEGDL_* environment overrides.
DownloadConfig loadDownloadConfig();

// Same, plus a one-line description of the sources that contributed.
std::pair<DownloadConfig, std::string> loadDownloadConfigWithLog();

}  // namespace segdl
