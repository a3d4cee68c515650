#pragma once

#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>

namespace segdl {
namespace cli {

/// Single-line console progress for one download.
class ProgressRenderer {
public:
    /// @param total_bytes Total bytes to download (0 if unknown)
    /// @param out Stream the line is drawn on
    explicit ProgressRenderer(uint64_t total_bytes = 0, std::ostream& out = std::cerr);

    void setTotal(uint64_t total_bytes) { total_bytes_ = total_bytes; }

    /// @param downloaded_bytes Bytes on disk so far
    /// @param speed_bps Current download speed in bytes/second
    void update(uint64_t downloaded_bytes, double speed_bps);

    void complete();
    void fail(const std::string& error_message);
    void setPhase(const std::string& phase);

    /// e.g. " 45% [=========>          ]"
    static std::string formatProgressBar(uint64_t downloaded_bytes, uint64_t total_bytes, int width = 20);

    /// e.g. "6.4 GB", "128.0 MB", "512 B"
    static std::string formatBytes(uint64_t bytes);

    /// e.g. "45.2 MB/s"
    static std::string formatSpeed(double bps);

    /// e.g. "2m 30s", "45s", "1h 5m"
    static std::string formatDuration(double seconds);

    /// HH:MM:SS
    static std::string formatClock(double seconds);

private:
    void clearAndPrint(const std::string& content);

    uint64_t total_bytes_;
    uint64_t downloaded_bytes_{0};
    std::ostream& out_;
    std::string phase_;
    std::chrono::steady_clock::time_point start_time_;
    size_t last_length_{0};
    bool completed_{false};
    bool failed_{false};
};

}  // namespace cli
}  // namespace segdl
