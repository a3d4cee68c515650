#pragma once

#include <atomic>

namespace segdl {

/// Signals shared by every worker of one download attempt.
/// Both flags only ever go from false to true; setting them is idempotent
/// and safe from any thread.
class DownloadSession {
public:
    DownloadSession() = default;
    DownloadSession(const DownloadSession&) = delete;
    DownloadSession& operator=(const DownloadSession&) = delete;

    /// Cooperative cancellation requested by the caller.
    void stop() { stop_.store(true); }
    /// Raised by a worker that hit a transfer or disk error.
    void fail() { error_.store(true); }

    bool stopRequested() const { return stop_.load(); }
    bool failed() const { return error_.load(); }
    bool interrupted() const { return stopRequested() || failed(); }

private:
    std::atomic<bool> stop_{false};
    std::atomic<bool> error_{false};
};

}  // namespace segdl
