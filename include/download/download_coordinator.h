#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "download/download_error.h"
#include "download/download_session.h"
#include "download/download_worker.h"
#include "download/transport.h"

namespace segdl {

using ProgressCallback = std::function<void(uint64_t downloaded, uint64_t total)>;

struct DownloadRequest {
    std::string url;
    // File path, existing directory (name derived from the response) or empty
    // for the current directory.
    std::string destination;
    int segments{10};
    // false forces a single-stream download even when ranges are offered.
    bool multisegment{true};
    // Re-download even when the destination already has the expected size.
    bool overwrite{false};
    int max_retries{0};
    std::chrono::milliseconds backoff{1000};
    size_t chunk_size{kDefaultChunkSize};
    std::chrono::milliseconds progress_interval{500};
    RequestOptions options;
};

/// Runs one download: probe, plan, one thread per segment (or a single
/// stream), merge. Workers report failure through the session flags only;
/// the coordinator inspects the flags and each worker's completion after
/// joining them all.
class DownloadCoordinator {
public:
    explicit DownloadCoordinator(Transport& transport);

    DownloadCoordinator(const DownloadCoordinator&) = delete;
    DownloadCoordinator& operator=(const DownloadCoordinator&) = delete;

    /// Blocks until the download completes, fails or is cancelled. Failed and
    /// cancelled attempts leave segment files and manifest for a later resume.
    Outcome execute(const DownloadRequest& request, ProgressCallback on_progress = nullptr);

    /// Requests cooperative cancellation of the running download. Idempotent,
    /// callable from any thread (including a signal-watching one).
    /// execute() clears the request when it starts, so a cancel() issued
    /// before that has no effect; callers racing with execute() must repeat it.
    void cancel();
    bool cancelRequested() const { return cancel_requested_.load(); }

    /// Sum of the current workers' byte counters.
    uint64_t downloadedBytes() const;
    /// Resolved destination of the last execute() call.
    std::string destination() const;
    bool lastRunSegmented() const { return segmented_.load(); }
    std::string lastError() const;

private:
    Outcome attempt(const DownloadRequest& request, const ProgressCallback& on_progress);
    Outcome runSegmented(const DownloadRequest& request,
                         const std::string& destination,
                         uint64_t size,
                         const std::optional<std::string>& etag,
                         const ProgressCallback& on_progress);
    Outcome runSingleStream(const DownloadRequest& request,
                            const std::string& destination,
                            uint64_t total,
                            const ProgressCallback& on_progress);
    void runWorkers(DownloadSession& session,
                    uint64_t total,
                    std::chrono::milliseconds interval,
                    const ProgressCallback& on_progress);
    std::shared_ptr<DownloadSession> beginSession();
    std::string resolveDestination(const DownloadRequest& request, const std::string& content_disposition) const;
    std::string firstWorkerError() const;
    void setError(std::string message);

    Transport& transport_;
    std::atomic<bool> cancel_requested_{false};
    std::atomic<bool> segmented_{false};

    mutable std::mutex session_mutex_;
    std::shared_ptr<DownloadSession> session_;

    mutable std::mutex workers_mutex_;
    std::vector<std::unique_ptr<DownloadWorker>> workers_;

    mutable std::mutex state_mutex_;
    std::string destination_;
    std::string last_error_;
};

}  // namespace segdl
