#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <ios>
#include <map>
#include <mutex>
#include <string>

#include "download/download_session.h"
#include "download/transport.h"

namespace segdl {

constexpr size_t kDefaultChunkSize = 1024 * 1024;

/// Per-worker progress. Written by the owning worker only, read by the
/// coordinator while the worker runs.
struct DownloadState {
    size_t worker_id{0};
    std::atomic<uint64_t> bytes_transferred{0};
    std::atomic<bool> completed{false};
};

/// Common streaming loop of segment and single-stream workers.
class DownloadWorker {
public:
    DownloadWorker(size_t worker_id,
                   Transport& transport,
                   DownloadSession& session,
                   RequestOptions options,
                   size_t chunk_size = kDefaultChunkSize);
    virtual ~DownloadWorker() = default;

    DownloadWorker(const DownloadWorker&) = delete;
    DownloadWorker& operator=(const DownloadWorker&) = delete;

    virtual void run() = 0;

    size_t id() const { return state_.worker_id; }
    uint64_t bytesTransferred() const { return state_.bytes_transferred.load(); }
    bool completed() const { return state_.completed.load(); }
    const DownloadState& state() const { return state_; }
    std::string lastError() const;

protected:
    enum class StreamStatus {
        Finished,     // body read to its natural end
        Interrupted,  // stop or error flag observed
        Failed,       // transport, HTTP status or disk error; error flag raised
    };

    /// Streams url into path opened with mode, writing chunk_size pieces and
    /// polling the session flags after every piece.
    StreamStatus stream(const std::string& url,
                        const std::string& path,
                        std::ios::openmode mode,
                        const std::map<std::string, std::string>& extra_headers);

    /// Records message, logs it with the worker identity and raises the
    /// session error flag.
    void reportFailure(const std::string& message);

    virtual const char* name() const = 0;

    Transport& transport_;
    DownloadSession& session_;
    RequestOptions options_;
    size_t chunk_size_;
    DownloadState state_;

private:
    mutable std::mutex error_mutex_;
    std::string last_error_;
};

}  // namespace segdl
