#include "download/download_coordinator.h"

#include <condition_variable>
#include <exception>
#include <filesystem>
#include <spdlog/spdlog.h>
#include <thread>

#include "download/merger.h"
#include "download/segment_planner.h"
#include "download/segment_table.h"
#include "download/segment_worker.h"
#include "download/single_stream_worker.h"
#include "utils/filename.h"

namespace fs = std::filesystem;

namespace segdl {

DownloadCoordinator::DownloadCoordinator(Transport& transport) : transport_(transport) {}

void DownloadCoordinator::cancel() {
    cancel_requested_.store(true);
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (session_) session_->stop();
}

uint64_t DownloadCoordinator::downloadedBytes() const {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    uint64_t sum = 0;
    for (const auto& worker : workers_) {
        sum += worker->bytesTransferred();
    }
    return sum;
}

std::string DownloadCoordinator::destination() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return destination_;
}

std::string DownloadCoordinator::lastError() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_error_;
}

void DownloadCoordinator::setError(std::string message) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    last_error_ = std::move(message);
}

std::shared_ptr<DownloadSession> DownloadCoordinator::beginSession() {
    auto session = std::make_shared<DownloadSession>();
    std::lock_guard<std::mutex> lock(session_mutex_);
    session_ = session;
    // a cancel() that raced ahead of this attempt still applies
    if (cancel_requested_.load()) session->stop();
    return session;
}

std::string DownloadCoordinator::firstWorkerError() const {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (const auto& worker : workers_) {
        auto message = worker->lastError();
        if (!message.empty()) return message;
    }
    return "download failed";
}

std::string DownloadCoordinator::resolveDestination(const DownloadRequest& request,
                                                    const std::string& content_disposition) const {
    const auto name = filenameFromHeaders(request.url, content_disposition);
    if (request.destination.empty()) {
        return name;
    }
    std::error_code ec;
    const bool trailing_separator = request.destination.back() == '/' || request.destination.back() == '\\';
    if (trailing_separator || fs::is_directory(request.destination, ec)) {
        return (fs::path(request.destination) / name).string();
    }
    return request.destination;
}

Outcome DownloadCoordinator::execute(const DownloadRequest& request, ProgressCallback on_progress) {
    cancel_requested_.store(false);
    setError({});

    Outcome outcome = Outcome::Failed;
    for (int attempt_no = 0;; ++attempt_no) {
        try {
            outcome = attempt(request, on_progress);
        } catch (const InvalidPlanError& e) {
            spdlog::error("DownloadCoordinator: invalid plan for url='{}': {}", request.url, e.what());
            setError(e.what());
            return Outcome::Failed;
        } catch (const DownloadError& e) {
            spdlog::error("DownloadCoordinator: {}", e.what());
            setError(e.what());
            outcome = Outcome::Failed;
        } catch (const std::exception& e) {
            // transports and the filesystem may throw outside the DownloadError family
            spdlog::error("DownloadCoordinator: attempt for url='{}' aborted: {}", request.url, e.what());
            setError(std::string("attempt aborted: ") + e.what());
            outcome = Outcome::Failed;
        }

        if (outcome != Outcome::Failed || attempt_no >= request.max_retries) break;
        if (cancel_requested_.load()) break;

        spdlog::warn("DownloadCoordinator: attempt {} of {} failed ({}), retrying in {} ms",
                     attempt_no + 1, request.max_retries + 1, lastError(), request.backoff.count());
        const auto deadline = std::chrono::steady_clock::now() + request.backoff;
        while (std::chrono::steady_clock::now() < deadline) {
            if (cancel_requested_.load()) return Outcome::Cancelled;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }
    return outcome;
}

Outcome DownloadCoordinator::attempt(const DownloadRequest& request, const ProgressCallback& on_progress) {
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers_.clear();
    }

    const auto probe = transport_.probe(request.url, request.options);
    if (!probe.ok) {
        setError("probe failed for " + request.url + ": " +
                 (probe.error.empty() ? "HTTP status " + std::to_string(probe.status) : probe.error));
        spdlog::error("DownloadCoordinator: {}", lastError());
        return Outcome::Failed;
    }

    const auto destination = resolveDestination(request, probe.content_disposition);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        destination_ = destination;
    }
    const fs::path dest_path(destination);
    if (dest_path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(dest_path.parent_path(), ec);
    }

    std::error_code ec;
    if (!request.overwrite && probe.content_length.has_value() && fs::is_regular_file(dest_path, ec) &&
        !fs::exists(manifestPath(destination), ec) &&
        static_cast<uint64_t>(fs::file_size(dest_path, ec)) == *probe.content_length && !ec) {
        spdlog::info("DownloadCoordinator: '{}' already complete ({} bytes), skipping", destination,
                     *probe.content_length);
        if (on_progress) on_progress(*probe.content_length, *probe.content_length);
        return Outcome::Completed;
    }

    const bool segmented = request.multisegment && probe.accept_ranges && probe.content_length.has_value() &&
                           *probe.content_length > 0;
    segmented_.store(segmented);
    if (segmented) {
        return runSegmented(request, destination, *probe.content_length, probe.etag, on_progress);
    }
    spdlog::info("DownloadCoordinator: range requests unavailable for url='{}', using a single stream",
                 request.url);
    return runSingleStream(request, destination, probe.content_length.value_or(0), on_progress);
}

Outcome DownloadCoordinator::runSegmented(const DownloadRequest& request,
                                          const std::string& destination,
                                          uint64_t size,
                                          const std::optional<std::string>& etag,
                                          const ProgressCallback& on_progress) {
    SegmentPlanner planner;
    const SegmentTable table = planner.plan(request.url, destination, request.segments, size, etag);
    spdlog::info("DownloadCoordinator: downloading {} bytes in {} segments to '{}'", size, table.segment_count,
                 destination);

    auto session = beginSession();
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers_.clear();
        for (const auto& spec : table.segments) {
            workers_.push_back(std::make_unique<SegmentWorker>(spec, table.url, transport_, *session,
                                                               request.options, request.chunk_size));
        }
    }
    runWorkers(*session, size, request.progress_interval, on_progress);

    if (session->failed()) {
        setError(firstWorkerError());
        spdlog::error("DownloadCoordinator: download failed: {}", lastError());
        return Outcome::Failed;
    }
    if (session->stopRequested()) {
        spdlog::info("DownloadCoordinator: download cancelled, {} bytes kept for resume", downloadedBytes());
        return Outcome::Cancelled;
    }

    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (const auto& worker : workers_) {
            if (!worker->completed()) {
                const auto* segment = static_cast<const SegmentWorker*>(worker.get());
                std::string message = "segment " + std::to_string(segment->id()) + " incomplete: " +
                                      std::to_string(segment->bytesTransferred()) + " of " +
                                      std::to_string(segment->spec().segment_size) + " bytes";
                spdlog::error("DownloadCoordinator: {}", message);
                std::lock_guard<std::mutex> state_lock(state_mutex_);
                last_error_ = std::move(message);
                return Outcome::Failed;
            }
        }
    }

    merge(destination, table.segment_count, request.chunk_size);
    spdlog::info("DownloadCoordinator: completed '{}'", destination);
    return Outcome::Completed;
}

Outcome DownloadCoordinator::runSingleStream(const DownloadRequest& request,
                                             const std::string& destination,
                                             uint64_t total,
                                             const ProgressCallback& on_progress) {
    auto session = beginSession();
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers_.clear();
        workers_.push_back(std::make_unique<SingleStreamWorker>(request.url, destination, transport_, *session,
                                                                request.options, request.chunk_size));
    }
    runWorkers(*session, total, request.progress_interval, on_progress);

    if (session->failed()) {
        setError(firstWorkerError());
        spdlog::error("DownloadCoordinator: download failed: {}", lastError());
        return Outcome::Failed;
    }
    if (session->stopRequested()) {
        spdlog::info("DownloadCoordinator: download cancelled");
        return Outcome::Cancelled;
    }
    std::lock_guard<std::mutex> lock(workers_mutex_);
    if (!workers_.front()->completed()) {
        std::lock_guard<std::mutex> state_lock(state_mutex_);
        last_error_ = "stream ended without completing";
        return Outcome::Failed;
    }
    spdlog::info("DownloadCoordinator: completed '{}'", destination);
    return Outcome::Completed;
}

void DownloadCoordinator::runWorkers(DownloadSession& session,
                                     uint64_t total,
                                     std::chrono::milliseconds interval,
                                     const ProgressCallback& on_progress) {
    std::mutex done_mutex;
    std::condition_variable done_cv;
    size_t done = 0;

    std::vector<DownloadWorker*> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (const auto& worker : workers_) workers.push_back(worker.get());
    }

    std::vector<std::thread> threads;
    threads.reserve(workers.size());
    for (auto* worker : workers) {
        threads.emplace_back([&, worker]() {
            try {
                worker->run();
            } catch (const std::exception& e) {
                spdlog::error("DownloadCoordinator: worker {} aborted: {}", worker->id(), e.what());
                session.fail();
            }
            std::lock_guard<std::mutex> lock(done_mutex);
            ++done;
            done_cv.notify_one();
        });
    }

    if (interval.count() <= 0) interval = std::chrono::milliseconds(500);
    {
        std::unique_lock<std::mutex> lock(done_mutex);
        while (done < workers.size()) {
            done_cv.wait_for(lock, interval);
            if (on_progress) {
                lock.unlock();
                on_progress(downloadedBytes(), total);
                lock.lock();
            }
        }
    }
    for (auto& th : threads) {
        if (th.joinable()) th.join();
    }
    if (on_progress) on_progress(downloadedBytes(), total);
}

}  // namespace segdl
