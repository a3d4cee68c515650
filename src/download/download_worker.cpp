#include "download/download_worker.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <spdlog/spdlog.h>
#include <vector>

namespace segdl {

DownloadWorker::DownloadWorker(size_t worker_id,
                               Transport& transport,
                               DownloadSession& session,
                               RequestOptions options,
                               size_t chunk_size)
    : transport_(transport),
      session_(session),
      options_(std::move(options)),
      chunk_size_(chunk_size == 0 ? kDefaultChunkSize : chunk_size) {
    state_.worker_id = worker_id;
}

std::string DownloadWorker::lastError() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
}

void DownloadWorker::reportFailure(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        last_error_ = message;
    }
    session_.fail();
    spdlog::error("{}[{}]: {}", name(), id(), message);
}

DownloadWorker::StreamStatus DownloadWorker::stream(const std::string& url,
                                                    const std::string& path,
                                                    std::ios::openmode mode,
                                                    const std::map<std::string, std::string>& extra_headers) {
    std::ofstream ofs(path, std::ios::binary | mode);
    if (!ofs.is_open()) {
        reportFailure("failed to open '" + path + "' for write: " + std::strerror(errno));
        return StreamStatus::Failed;
    }

    std::vector<char> chunk;
    chunk.reserve(chunk_size_);
    std::string write_error;
    std::string status_error;
    bool interrupted = false;

    auto flush_chunk = [&]() -> bool {
        if (chunk.empty()) return true;
        ofs.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        ofs.flush();
        if (!ofs.good()) {
            write_error = "failed to write " + std::to_string(chunk.size()) + " bytes to '" + path + "'";
            return false;
        }
        state_.bytes_transferred.fetch_add(chunk.size());
        chunk.clear();
        return true;
    };

    const auto result = transport_.get(
        url,
        extra_headers,
        options_,
        [&](const ResponseHead& head) {
            if (head.status < 200 || head.status >= 300) {
                status_error = "HTTP status " + std::to_string(head.status);
                return false;
            }
            return true;
        },
        [&](const char* data, size_t length) {
            while (length > 0) {
                const size_t take = std::min(length, chunk_size_ - chunk.size());
                chunk.insert(chunk.end(), data, data + take);
                data += take;
                length -= take;
                if (chunk.size() == chunk_size_ && !flush_chunk()) {
                    return false;
                }
            }
            if (session_.interrupted()) {
                interrupted = true;
                return false;
            }
            return true;
        });

    // Bytes already received are valid and worth keeping for a later resume.
    if (write_error.empty()) {
        flush_chunk();
    }

    if (!write_error.empty()) {
        reportFailure(write_error);
        return StreamStatus::Failed;
    }
    if (!status_error.empty()) {
        reportFailure(status_error + " for " + url);
        return StreamStatus::Failed;
    }
    if (interrupted) {
        spdlog::debug("{}[{}]: interrupted after {} bytes", name(), id(), bytesTransferred());
        return StreamStatus::Interrupted;
    }
    if (!result.ok) {
        reportFailure("transfer failed: " + (result.error.empty() ? std::string("unknown error") : result.error));
        return StreamStatus::Failed;
    }
    return StreamStatus::Finished;
}

}  // namespace segdl
