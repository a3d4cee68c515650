#include "download/segment_worker.h"

#include <filesystem>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace segdl {

SegmentWorker::SegmentWorker(SegmentSpec spec,
                             std::string url,
                             Transport& transport,
                             DownloadSession& session,
                             RequestOptions options,
                             size_t chunk_size)
    : DownloadWorker(spec.index, transport, session, std::move(options), chunk_size),
      spec_(std::move(spec)),
      url_(std::move(url)) {}

void SegmentWorker::run() {
    uint64_t curr = 0;
    std::error_code ec;
    if (fs::exists(spec_.path, ec)) {
        const auto on_disk = static_cast<uint64_t>(fs::file_size(spec_.path, ec));
        if (ec) {
            reportFailure("cannot stat '" + spec_.path + "': " + ec.message());
            return;
        }
        if (on_disk > spec_.segment_size) {
            spdlog::info("SegmentWorker[{}]: '{}' holds {} bytes, expected at most {}; restarting segment",
                         id(), spec_.path, on_disk, spec_.segment_size);
            fs::remove(spec_.path, ec);
            if (ec) {
                reportFailure("cannot remove stale '" + spec_.path + "': " + ec.message());
                return;
            }
        } else {
            curr = on_disk;
        }
    }
    state_.bytes_transferred.store(curr);

    if (curr < spec_.segment_size && !session_.interrupted()) {
        if (curr > 0) {
            spdlog::debug("SegmentWorker[{}]: resuming at byte {} of {}", id(), curr, spec_.segment_size);
        }
        stream(url_, spec_.path, std::ios::app, {{"Range", spec_.rangeHeader(curr)}});
    }

    const uint64_t done = bytesTransferred();
    state_.completed.store(done == spec_.segment_size);
    if (done > spec_.segment_size) {
        spdlog::warn("SegmentWorker[{}]: received {} bytes for a {} byte range; server ignored Range?",
                     id(), done, spec_.segment_size);
    }
}

}  // namespace segdl
